#include "apidoc/core/request_parser.hpp"

#include "apidoc/core/code_block.hpp"
#include "apidoc/core/param_parser.hpp"
#include "apidoc/core/serde.hpp"

#include <algorithm>
#include <array>
#include <bitset>
#include <cctype>
#include <utility>
#include <vector>

namespace apidoc {

namespace {

using serde::trim_view;

constexpr std::string_view kTitleDelimiter = "----";
constexpr std::string_view kHeaderTerminator = ":**";
constexpr std::string_view kUnlistedHeaderMarker = "**:";
constexpr size_t kSectionKinds = 10;

constexpr auto kSectionNames = std::to_array<std::pair<std::string_view, section_kind>>({
    {"version history", section_kind::version_history},
    {"method", section_kind::method},
    {"version", section_kind::version},
    {"permission", section_kind::permission},
    {"params", section_kind::params},
    {"parameters", section_kind::params},
    {"success response", section_kind::success_response},
    {"error response", section_kind::error_response},
    {"sample parameters", section_kind::sample_parameters},
    {"sample get", section_kind::sample_get},
    {"sample post", section_kind::sample_post},
});

struct raw_section {
    std::string_view text; // starts right after the "* **" marker
};

struct split_body {
    std::string_view preamble;
    std::vector<raw_section> sections;
};

// Offset just past "* **" when the line starting at `line_start` is a header
// line, i.e. optional indentation, '*', at least one space, then "**".
std::optional<size_t> header_marker_end(std::string_view text, size_t line_start) {
    size_t p = line_start;
    while (p < text.size() && (text[p] == ' ' || text[p] == '\t')) {
        ++p;
    }
    if (p >= text.size() || text[p] != '*') {
        return std::nullopt;
    }
    size_t q = p + 1;
    while (q < text.size() && text[q] == ' ') {
        ++q;
    }
    if (q == p + 1 || text.substr(q, 2) != "**") {
        return std::nullopt;
    }
    return q + 2;
}

split_body split_sections(std::string_view body) {
    struct marker {
        size_t line_start;
        size_t content_start;
    };
    std::vector<marker> markers;

    size_t line_start = 0;
    while (line_start <= body.size()) {
        if (auto end = header_marker_end(body, line_start)) {
            markers.push_back({line_start, *end});
        }
        size_t nl = body.find('\n', line_start);
        if (nl == std::string_view::npos) {
            break;
        }
        line_start = nl + 1;
    }

    split_body out;
    out.preamble = markers.empty() ? body : body.substr(0, markers.front().line_start);
    for (size_t i = 0; i < markers.size(); ++i) {
        size_t stop = (i + 1 < markers.size()) ? markers[i + 1].line_start : body.size();
        size_t from = markers[i].content_start;
        out.sections.push_back({body.substr(from, stop - from)});
    }
    return out;
}

std::string strip_emphasis(std::string_view text) {
    std::string out;
    for (char c : text) {
        if (c != '*') {
            out.push_back(c);
        }
    }
    return std::string(trim_view(out));
}

template <typename T>
std::unexpected<std::error_code> in_section(const result<T>& failed,
                                            std::string_view header,
                                            parse_diagnostic* diag) {
    set_section(diag, header);
    return std::unexpected(failed.error());
}

} // namespace

std::optional<section_kind> classify_section(std::string_view header) {
    auto name = serde::to_lower(trim_view(header));
    for (const auto& [text, kind] : kSectionNames) {
        if (name == text) {
            return kind;
        }
    }
    return std::nullopt;
}

result<request_title> parse_title(std::string_view title, parse_diagnostic* diag) {
    auto name = strip_emphasis(title);
    auto malformed = [&]() {
        set_section(diag, "title");
        return fail(error_code::malformed_title, diag, "'" + name + "'");
    };

    auto upper = std::find_if(name.begin() + (name.empty() ? 0 : 1), name.end(), [](char c) {
        return std::isupper(static_cast<unsigned char>(c)) != 0;
    });
    if (name.empty() || upper == name.end()) {
        return malformed();
    }

    request_title out;
    out.action.assign(name.begin(), upper);
    out.resource.assign(upper, name.end());
    return out;
}

result<int>
parse_version(std::string_view text, const parse_options& opts, parse_diagnostic* diag) {
    auto v = trim_view(text);
    if (v == "3") {
        return 3;
    }
    if (v == "2") {
        if (opts.accept_v2) {
            return 2;
        }
        return fail(error_code::unsupported_version, diag, "version 2 is disabled");
    }
    if (v == "1") {
        return fail(error_code::unsupported_version, diag, "version 1 apis are not supported");
    }
    return fail(error_code::unknown_version, diag, "'" + std::string(v) + "'");
}

result<request> parse_request(std::string_view text,
                              std::string_view scope,
                              const parse_options& opts,
                              parse_diagnostic* diag) {
    if (diag && diag->scope.empty()) {
        diag->scope.assign(scope.begin(), scope.end());
    }

    auto title_split = serde::split_once(text, kTitleDelimiter);
    if (!title_split) {
        return fail(error_code::missing_title_delimiter, diag);
    }
    auto [title_text, body] = *title_split;
    // Longer setext underlines ("-------") belong to the delimiter.
    while (!body.empty() && body.front() == '-') {
        body.remove_prefix(1);
    }

    auto title = parse_title(title_text, diag);
    if (!title) {
        return std::unexpected(title.error());
    }

    request req;
    req.action = std::move(title->action);
    req.resource = std::move(title->resource);
    req.scope = std::string(scope);

    auto split = split_sections(body);
    auto doc = trim_view(split.preamble);
    if (doc.find(kUnlistedHeaderMarker) != std::string_view::npos) {
        set_section(diag, "documentation");
        return fail(error_code::missing_documentation, diag, "header marker found in description");
    }
    req.doc = std::string(doc);

    std::optional<int> version;
    std::bitset<kSectionKinds> seen;

    for (const auto& section : split.sections) {
        auto parts = serde::split_once(section.text, kHeaderTerminator);
        if (!parts) {
            auto first_line = section.text.substr(0, section.text.find('\n'));
            return fail(error_code::malformed_section_header,
                        diag,
                        "'" + std::string(trim_view(first_line)) + "'");
        }
        auto header = trim_view(parts->first);
        auto content = trim_view(parts->second);

        auto kind = classify_section(header);
        if (!kind) {
            return fail(error_code::unknown_section_header, diag, "'" + std::string(header) + "'");
        }

        auto index = static_cast<size_t>(*kind);
        switch (*kind) {
        case section_kind::version_history:
        case section_kind::method:
        case section_kind::sample_get:
        case section_kind::sample_post:
            continue;
        case section_kind::version:
        case section_kind::permission:
        case section_kind::params:
        case section_kind::success_response:
        case section_kind::error_response:
        case section_kind::sample_parameters:
            if (seen.test(index)) {
                set_section(diag, header);
                return fail(error_code::duplicate_section, diag, "'" + std::string(header) + "'");
            }
            seen.set(index);
            break;
        }

        switch (*kind) {
        case section_kind::version: {
            auto v = parse_version(content, opts, diag);
            if (!v) {
                return in_section(v, header, diag);
            }
            version = *v;
            break;
        }
        case section_kind::permission:
            req.permissions = std::string(content);
            break;
        case section_kind::params: {
            auto params = parse_params(content, opts, diag);
            if (!params) {
                return in_section(params, header, diag);
            }
            req.params = std::move(*params);
            break;
        }
        case section_kind::success_response: {
            auto schema = parse_success_response(content, opts, diag);
            if (!schema) {
                return in_section(schema, header, diag);
            }
            req.success_response = std::move(*schema);
            break;
        }
        case section_kind::error_response: {
            auto schema = parse_error_response(content, opts, diag);
            if (!schema) {
                return in_section(schema, header, diag);
            }
            req.error_response = std::move(*schema);
            break;
        }
        case section_kind::sample_parameters:
            req.sample_params = std::string(content);
            break;
        case section_kind::version_history:
        case section_kind::method:
        case section_kind::sample_get:
        case section_kind::sample_post:
            break;
        }
    }

    if (!version) {
        return fail(error_code::missing_version, diag);
    }
    req.version = *version;

    if (req.version == 3 && !req.permissions && opts.require_v3_permissions) {
        return fail(error_code::missing_permissions, diag);
    }

    return req;
}

} // namespace apidoc
