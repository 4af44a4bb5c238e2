#include "apidoc/core/param_parser.hpp"

#include "apidoc/core/serde.hpp"
#include "apidoc/core/type_tag.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

namespace apidoc {

namespace {

using serde::is_space;
using serde::trim_view;

constexpr std::string_view kDescriptionSeparator = "` - ";

std::string quoted(std::string_view text) {
    std::string out = "'";
    out.append(text);
    out.push_back('\'');
    return out;
}

bool is_category_marker(std::string_view line) noexcept {
    return line.starts_with("**");
}

std::string marker_category(std::string_view line) {
    std::string out;
    for (char c : line) {
        if (c != '*' && c != ':') {
            out.push_back(c);
        }
    }
    return serde::to_lower(trim_view(out));
}

// Whole declaration inside one pair of backticks; `definition` is the text
// after the opening backtick.
std::optional<std::pair<std::string_view, std::string_view>>
fully_quoted_split(std::string_view definition) {
    if (!definition.ends_with('`') || definition.find('`') != definition.size() - 1) {
        return std::nullopt;
    }
    return serde::split_once(definition.substr(0, definition.size() - 1), " - ");
}

// A pending declaration: its first line plus any wrapped continuation lines.
struct pending_entry {
    presence kind = presence::required;
    std::string text;
    bool active = false;
};

} // namespace

std::string_view presence_name(presence p) noexcept {
    switch (p) {
    case presence::required:
        return "required";
    case presence::optional:
        return "optional";
    case presence::conditional:
        return "conditional";
    }
    return "unknown";
}

result<presence> parse_presence(std::string_view category, parse_diagnostic* diag) {
    auto trimmed = trim_view(category);
    if (serde::iequals(trimmed, "required")) {
        return presence::required;
    }
    if (serde::iequals(trimmed, "optional")) {
        return presence::optional;
    }
    if (serde::iequals(trimmed, "conditional")) {
        return presence::conditional;
    }
    return fail(error_code::unknown_presence, diag, quoted(trimmed));
}

result<parameter> parse_param_line(std::string_view line,
                                   presence category,
                                   const parse_options& opts,
                                   parse_diagnostic* diag) {
    auto text = trim_view(line);
    if (text.empty()) {
        return fail(error_code::malformed_parameter_line, diag, "empty parameter line");
    }

    parameter param;
    param.kind = category;

    if (category == presence::conditional) {
        param.doc = std::string(text);
        return param;
    }

    if (text.front() != '`') {
        return fail(error_code::malformed_parameter_line,
                    diag,
                    "expected a backtick at the start of " + quoted(text));
    }

    std::string_view definition = text.substr(1);
    if (auto parts = serde::split_once(definition, kDescriptionSeparator)) {
        definition = parts->first;
        param.doc = std::string(trim_view(parts->second));
    } else if (auto quoted_whole = fully_quoted_split(definition)) {
        // `studentId [number] - the student's id`
        definition = quoted_whole->first;
        param.doc = std::string(trim_view(quoted_whole->second));
    } else if (!opts.allow_missing_param_description) {
        return fail(error_code::malformed_parameter_line,
                    diag,
                    "missing \"` - \" description separator in " + quoted(text));
    }

    // `id` [number] and `id [number]` both occur; drop every backtick.
    std::string stripped;
    std::copy_if(definition.begin(), definition.end(), std::back_inserter(stripped), [](char c) {
        return c != '`';
    });
    std::string_view def = trim_view(stripped);

    auto split_at = std::find_if(def.begin(), def.end(), is_space);
    auto name = def.substr(0, static_cast<size_t>(split_at - def.begin()));
    auto type_text = trim_view(def.substr(name.size()));

    if (name.empty()) {
        return fail(
            error_code::malformed_parameter_line, diag, "no parameter name in " + quoted(text));
    }
    param.name = std::string(name);

    if (!type_text.empty()) {
        if (type_text.size() < 2 || type_text.front() != '[' || type_text.back() != ']') {
            return fail(error_code::malformed_parameter_line,
                        diag,
                        "expected type written as [type] in " + quoted(text));
        }
        auto tag = parse_type_tag(type_text.substr(1, type_text.size() - 2), diag);
        if (!tag) {
            set_detail(diag, quoted(text));
            return std::unexpected(tag.error());
        }
        param.type = *tag;
    }

    return param;
}

result<parameter> parse_param_line(std::string_view line,
                                   std::string_view category,
                                   const parse_options& opts,
                                   parse_diagnostic* diag) {
    auto p = parse_presence(category, diag);
    if (!p) {
        return std::unexpected(p.error());
    }
    return parse_param_line(line, *p, opts, diag);
}

result<std::vector<parameter>> parse_params(std::string_view body,
                                            const parse_options& opts,
                                            parse_diagnostic* diag) {
    std::vector<parameter> params;
    std::optional<presence> current;
    pending_entry pending;

    auto flush = [&]() -> result<void> {
        if (!pending.active) {
            return {};
        }
        pending.active = false;
        auto param = parse_param_line(pending.text, pending.kind, opts, diag);
        if (!param) {
            return std::unexpected(param.error());
        }
        params.push_back(std::move(*param));
        return {};
    };

    auto start_entry = [&](std::string_view line) -> result<void> {
        if (auto flushed = flush(); !flushed) {
            return flushed;
        }
        pending.kind = *current;
        pending.text = std::string(line);
        pending.active = true;
        return {};
    };

    for (auto raw : serde::split_lines(body)) {
        auto line = trim_view(raw);

        if (line.empty()) {
            // Blank line ends the block, and with it any wrapped entry.
            if (auto flushed = flush(); !flushed) {
                return std::unexpected(flushed.error());
            }
            continue;
        }

        if (is_category_marker(line)) {
            if (auto flushed = flush(); !flushed) {
                return std::unexpected(flushed.error());
            }
            auto p = parse_presence(marker_category(line), diag);
            if (!p) {
                return std::unexpected(p.error());
            }
            current = *p;
            continue;
        }

        if (serde::iequals(line, "none")) {
            continue;
        }

        if (!current) {
            return fail(error_code::missing_presence_context, diag, quoted(line));
        }

        bool continues = pending.active &&
                         (*current == presence::conditional || line.front() != '`');
        if (continues) {
            pending.text.push_back('\n');
            pending.text.append(line);
            continue;
        }

        if (auto started = start_entry(line); !started) {
            return std::unexpected(started.error());
        }
    }

    if (auto flushed = flush(); !flushed) {
        return std::unexpected(flushed.error());
    }
    return params;
}

} // namespace apidoc
