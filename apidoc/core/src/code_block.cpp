#include "apidoc/core/code_block.hpp"

#include "apidoc/core/schema_infer.hpp"
#include "apidoc/core/serde.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace apidoc {

namespace {

using serde::trim_view;

constexpr std::string_view kFence = "```";
constexpr std::array<std::string_view, 2> kSampleTags = {"javascript", "json"};
constexpr std::string_view kSentinelKey = "__invalid";

// Offset of the first content character when `fence_at` opens a sample block,
// i.e. the fence is followed by a sample tag and then the end of the line.
std::optional<size_t> sample_content_start(std::string_view text, size_t fence_at) {
    size_t after_fence = fence_at + kFence.size();
    for (auto tag : kSampleTags) {
        if (text.substr(after_fence, tag.size()) != tag) {
            continue;
        }
        size_t p = after_fence + tag.size();
        while (p < text.size() && (text[p] == ' ' || text[p] == '\t' || text[p] == '\r')) {
            ++p;
        }
        if (p < text.size() && text[p] == '\n') {
            return p + 1;
        }
    }
    return std::nullopt;
}

// Length of the sentinel key at `at` up to and including its colon, written bare
// (`__invalid:`), half-quoted (`"__invalid:`) or quoted (`"__invalid" :`); 0 otherwise.
size_t sentinel_key_length(std::string_view text, size_t at) {
    size_t p = at;
    if (text[p] == '\"') {
        ++p;
    }
    if (text.substr(p, kSentinelKey.size()) != kSentinelKey) {
        return 0;
    }
    p += kSentinelKey.size();
    if (p < text.size() && text[p] == '\"') {
        ++p;
    }
    while (p < text.size() && (text[p] == ' ' || text[p] == '\t')) {
        ++p;
    }
    if (p < text.size() && text[p] == ':') {
        return p + 1 - at;
    }
    return 0;
}

std::string at_offset(std::string_view what, size_t offset) {
    return std::string(what) + " at offset " + std::to_string(offset);
}

} // namespace

result<std::optional<code_block>>
next_code_block(std::string_view text, size_t from, parse_diagnostic* diag) {
    size_t search = from;
    while (search < text.size()) {
        size_t fence_at = text.find(kFence, search);
        if (fence_at == std::string_view::npos) {
            break;
        }
        auto content_start = sample_content_start(text, fence_at);
        if (!content_start) {
            search = fence_at + kFence.size();
            continue;
        }
        size_t close_at = text.find(kFence, *content_start);
        if (close_at == std::string_view::npos) {
            return fail(error_code::unterminated_code_block,
                        diag,
                        at_offset("block opened", fence_at));
        }
        return code_block{text.substr(*content_start, close_at - *content_start),
                          close_at + kFence.size()};
    }
    return std::optional<code_block>{};
}

std::string repair_error_sample(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 8);

    char last = '\0'; // last non-space character outside string literals
    size_t pos = 0;
    while (pos < text.size()) {
        char c = text[pos];
        bool key_position = last == '\0' || last == '{' || last == ',';
        if (key_position && (c == '\"' || c == '_')) {
            if (size_t len = sentinel_key_length(text, pos)) {
                out.append("\"__invalid\":");
                pos += len;
                last = ':';
                continue;
            }
        }
        if (c == '\"') {
            size_t close = pos + 1;
            while (close < text.size() && text[close] != '\"') {
                close += text[close] == '\\' ? 2 : 1;
            }
            close = std::min(close + 1, text.size());
            out.append(text.substr(pos, close - pos));
            pos = close;
            last = '\"';
            continue;
        }
        out.push_back(c);
        if (!serde::is_space(c)) {
            last = c;
        }
        ++pos;
    }

    if (trim_view(out).starts_with('{')) {
        return out;
    }
    return "{" + out + "}";
}

result<response> parse_success_response(std::string_view section,
                                        const parse_options& opts,
                                        parse_diagnostic* diag) {
    auto block = next_code_block(section, 0, diag);
    if (!block) {
        return std::unexpected(block.error());
    }
    if (!*block) {
        return fail(error_code::no_code_block_found, diag, "expected ```javascript or ```json");
    }
    return infer_schema_from_text((*block)->content, opts, diag);
}

result<response> parse_error_response(std::string_view section,
                                      const parse_options& opts,
                                      parse_diagnostic* diag) {
    response cumulative;
    size_t pos = 0;
    while (true) {
        auto block = next_code_block(section, pos, diag);
        if (!block) {
            return std::unexpected(block.error());
        }
        if (!*block) {
            break;
        }
        pos = (*block)->end;

        auto text = trim_view((*block)->content);
        if (text.size() < 2) {
            return fail(error_code::empty_code_block,
                        diag,
                        at_offset("block ending", pos));
        }

        auto sample = infer_schema_from_text(repair_error_sample(text), opts, diag);
        if (!sample) {
            return sample;
        }
        auto merged = unify(cumulative, *sample, diag);
        if (!merged) {
            return merged;
        }
        cumulative = std::move(*merged);
    }
    return cumulative;
}

} // namespace apidoc
