#pragma once

#include "diagnostic.hpp"
#include "parse_options.hpp"
#include "result.hpp"
#include "schema.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace apidoc {

// A fenced ```javascript / ```json block inside a section body.
struct code_block {
    std::string_view content; // text between the opening line and the closing fence
    size_t end = 0;           // offset just past the closing fence
};

// Finds the earliest javascript/json fence at or after `from`. Returns nullopt
// when no opening fence remains; an opening fence without a closing one is
// unterminated_code_block.
result<std::optional<code_block>> next_code_block(std::string_view text,
                                                  size_t from = 0,
                                                  parse_diagnostic* diag = nullptr);

// Vendor-specific fixes applied to error samples before decoding:
//  - the sentinel key __invalid is written unquoted (`__invalid: "msg"`) or
//    half-quoted (`"__invalid: "msg"`); in key position (after '{', ',' or at
//    the start) it becomes "__invalid":, string values are copied untouched
//  - single-field bodies miss their braces; text not starting with '{' is
//    wrapped in { }.
std::string repair_error_sample(std::string_view text);

// Schema of the first code block of a "Success Response" section.
result<response> parse_success_response(std::string_view section,
                                        const parse_options& opts = {},
                                        parse_diagnostic* diag = nullptr);

// Union of the schemas of every code block of an "Error Response" section.
result<response> parse_error_response(std::string_view section,
                                      const parse_options& opts = {},
                                      parse_diagnostic* diag = nullptr);

} // namespace apidoc
