#pragma once

#include "diagnostic.hpp"
#include "parse_options.hpp"
#include "request.hpp"
#include "result.hpp"

#include <string_view>
#include <vector>

namespace apidoc {

// "required", "optional" or "conditional", case-insensitive.
result<presence> parse_presence(std::string_view category, parse_diagnostic* diag = nullptr);

// One declaration line:
//   `studentId [number]` - the student's id     (required / optional)
//   Either `a` or `b` must be supplied            (conditional, prose only)
result<parameter> parse_param_line(std::string_view line,
                                   presence category,
                                   const parse_options& opts = {},
                                   parse_diagnostic* diag = nullptr);

result<parameter> parse_param_line(std::string_view line,
                                   std::string_view category,
                                   const parse_options& opts = {},
                                   parse_diagnostic* diag = nullptr);

// Body of a "Params" section: blank-line separated blocks, each optionally
// opened by a **Required:** / **Optional:** / **Conditional:** marker.
result<std::vector<parameter>> parse_params(std::string_view body,
                                            const parse_options& opts = {},
                                            parse_diagnostic* diag = nullptr);

} // namespace apidoc
