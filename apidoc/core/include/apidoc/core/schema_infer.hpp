#pragma once

#include "diagnostic.hpp"
#include "json_value.hpp"
#include "parse_options.hpp"
#include "result.hpp"
#include "schema.hpp"

#include <string_view>

namespace apidoc {

// Schema of one decoded sample. The root must be an object or an array of
// objects (unsupported_root_shape otherwise); the schemas of array elements
// are folded together with unify().
result<response> infer_schema(const json::value& root,
                              const parse_options& opts = {},
                              parse_diagnostic* diag = nullptr);

// Decodes `json_text` and infers its schema. Decoder failures are reported as
// error_code::invalid_json with the offset in the diagnostic.
result<response> infer_schema_from_text(std::string_view json_text,
                                        const parse_options& opts = {},
                                        parse_diagnostic* diag = nullptr);

} // namespace apidoc
