#pragma once

namespace apidoc {

// Policies where the vendor's documentation is inconsistent between
// revisions. Defaults are the tolerant choice.
struct parse_options {
    // `name [type]` without the "` - " separator yields an empty doc instead of
    // malformed_parameter_line.
    bool allow_missing_param_description = true;

    // Accept "2" in the version section (older docs, permissions optional).
    bool accept_v2 = true;

    // Version 3 documents must carry a permission section.
    bool require_v3_permissions = true;

    // Skip null elements when classifying array samples.
    bool ignore_null_array_elements = false;
};

} // namespace apidoc
