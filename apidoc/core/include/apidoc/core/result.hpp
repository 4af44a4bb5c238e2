#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace apidoc {

template <typename T> using result = std::expected<T, std::error_code>;

enum class error_code : int {
    ok = 0,

    // document structure
    missing_title_delimiter = 1,
    malformed_title = 2,
    missing_documentation = 3,
    malformed_section_header = 4,
    unknown_section_header = 5,
    duplicate_section = 6,
    unknown_version = 7,
    unsupported_version = 8,
    missing_version = 9,
    missing_permissions = 10,

    // parameter declarations
    malformed_parameter_line = 20,
    unknown_presence = 21,
    missing_presence_context = 22,
    unknown_type = 23,

    // response samples
    no_code_block_found = 40,
    unterminated_code_block = 41,
    empty_code_block = 42,
    unsupported_root_shape = 43,
    heterogeneous_array = 44,
    invalid_json = 45,

    // schema unification
    conflicting_field_type = 60,
};

class error_category : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "apidoc"; }

    [[nodiscard]] std::string message(int ev) const override {
        using ec = error_code;
        switch (static_cast<ec>(ev)) {
        case ec::ok:
            return "success";
        case ec::missing_title_delimiter:
            return "title delimiter '----' not found";
        case ec::malformed_title:
            return "title cannot be split into action and resource";
        case ec::missing_documentation:
            return "request has no documentation text";
        case ec::malformed_section_header:
            return "section header is not terminated by ':**'";
        case ec::unknown_section_header:
            return "unknown section header";
        case ec::duplicate_section:
            return "section appears more than once";
        case ec::unknown_version:
            return "unknown api version";
        case ec::unsupported_version:
            return "unsupported api version";
        case ec::missing_version:
            return "request has no version section";
        case ec::missing_permissions:
            return "request has no permission section";
        case ec::malformed_parameter_line:
            return "malformed parameter line";
        case ec::unknown_presence:
            return "unknown parameter presence category";
        case ec::missing_presence_context:
            return "parameter line before any presence category";
        case ec::unknown_type:
            return "unknown parameter type";
        case ec::no_code_block_found:
            return "no javascript/json code block found";
        case ec::unterminated_code_block:
            return "code block is not terminated";
        case ec::empty_code_block:
            return "code block is empty";
        case ec::unsupported_root_shape:
            return "sample root must be an object or an array of objects";
        case ec::heterogeneous_array:
            return "array elements have mixed types";
        case ec::invalid_json:
            return "sample is not valid json";
        case ec::conflicting_field_type:
            return "samples disagree on a field's kind";
        default:
            return "unknown error";
        }
    }
};

inline const error_category& get_error_category() {
    static error_category const instance;
    return instance;
}

inline std::error_code make_error_code(error_code e) {
    return {static_cast<int>(e), get_error_category()};
}

} // namespace apidoc

namespace std {
template <> struct is_error_code_enum<apidoc::error_code> : true_type {};
} // namespace std
