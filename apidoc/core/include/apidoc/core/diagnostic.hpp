#pragma once

#include "result.hpp"

#include <string>
#include <string_view>

namespace apidoc {

// Location of the first failure while parsing one document. Filled by the
// parser that detects the fault; enclosing parsers only add what is still
// missing (scope, section), so the innermost detail survives.
struct parse_diagnostic {
    std::string scope;
    std::string section;
    std::string detail;
};

inline void set_detail(parse_diagnostic* diag, std::string_view detail) {
    if (diag && diag->detail.empty()) {
        diag->detail.assign(detail.begin(), detail.end());
    }
}

inline void set_section(parse_diagnostic* diag, std::string_view section) {
    if (diag && diag->section.empty()) {
        diag->section.assign(section.begin(), section.end());
    }
}

inline std::unexpected<std::error_code>
fail(error_code code, parse_diagnostic* diag, std::string_view detail = {}) {
    if (!detail.empty()) {
        set_detail(diag, detail);
    }
    return std::unexpected(make_error_code(code));
}

inline std::string format_diagnostic(const std::error_code& ec, const parse_diagnostic& diag) {
    std::string out;
    if (!diag.scope.empty()) {
        out += diag.scope;
        out += ": ";
    }
    if (!diag.section.empty()) {
        out += "[";
        out += diag.section;
        out += "] ";
    }
    out += ec.message();
    if (!diag.detail.empty()) {
        out += ": ";
        out += diag.detail;
    }
    return out;
}

} // namespace apidoc
