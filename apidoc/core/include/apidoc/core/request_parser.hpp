#pragma once

#include "diagnostic.hpp"
#include "parse_options.hpp"
#include "request.hpp"
#include "result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace apidoc {

// Every "* **<Header>:**" the dialect knows about.
enum class section_kind : uint8_t {
    version_history,
    method,
    version,
    permission,
    params,
    success_response,
    error_response,
    sample_parameters,
    sample_get,
    sample_post,
};

// Header text as written ("Success Response"); case and surrounding
// whitespace are ignored. nullopt for headers outside the dialect.
std::optional<section_kind> classify_section(std::string_view header);

struct request_title {
    std::string action;
    std::string resource;
};

// "getStudentDetails" -> {"get", "StudentDetails"}; '*' emphasis and surrounding
// whitespace are ignored, inner whitespace stays in the resource.
result<request_title> parse_title(std::string_view title, parse_diagnostic* diag = nullptr);

// Body of a "Version" section: 3, or 2 when opts.accept_v2.
result<int> parse_version(std::string_view text,
                          const parse_options& opts = {},
                          parse_diagnostic* diag = nullptr);

// Parses one documentation page. `scope` is copied into the request as is.
// No partial request is returned: any failure aborts the whole page.
result<request> parse_request(std::string_view text,
                              std::string_view scope,
                              const parse_options& opts = {},
                              parse_diagnostic* diag = nullptr);

} // namespace apidoc
