#pragma once

#include "schema.hpp"
#include "type_tag.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apidoc {

enum class presence : uint8_t { required, optional, conditional };

std::string_view presence_name(presence p) noexcept;

// One declared request parameter. Conditional parameters are prose only:
// `name` is empty and `type` is unset.
struct parameter {
    std::string name;
    std::optional<type_tag> type;
    std::string doc;
    presence kind = presence::required;

    bool operator==(const parameter&) const = default;
};

// Everything one documentation page says about a single API call.
struct request {
    std::string action;   // "get" in getStudentDetails
    std::string resource; // "StudentDetails"
    std::string doc;
    std::string scope;
    int version = 0;
    std::optional<std::string> permissions; // absent in version 2 pages
    std::vector<parameter> params;
    std::string sample_params;
    response success_response;
    response error_response;
};

} // namespace apidoc
