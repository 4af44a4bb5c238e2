#pragma once

#include "request.hpp"
#include "schema.hpp"

#include <string>

namespace apidoc {

// Compact JSON renderings with keys in declaration order, e.g.
// {"action":"get","resource":"Student",...,"permissions":null,...}
std::string to_json(const parameter& p);
std::string to_json(const response& r);
std::string to_json(const request& req);

} // namespace apidoc
