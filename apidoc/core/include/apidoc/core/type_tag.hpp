#pragma once

#include "diagnostic.hpp"
#include "result.hpp"

#include <cstdint>
#include <string_view>

namespace apidoc {

enum class type_tag : uint8_t { any, boolean, date, datetime, floating, integer, list, string, time };

// Canonical short name: any, bool, date, datetime, float, int, list, str, time.
std::string_view type_tag_name(type_tag tag) noexcept;

// `token` is the text between the square brackets of a parameter type.
result<type_tag> parse_type_tag(std::string_view token, parse_diagnostic* diag = nullptr);

} // namespace apidoc
