#include "apidoc/core/type_tag.hpp"

#include "apidoc/core/serde.hpp"

#include <array>
#include <string>
#include <utility>

namespace apidoc {

namespace {

constexpr auto kTypeTokens = std::to_array<std::pair<std::string_view, type_tag>>({
    {"boolean", type_tag::boolean},
    {"date", type_tag::date},
    {"date dd/mm/yyyy", type_tag::date},
    {"timestamp yyyy-MM-dd HH:mm:ss.SSS", type_tag::datetime},
    {"decimal", type_tag::floating},
    {"number", type_tag::integer},
    {"num", type_tag::integer},
    {"integer", type_tag::integer},
    {"array", type_tag::list},
    {"string", type_tag::string},
    {"time", type_tag::time},
    {"integer or \"all\"", type_tag::any},
});

} // namespace

std::string_view type_tag_name(type_tag tag) noexcept {
    switch (tag) {
    case type_tag::any:
        return "any";
    case type_tag::boolean:
        return "bool";
    case type_tag::date:
        return "date";
    case type_tag::datetime:
        return "datetime";
    case type_tag::floating:
        return "float";
    case type_tag::integer:
        return "int";
    case type_tag::list:
        return "list";
    case type_tag::string:
        return "str";
    case type_tag::time:
        return "time";
    }
    return "unknown";
}

result<type_tag> parse_type_tag(std::string_view token, parse_diagnostic* diag) {
    auto trimmed = serde::trim_view(token);
    for (const auto& [text, tag] : kTypeTokens) {
        if (trimmed == text) {
            return tag;
        }
    }
    return fail(error_code::unknown_type, diag, "'" + std::string(trimmed) + "'");
}

} // namespace apidoc
