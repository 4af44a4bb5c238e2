#include "apidoc/core/type_tag.hpp"

#include <gtest/gtest.h>

#include <string_view>
#include <utility>

using namespace apidoc;

TEST(TypeTag, MapsEveryKnownToken) {
    const std::pair<std::string_view, type_tag> cases[] = {
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
    };
    for (const auto& [token, expected] : cases) {
        auto tag = parse_type_tag(token);
        ASSERT_TRUE(tag) << token;
        EXPECT_EQ(*tag, expected) << token;
    }
}

TEST(TypeTag, IgnoresSurroundingWhitespace) {
    auto tag = parse_type_tag("  string ");
    ASSERT_TRUE(tag);
    EXPECT_EQ(*tag, type_tag::string);
}

TEST(TypeTag, UnknownTokenFails) {
    parse_diagnostic diag;
    auto tag = parse_type_tag("blob", &diag);
    ASSERT_FALSE(tag);
    EXPECT_EQ(tag.error(), make_error_code(error_code::unknown_type));
    EXPECT_EQ(diag.detail, "'blob'");
}

TEST(TypeTag, TokensAreCaseSensitive) {
    EXPECT_FALSE(parse_type_tag("String"));
    EXPECT_FALSE(parse_type_tag("timestamp yyyy-mm-dd hh:mm:ss.sss"));
}

TEST(TypeTag, BracketsAreNotPartOfTheToken) {
    EXPECT_FALSE(parse_type_tag("[string]"));
}

TEST(TypeTag, CanonicalNames) {
    EXPECT_EQ(type_tag_name(type_tag::any), "any");
    EXPECT_EQ(type_tag_name(type_tag::boolean), "bool");
    EXPECT_EQ(type_tag_name(type_tag::date), "date");
    EXPECT_EQ(type_tag_name(type_tag::datetime), "datetime");
    EXPECT_EQ(type_tag_name(type_tag::floating), "float");
    EXPECT_EQ(type_tag_name(type_tag::integer), "int");
    EXPECT_EQ(type_tag_name(type_tag::list), "list");
    EXPECT_EQ(type_tag_name(type_tag::string), "str");
    EXPECT_EQ(type_tag_name(type_tag::time), "time");
}
