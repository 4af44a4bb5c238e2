#include "apidoc/core/json_value.hpp"
#include "apidoc/core/request_json.hpp"
#include "apidoc/core/request_parser.hpp"

#include <gtest/gtest.h>

using namespace apidoc;

TEST(RequestJson, Parameter) {
    parameter p{"studentId", type_tag::integer, "the \"student\" id", presence::required};
    EXPECT_EQ(to_json(p),
              R"({"name":"studentId","type":"int","doc":"the \"student\" id","presence":"required"})");

    parameter cond{"", std::nullopt, "either a or b", presence::conditional};
    EXPECT_EQ(to_json(cond),
              R"({"name":"","type":null,"doc":"either a or b","presence":"conditional"})");
}

TEST(RequestJson, NestedResponse) {
    response items;
    items.set(response_field::primitive("code"));
    response r;
    r.set(response_field::primitive("id"));
    r.set(response_field::array("classes", items));
    r.set(response_field::array("tags"));

    EXPECT_EQ(to_json(r),
              R"({"fields":{)"
              R"("id":{"key":"id","kind":"primitive","nested":null},)"
              R"("classes":{"key":"classes","kind":"array","nested":)"
              R"({"fields":{"code":{"key":"code","kind":"primitive","nested":null}}}},)"
              R"("tags":{"key":"tags","kind":"array","nested":null}}})");
}

TEST(RequestJson, EmptyRequest) {
    request req;
    req.action = "get";
    req.resource = "Thing";
    EXPECT_EQ(to_json(req),
              R"({"action":"get","resource":"Thing","doc":"","scope":"","version":0,)"
              R"("permissions":null,"params":[],"sample_params":"",)"
              R"("success_response":{"fields":{}},"error_response":{"fields":{}}})");
}

TEST(RequestJson, ParsedPageIsValidJson) {
    const char* page = "getStudent\n----\nLine one\n\"quoted\"\n"
                       "* **Version:** 3\n"
                       "* **Permission:** Students\n"
                       "* **Params:**\n\n  **Required:**\n\n  `id [number]` - id\n";
    auto req = parse_request(page, "students");
    ASSERT_TRUE(req);

    auto text = to_json(*req);
    auto decoded = json::decode(text);
    ASSERT_TRUE(decoded) << text;
    ASSERT_TRUE(decoded->is_object());
    ASSERT_EQ(decoded->object.size(), 10u);
    EXPECT_EQ(decoded->object[0].first, "action");
    EXPECT_EQ(decoded->object[2].first, "doc");
    EXPECT_EQ(decoded->object[2].second->scalar, "Line one\n\"quoted\"");
    EXPECT_EQ(decoded->object[5].first, "permissions");
    EXPECT_EQ(decoded->object[5].second->scalar, "Students");
    EXPECT_EQ(decoded->object[6].second->array.size(), 1u);
}
