#include "apidoc/core/code_block.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace apidoc;

TEST(CodeBlock, FindsJavascriptAndJsonFences) {
    std::string text = "intro\n```javascript\n{\"a\":1}\n```\nmiddle\n```json\n[]\n```\n";

    auto first = next_code_block(text);
    ASSERT_TRUE(first);
    ASSERT_TRUE(*first);
    EXPECT_EQ((*first)->content, "{\"a\":1}\n");

    auto second = next_code_block(text, (*first)->end);
    ASSERT_TRUE(second);
    ASSERT_TRUE(*second);
    EXPECT_EQ((*second)->content, "[]\n");

    auto none = next_code_block(text, (*second)->end);
    ASSERT_TRUE(none);
    EXPECT_FALSE(*none);
}

TEST(CodeBlock, EarliestFenceWinsRegardlessOfTag) {
    std::string text = "```json\n{\"first\":1}\n```\n```javascript\n{\"second\":1}\n```";
    auto block = next_code_block(text);
    ASSERT_TRUE(block);
    ASSERT_TRUE(*block);
    EXPECT_EQ((*block)->content, "{\"first\":1}\n");
}

TEST(CodeBlock, SkipsOtherFences) {
    std::string text = "```\nplain\n```\n```bash\ncurl\n```\n```json  \r\n{}\n```";
    auto block = next_code_block(text);
    ASSERT_TRUE(block);
    ASSERT_TRUE(*block);
    EXPECT_EQ((*block)->content, "{}\n");
}

TEST(CodeBlock, TagMustEndTheLine) {
    auto block = next_code_block("```jsonc\n{}\n```");
    ASSERT_TRUE(block);
    EXPECT_FALSE(*block);
}

TEST(CodeBlock, Unterminated) {
    parse_diagnostic diag;
    auto block = next_code_block("text\n```json\n{\"a\":1}\n", 0, &diag);
    ASSERT_FALSE(block);
    EXPECT_EQ(block.error(), make_error_code(error_code::unterminated_code_block));
    EXPECT_EQ(diag.detail, "block opened at offset 5");
}

TEST(RepairErrorSample, QuotesSentinelKey) {
    EXPECT_EQ(repair_error_sample(R"({__invalid: "name"})"), R"({"__invalid": "name"})");
    EXPECT_EQ(repair_error_sample(R"({"__invalid:"name"})"), R"({"__invalid":"name"})");
    EXPECT_EQ(repair_error_sample(R"({"__invalid" : "name"})"), R"({"__invalid": "name"})");
    EXPECT_EQ(repair_error_sample(R"({"__invalid":"name"})"), R"({"__invalid":"name"})");
}

TEST(RepairErrorSample, WrapsBareMembers) {
    EXPECT_EQ(repair_error_sample(R"("success": false)"), R"({"success": false})");
    EXPECT_EQ(repair_error_sample(R"(__invalid: "x")"), R"({"__invalid": "x"})");
    EXPECT_EQ(repair_error_sample("  {\"a\":1}"), "  {\"a\":1}");
}

TEST(RepairErrorSample, LeavesSentinelInsideValuesAlone) {
    EXPECT_EQ(repair_error_sample(R"({"msg":"__invalid value"})"), R"({"msg":"__invalid value"})");
    EXPECT_EQ(repair_error_sample(R"({"msg":"field__invalid: x"})"),
              R"({"msg":"field__invalid: x"})");
    EXPECT_EQ(repair_error_sample(R"({"msg":"__invalid: x"})"), R"({"msg":"__invalid: x"})");
    EXPECT_EQ(repair_error_sample(R"({"msg":"say \"__invalid: x\""})"),
              R"({"msg":"say \"__invalid: x\""})");
}

TEST(RepairErrorSample, SentinelAfterOtherMembers) {
    EXPECT_EQ(repair_error_sample("{\"success\":false,\n  __invalid: \"id\"}"),
              "{\"success\":false,\n  \"__invalid\": \"id\"}");
}

TEST(ErrorResponse, ValidSampleWithSentinelInValue) {
    auto r = parse_error_response("```json\n{\"msg\":\"field__invalid: x\"}\n```");
    ASSERT_TRUE(r) << r.error().message();
    ASSERT_EQ(r->size(), 1u);
    EXPECT_NE(r->find("msg"), nullptr);
}

TEST(SuccessResponse, UsesFirstBlock) {
    std::string section = "Example:\n```javascript\n{\"id\":1,\"rows\":[{\"a\":1}]}\n```\n"
                          "```json\n{\"other\":true}\n```\n";
    auto r = parse_success_response(section);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->size(), 2u);
    EXPECT_NE(r->find("id"), nullptr);
    EXPECT_EQ(r->find("other"), nullptr);
}

TEST(SuccessResponse, RootArrayWithOptionalKeys) {
    auto r = parse_success_response("```json\n[{\"a\":1},{\"a\":1,\"b\":2}]\n```");
    ASSERT_TRUE(r);
    EXPECT_NE(r->find("a"), nullptr);
    EXPECT_NE(r->find("b"), nullptr);
}

TEST(SuccessResponse, NoBlock) {
    auto r = parse_success_response("{\"id\":1}");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error(), make_error_code(error_code::no_code_block_found));
}

TEST(SuccessResponse, SamplesAreNotRepaired) {
    auto r = parse_success_response("```json\n{__invalid: \"x\"}\n```");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error(), make_error_code(error_code::invalid_json));
}

TEST(ErrorResponse, UnifiesAllBlocks) {
    std::string section = "```javascript\n{\"__invalid:\"name\"}\n```\n\nor\n\n"
                          "```javascript\n{\"success\":false}\n```\n";
    auto r = parse_error_response(section);
    ASSERT_TRUE(r);
    ASSERT_EQ(r->size(), 2u);
    ASSERT_NE(r->find("__invalid"), nullptr);
    EXPECT_EQ(r->find("__invalid")->kind(), field_kind::primitive);
    ASSERT_NE(r->find("success"), nullptr);
    EXPECT_EQ(r->find("success")->kind(), field_kind::primitive);
}

TEST(ErrorResponse, BareMemberBlock) {
    auto r = parse_error_response("```json\n\"success\": false, \"error\": \"denied\"\n```");
    ASSERT_TRUE(r);
    EXPECT_EQ(r->size(), 2u);
}

TEST(ErrorResponse, NoBlocksIsEmptySchema) {
    auto r = parse_error_response("None documented.");
    ASSERT_TRUE(r);
    EXPECT_TRUE(r->empty());
}

TEST(ErrorResponse, EmptyBlock) {
    auto r = parse_error_response("```json\n \n```");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error(), make_error_code(error_code::empty_code_block));
}

TEST(ErrorResponse, ConflictingBlocks) {
    parse_diagnostic diag;
    auto r = parse_error_response(
        "```json\n{\"error\":\"x\"}\n```\n```json\n{\"error\":{\"code\":1}}\n```", {}, &diag);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error(), make_error_code(error_code::conflicting_field_type));
}
