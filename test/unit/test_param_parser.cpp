#include "apidoc/core/param_parser.hpp"

#include <gtest/gtest.h>

using namespace apidoc;

TEST(Presence, CaseInsensitive) {
    EXPECT_EQ(parse_presence("Required").value(), presence::required);
    EXPECT_EQ(parse_presence(" OPTIONAL ").value(), presence::optional);
    EXPECT_EQ(parse_presence("conditional").value(), presence::conditional);

    parse_diagnostic diag;
    auto p = parse_presence("mandatory", &diag);
    ASSERT_FALSE(p);
    EXPECT_EQ(p.error(), make_error_code(error_code::unknown_presence));
    EXPECT_EQ(diag.detail, "'mandatory'");
}

TEST(ParamLine, RequiredWithTypeAndDescription) {
    auto p = parse_param_line("`studentId [number]` - the student's id", presence::required);
    ASSERT_TRUE(p);
    EXPECT_EQ(p->name, "studentId");
    ASSERT_TRUE(p->type);
    EXPECT_EQ(*p->type, type_tag::integer);
    EXPECT_EQ(p->doc, "the student's id");
    EXPECT_EQ(p->kind, presence::required);
}

TEST(ParamLine, WholeDeclarationInOneCodeSpan) {
    auto p = parse_param_line("`studentId [number] - the student's id`", "Required");
    ASSERT_TRUE(p);
    EXPECT_EQ(p->name, "studentId");
    EXPECT_EQ(p->type, type_tag::integer);
    EXPECT_EQ(p->doc, "the student's id");
}

TEST(ParamLine, NameOnlyQuotedSeparately) {
    auto p = parse_param_line("`from` `[date]` - first day", presence::optional);
    ASSERT_TRUE(p);
    EXPECT_EQ(p->name, "from");
    EXPECT_EQ(p->type, type_tag::date);
    EXPECT_EQ(p->doc, "first day");
    EXPECT_EQ(p->kind, presence::optional);
}

TEST(ParamLine, UntypedParameter) {
    auto p = parse_param_line("`filter` - free text", presence::optional);
    ASSERT_TRUE(p);
    EXPECT_EQ(p->name, "filter");
    EXPECT_FALSE(p->type);
    EXPECT_EQ(p->doc, "free text");
}

TEST(ParamLine, MissingDescriptionTolerated) {
    auto p = parse_param_line("`studentId [number]`", presence::required);
    ASSERT_TRUE(p);
    EXPECT_EQ(p->name, "studentId");
    EXPECT_EQ(p->type, type_tag::integer);
    EXPECT_TRUE(p->doc.empty());
}

TEST(ParamLine, MissingDescriptionRejectedWhenStrict) {
    parse_options opts;
    opts.allow_missing_param_description = false;

    auto p = parse_param_line("`studentId [number]`", presence::required, opts);
    ASSERT_FALSE(p);
    EXPECT_EQ(p.error(), make_error_code(error_code::malformed_parameter_line));
}

TEST(ParamLine, ConditionalKeepsProse) {
    auto p = parse_param_line("  Either `a` or `b` must be supplied ", presence::conditional);
    ASSERT_TRUE(p);
    EXPECT_TRUE(p->name.empty());
    EXPECT_FALSE(p->type);
    EXPECT_EQ(p->doc, "Either `a` or `b` must be supplied");
    EXPECT_EQ(p->kind, presence::conditional);
}

TEST(ParamLine, MustStartWithBacktick) {
    parse_diagnostic diag;
    auto p = parse_param_line("studentId [number] - id", presence::required, {}, &diag);
    ASSERT_FALSE(p);
    EXPECT_EQ(p.error(), make_error_code(error_code::malformed_parameter_line));
}

TEST(ParamLine, UnknownTypeNamesToken) {
    parse_diagnostic diag;
    auto p = parse_param_line("`blob [bytes]` - raw", presence::required, {}, &diag);
    ASSERT_FALSE(p);
    EXPECT_EQ(p.error(), make_error_code(error_code::unknown_type));
    EXPECT_EQ(diag.detail, "'bytes'");
}

TEST(ParamLine, TypeWithoutBrackets) {
    auto p = parse_param_line("`id number` - id", presence::required);
    ASSERT_FALSE(p);
    EXPECT_EQ(p.error(), make_error_code(error_code::malformed_parameter_line));
}

TEST(ParamLine, EmptyName) {
    auto p = parse_param_line("`` - nothing", presence::required);
    ASSERT_FALSE(p);
    EXPECT_EQ(p.error(), make_error_code(error_code::malformed_parameter_line));
}

TEST(ParamLine, UnknownCategoryString) {
    auto p = parse_param_line("`id [number]` - id", "sometimes");
    ASSERT_FALSE(p);
    EXPECT_EQ(p.error(), make_error_code(error_code::unknown_presence));
}

TEST(Params, BlocksWithCategoryMarkers) {
    const char* body = R"(**Required:**

`studentId [number]` - the student's id

`schoolId [number]` - the school

**Optional:**

`from [date]` - first day
`to [date]` - last day

**Conditional:**

Either `from` or `to`
must be supplied)";

    auto params = parse_params(body);
    ASSERT_TRUE(params) << params.error().message();
    ASSERT_EQ(params->size(), 5u);

    EXPECT_EQ((*params)[0].name, "studentId");
    EXPECT_EQ((*params)[0].kind, presence::required);
    EXPECT_EQ((*params)[1].name, "schoolId");
    EXPECT_EQ((*params)[2].name, "from");
    EXPECT_EQ((*params)[2].kind, presence::optional);
    EXPECT_EQ((*params)[3].name, "to");
    EXPECT_EQ((*params)[3].kind, presence::optional);
    EXPECT_EQ((*params)[4].kind, presence::conditional);
    EXPECT_EQ((*params)[4].doc, "Either `from` or `to`\nmust be supplied");
}

TEST(Params, WrappedDescriptionJoinsPreviousEntry) {
    const char* body = "**Required:**\n`id [number]` - the id of the\nstudent to load\n";
    auto params = parse_params(body);
    ASSERT_TRUE(params);
    ASSERT_EQ(params->size(), 1u);
    EXPECT_EQ((*params)[0].doc, "the id of the\nstudent to load");
}

TEST(Params, NoneAndEmptyBody) {
    auto none = parse_params("**Required:**\n\nNone\n\n**Optional:**\n\nnone");
    ASSERT_TRUE(none);
    EXPECT_TRUE(none->empty());

    auto blank = parse_params("\n  \n");
    ASSERT_TRUE(blank);
    EXPECT_TRUE(blank->empty());
}

TEST(Params, LineBeforeAnyCategory) {
    parse_diagnostic diag;
    auto params = parse_params("`id [number]` - id", {}, &diag);
    ASSERT_FALSE(params);
    EXPECT_EQ(params.error(), make_error_code(error_code::missing_presence_context));
}

TEST(Params, UnknownCategoryMarker) {
    auto params = parse_params("**Sometimes:**\n`id [number]` - id");
    ASSERT_FALSE(params);
    EXPECT_EQ(params.error(), make_error_code(error_code::unknown_presence));
}

TEST(Params, FailingLineAbortsWholeSection) {
    parse_diagnostic diag;
    auto params = parse_params("**Required:**\n`ok [string]` - fine\n\n`bad [bytes]` - no", {}, &diag);
    ASSERT_FALSE(params);
    EXPECT_EQ(params.error(), make_error_code(error_code::unknown_type));
}

TEST(Presence, Names) {
    EXPECT_EQ(presence_name(presence::required), "required");
    EXPECT_EQ(presence_name(presence::optional), "optional");
    EXPECT_EQ(presence_name(presence::conditional), "conditional");
}
