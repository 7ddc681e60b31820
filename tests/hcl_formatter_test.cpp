#include "format/hcl_formatter.hpp"

#include <gtest/gtest.h>

using namespace wheels;
using namespace wheels::format;

class HclFormatterTest : public ::testing::Test {
protected:
    FormatOptions options_;

    // Format, returning "ERROR: <message>" on failure
    auto format(const std::string& source) -> std::string {
        HclFormatter formatter(options_);
        auto result = formatter.format(source);
        if (is_err(result)) {
            return "ERROR: " + unwrap_err(result).message;
        }
        return unwrap(result);
    }
};

// ============================================================================
// Indentation and Assignments
// ============================================================================

TEST_F(HclFormatterTest, ReindentsAndAlignsBlockBody) {
    std::string input = "module \"dcos\" {\n"
                        "source=\"x\"\n"
                        "      num_masters   =   \"3\"\n"
                        "}";

    EXPECT_EQ(format(input), "module \"dcos\" {\n"
                             "  source      = \"x\"\n"
                             "  num_masters = \"3\"\n"
                             "}\n");
}

TEST_F(HclFormatterTest, NestedBlocks) {
    std::string input = "module \"dcos\" {\n"
                        "providers = {\n"
                        "aws = \"aws\"\n"
                        "}\n"
                        "}\n";

    EXPECT_EQ(format(input), "module \"dcos\" {\n"
                             "  providers = {\n"
                             "    aws = \"aws\"\n"
                             "  }\n"
                             "}\n");
}

TEST_F(HclFormatterTest, ListBlock) {
    EXPECT_EQ(format("tags = [\n\"a\",\n  \"b\",\n]"), "tags = [\n  \"a\",\n  \"b\",\n]\n");
}

TEST_F(HclFormatterTest, SingleLineBlockValueIsAligned) {
    EXPECT_EQ(format("providers = { aws = \"aws\" }\nsource = \"x\""),
              "providers = { aws = \"aws\" }\n"
              "source    = \"x\"\n");
}

TEST_F(HclFormatterTest, BlankLineBreaksAlignmentRun) {
    EXPECT_EQ(format("a = 1\nlonger_key = 2\n\nb = 3"), "a          = 1\n"
                                                          "longer_key = 2\n"
                                                          "\n"
                                                          "b = 3\n");
}

TEST_F(HclFormatterTest, ComparisonIsNotAnAssignment) {
    EXPECT_EQ(format("x==y"), "x==y\n");
    EXPECT_EQ(format("enabled=var.a >= 1"), "enabled = var.a >= 1\n");
}

TEST_F(HclFormatterTest, AlignmentCanBeDisabled) {
    options_.align_assignments = false;
    EXPECT_EQ(format("a = 1\nlonger_key = 2"), "a = 1\nlonger_key = 2\n");
}

TEST_F(HclFormatterTest, CustomIndentWidth) {
    options_.indent_width = 4;
    EXPECT_EQ(format("a {\nb = 1\n}"), "a {\n    b = 1\n}\n");
}

// ============================================================================
// Blank Lines
// ============================================================================

TEST_F(HclFormatterTest, CollapsesAndTrimsBlankLines) {
    EXPECT_EQ(format("\n\na = 1\n\n\n\nb = 2\n\n"), "a = 1\n\nb = 2\n");
}

TEST_F(HclFormatterTest, EmptyInput) {
    EXPECT_EQ(format(""), "");
    EXPECT_EQ(format("\n\n  \n"), "");
}

// ============================================================================
// Strings, Comments and Heredocs
// ============================================================================

TEST_F(HclFormatterTest, BracesInsideStringsAreIgnored) {
    EXPECT_EQ(format("url = \"${lookup(var.m, \"k\")}/x{\""),
              "url = \"${lookup(var.m, \"k\")}/x{\"\n");
}

TEST_F(HclFormatterTest, EscapedQuoteStaysInString) {
    EXPECT_EQ(format("msg = \"say \\\"{\\\"\""), "msg = \"say \\\"{\\\"\"\n");
}

TEST_F(HclFormatterTest, CommentsDoNotOpenBlocks) {
    EXPECT_EQ(format("# a { comment\na = 1 // }"), "# a { comment\na = 1 // }\n");
    EXPECT_EQ(format("/* {\n[ */\na = 1"), "/* {\n[ */\na = 1\n");
}

TEST_F(HclFormatterTest, HeredocBodyIsVerbatim) {
    std::string input = "user_data = <<EOF\n"
                        "  #!/bin/bash\n"
                        "    echo {\n"
                        "EOF\n"
                        "b = 1";

    EXPECT_EQ(format(input), "user_data = <<EOF\n"
                             "  #!/bin/bash\n"
                             "    echo {\n"
                             "EOF\n"
                             "b = 1\n");
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(HclFormatterTest, UnclosedBracket) {
    EXPECT_EQ(format("a = {\nb = 1\n"), "ERROR: unclosed '{' opened at line 1");
}

TEST_F(HclFormatterTest, UnexpectedCloser) {
    EXPECT_EQ(format("}"), "ERROR: unexpected '}' at line 1");
}

TEST_F(HclFormatterTest, MismatchedPair) {
    EXPECT_EQ(format("a = [\n}"), "ERROR: unexpected '}' at line 2");
}

TEST_F(HclFormatterTest, UnterminatedString) {
    EXPECT_EQ(format("a = 1\nb = \"abc"), "ERROR: unterminated string at line 2");
}

TEST_F(HclFormatterTest, UnterminatedHeredoc) {
    EXPECT_EQ(format("a = <<EOF\ntext"), "ERROR: unterminated heredoc at line 1");
}

TEST_F(HclFormatterTest, UnterminatedComment) {
    EXPECT_EQ(format("a = 1\n/* open"), "ERROR: unterminated comment at line 2");
}

TEST_F(HclFormatterTest, FormatterIsReusable) {
    HclFormatter formatter;
    ASSERT_TRUE(is_err(formatter.format("a = {")));

    auto ok = formatter.format("a = 1");
    ASSERT_TRUE(is_ok(ok));
    EXPECT_EQ(unwrap(ok), "a = 1\n");
}

TEST(FormatHclTest, FreeFunctionUsesDefaults) {
    auto result = format_hcl("a {\nb=1\n}");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), "a {\n  b = 1\n}\n");
}
