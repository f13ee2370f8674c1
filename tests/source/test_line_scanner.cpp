/**
 * @file test_line_scanner.cpp
 * @brief Line scanner and lexical context tests
 */

#include "compactscan/source.hpp"

#include <string>

#include <gtest/gtest.h>

using namespace compactscan::source;

TEST(LineScanner, SplitsLinesAndDropsCarriageReturn)
{
    auto doc = scan("a;\r\nb;\nc;");
    ASSERT_TRUE(doc);
    ASSERT_EQ(doc->line_count(), 3U);
    EXPECT_EQ(doc->line(1).text, "a;");
    EXPECT_EQ(doc->line(2).text, "b;");
    EXPECT_EQ(doc->line(3).text, "c;");
    EXPECT_EQ(doc->line(3).number, 3U);
}

TEST(LineScanner, TrailingNewlineIsNotALine)
{
    auto doc = scan("x;\ny;\n");
    ASSERT_TRUE(doc);
    EXPECT_EQ(doc->line_count(), 2U);
}

TEST(LineScanner, EmptyInputFails)
{
    auto doc = scan("");
    ASSERT_FALSE(doc);
    EXPECT_EQ(doc.error().code, "EmptyInput");
}

TEST(LineScanner, WhitespaceOnlyInputFails)
{
    auto doc = scan("  \n\t\r\n   ");
    ASSERT_FALSE(doc);
    EXPECT_EQ(doc.error().code, "EmptyInput");
}

TEST(LineScanner, SizeCapCheckedFirst)
{
    // Oversized and blank at once: the size check wins.
    auto doc = scan(std::string(64, ' '), {.max_source_bytes = 16});
    ASSERT_FALSE(doc);
    EXPECT_EQ(doc.error().code, "InputTooLarge");
}

TEST(LineScanner, InputAtCapIsAccepted)
{
    auto doc = scan("ledger x: Field;", {.max_source_bytes = 16});
    EXPECT_TRUE(doc);
}

TEST(LineScanner, LineCapNamesTheLine)
{
    auto doc = scan("ledger x: Field;\n" + std::string(40, 'a') + "\n", {.max_line_bytes = 32});
    ASSERT_FALSE(doc);
    EXPECT_EQ(doc.error().code, "LineTooLong");
    EXPECT_NE(doc.error().message.find("Line 2"), std::string::npos);

    // The cap applies per line, not to the whole source.
    std::string many_lines;
    for (int i = 0; i < 16; ++i) {
        many_lines += "ledger x: Field;\n";
    }
    EXPECT_TRUE(scan(many_lines, {.max_line_bytes = 32}));
    EXPECT_TRUE(scan(std::string(32, 'a') + "\r\n", {.max_line_bytes = 32}));
}

TEST(LineScanner, BlankInputIsEmptyBeforeLineCap)
{
    auto doc = scan(std::string(64, ' '), {.max_line_bytes = 8});
    ASSERT_FALSE(doc);
    EXPECT_EQ(doc.error().code, "EmptyInput");
}

TEST(LineScanner, RejectsBinaryContent)
{
    std::string binary = "ledger x: Field;";
    binary.push_back('\0');
    binary += "\x01\x02";
    auto doc = scan(binary);
    ASSERT_FALSE(doc);
    EXPECT_EQ(doc.error().code, "InvalidContent");
}

TEST(LineScanner, RejectsMalformedUtf8)
{
    auto doc = scan("circuit f(): [] {}\n\xC3(");
    ASSERT_FALSE(doc);
    EXPECT_EQ(doc.error().code, "InvalidContent");
}

TEST(LineScanner, AcceptsUtf8InComments)
{
    auto doc = scan("// caf\xC3\xA9 \xE2\x9C\x93\nledger x: Field;");
    ASSERT_TRUE(doc);
    EXPECT_EQ(doc->line_count(), 2U);
}

TEST(LineScanner, LineCommentIsMasked)
{
    auto doc = scan("ledger x: Field; // Cell<Field>");
    ASSERT_TRUE(doc);
    const auto& line = doc->line(1);
    EXPECT_TRUE(line.flags.in_line_comment);
    EXPECT_EQ(line.code.size(), line.text.size());
    EXPECT_EQ(line.code.find("Cell"), std::string::npos);
    EXPECT_EQ(line.code.substr(0, 16), "ledger x: Field;");
}

TEST(LineScanner, BlockCommentSpansLines)
{
    auto doc = scan("a; /* start\nCell<Field>\nend */ b;");
    ASSERT_TRUE(doc);
    EXPECT_FALSE(doc->line(1).flags.in_block_comment);
    EXPECT_TRUE(doc->line(2).flags.in_block_comment);
    EXPECT_TRUE(doc->line(3).flags.in_block_comment);
    EXPECT_EQ(doc->line(2).code.find_first_not_of(' '), std::string::npos);
    EXPECT_NE(doc->line(3).code.find("b;"), std::string::npos);
}

TEST(LineScanner, StringContentsAreBlankedButQuotesKept)
{
    auto doc = scan(R"(const s = "ledger { x };";)");
    ASSERT_TRUE(doc);
    const auto& code = doc->line(1).code;
    EXPECT_EQ(code, "const s = \"" + std::string(13, ' ') + "\";");
    EXPECT_EQ(doc->line(1).depth, 0);
}

TEST(LineScanner, EscapedQuoteStaysInString)
{
    auto doc = scan(R"(x = "a\"b{"; y;)");
    ASSERT_TRUE(doc);
    EXPECT_NE(doc->line(1).code.find("y;"), std::string::npos);
    EXPECT_EQ(doc->line(1).code.find('{'), std::string::npos);
}

TEST(LineScanner, StringSpanningLinesSetsFlag)
{
    auto doc = scan("x = 'abc\ndef';\ny;");
    ASSERT_TRUE(doc);
    EXPECT_FALSE(doc->line(1).flags.in_string_literal);
    EXPECT_TRUE(doc->line(2).flags.in_string_literal);
    EXPECT_FALSE(doc->line(3).flags.in_string_literal);
}

TEST(LineScanner, TracksBraceDepthAtLineStart)
{
    auto doc = scan("circuit f(): [] {\n  if (x) {\n    y;\n  }\n}\nz;");
    ASSERT_TRUE(doc);
    EXPECT_EQ(doc->line(1).depth, 0);
    EXPECT_EQ(doc->line(2).depth, 1);
    EXPECT_EQ(doc->line(3).depth, 2);
    EXPECT_EQ(doc->line(4).depth, 2);
    EXPECT_EQ(doc->line(5).depth, 1);
    EXPECT_EQ(doc->line(6).depth, 0);
}

TEST(LineScanner, StrayClosingBraceDoesNotGoNegative)
{
    auto doc = scan("}\n}\nx;");
    ASSERT_TRUE(doc);
    EXPECT_EQ(doc->line(3).depth, 0);
}

TEST(LineScanner, JoinedViewsAlignWithLineOffsets)
{
    auto doc = scan("ab\n// c\nd \"e\"");
    ASSERT_TRUE(doc);
    EXPECT_EQ(doc->joined_text(), "ab\n// c\nd \"e\"");
    EXPECT_EQ(doc->joined_code(), "ab\n    \nd \" \"");
    EXPECT_EQ(doc->line_offset(3), 8U);
    EXPECT_EQ(doc->line_at(0), 1U);
    EXPECT_EQ(doc->line_at(2), 1U);
    EXPECT_EQ(doc->line_at(3), 2U);
    EXPECT_EQ(doc->line_at(8), 3U);
}
