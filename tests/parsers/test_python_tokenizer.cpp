#include "pystyle/parsers/python_tokenizer.hpp"
#include <gtest/gtest.h>

namespace pystyle {

class PythonTokenizerTest : public ::testing::Test {
protected:
    // Tokens other than NL/NEWLINE/COMMENT
    static auto significant(const TokenStream& stream) -> std::vector<Token> {
        std::vector<Token> result;
        for (const auto& token : stream.tokens) {
            if (token.kind != TokenKind::NL && token.kind != TokenKind::NEWLINE
                && token.kind != TokenKind::COMMENT) {
                result.push_back(token);
            }
        }
        return result;
    }
};

TEST_F(PythonTokenizerTest, SimpleAssignment)
{
    auto stream = tokenize({"x = 42"});

    EXPECT_FALSE(stream.error.has_value());
    auto tokens = significant(stream);
    ASSERT_EQ(tokens.size(), 3);
    EXPECT_EQ(tokens[0].kind, TokenKind::NAME);
    EXPECT_EQ(tokens[0].text, "x");
    EXPECT_EQ(tokens[1].kind, TokenKind::OP);
    EXPECT_EQ(tokens[1].column, 2);
    EXPECT_EQ(tokens[2].kind, TokenKind::NUMBER);
    EXPECT_EQ(tokens[2].text, "42");

    EXPECT_EQ(stream.tokens.back().kind, TokenKind::NEWLINE);
}

TEST_F(PythonTokenizerTest, OperatorsMatchLongestFirst)
{
    auto tokens = significant(tokenize({"a//=b**c<=d"}));

    ASSERT_EQ(tokens.size(), 7);
    EXPECT_EQ(tokens[1].text, "//=");
    EXPECT_EQ(tokens[3].text, "**");
    EXPECT_EQ(tokens[5].text, "<=");
}

TEST_F(PythonTokenizerTest, NumbersWithSignedExponent)
{
    auto tokens = significant(tokenize({"y = 1e-5 - 0x1F"}));

    ASSERT_EQ(tokens.size(), 5);
    EXPECT_EQ(tokens[2].text, "1e-5");
    EXPECT_EQ(tokens[3].text, "-");
    EXPECT_EQ(tokens[4].text, "0x1F");
}

TEST_F(PythonTokenizerTest, StringPrefixesAndEscapes)
{
    auto tokens = significant(tokenize({R"(s = rb'a\'b' + f"{x}")"}));

    ASSERT_EQ(tokens.size(), 5);
    EXPECT_EQ(tokens[2].kind, TokenKind::STRING);
    EXPECT_EQ(tokens[2].text, R"(rb'a\'b')");
    EXPECT_EQ(tokens[4].kind, TokenKind::STRING);
    EXPECT_EQ(tokens[4].text, R"(f"{x}")");
}

TEST_F(PythonTokenizerTest, TripleQuotedStringSpansLines)
{
    auto stream = tokenize({"doc = \"\"\"first", "second   ", "end\"\"\"", "y = 1"});

    EXPECT_FALSE(stream.error.has_value());
    auto tokens = significant(stream);
    ASSERT_EQ(tokens.size(), 6);
    const auto& doc = tokens[2];
    EXPECT_EQ(doc.kind, TokenKind::STRING);
    EXPECT_EQ(doc.line, 1);
    EXPECT_EQ(doc.end_line, 3);
    EXPECT_EQ(doc.end_column, 6);
    EXPECT_EQ(tokens[3].line, 4);

    auto logical = logical_lines(stream);
    ASSERT_EQ(logical.size(), 2);
    EXPECT_EQ(logical[0].start_line, 1);
    EXPECT_EQ(logical[0].end_line, 3);
}

TEST_F(PythonTokenizerTest, BracketsTrackDepthAndContinueLines)
{
    auto stream = tokenize({"f(a,", "  b=[1])"});

    auto tokens = significant(stream);
    ASSERT_EQ(tokens.size(), 10);
    EXPECT_EQ(tokens[0].depth, 0);
    EXPECT_EQ(tokens[2].depth, 1);
    EXPECT_EQ(tokens[2].enclosing, '(');
    EXPECT_EQ(tokens[5].text, "=");
    EXPECT_EQ(tokens[5].enclosing, '(');
    EXPECT_EQ(tokens[7].enclosing, '[');

    // The break inside the call is not a statement end
    EXPECT_EQ(stream.tokens[4].kind, TokenKind::NL);
    auto logical = logical_lines(stream);
    ASSERT_EQ(logical.size(), 1);
    EXPECT_EQ(logical[0].end_line, 2);
}

TEST_F(PythonTokenizerTest, BackslashContinuation)
{
    auto logical = logical_lines(tokenize({"total = 1 + \\", "    2", "x = 3"}));

    ASSERT_EQ(logical.size(), 2);
    EXPECT_EQ(logical[0].start_line, 1);
    EXPECT_EQ(logical[0].end_line, 2);
    EXPECT_EQ(logical[1].start_line, 3);
}

TEST_F(PythonTokenizerTest, CommentsAndBlankLinesAreNotLogicalLines)
{
    auto stream = tokenize({"# header", "", "x = 1  # trailing"});

    auto logical = logical_lines(stream);
    ASSERT_EQ(logical.size(), 1);
    EXPECT_EQ(logical[0].start_line, 3);
    EXPECT_EQ(logical[0].tokens.size(), 3);
    EXPECT_EQ(stream.tokens.front().kind, TokenKind::COMMENT);
}

TEST_F(PythonTokenizerTest, UnterminatedStringRecordsError)
{
    auto stream = tokenize({"x = 'abc", "y = 2"});

    ASSERT_TRUE(stream.error.has_value());
    EXPECT_EQ(stream.error->line, 1);
    EXPECT_EQ(stream.error->column, 4);
    EXPECT_EQ(stream.error->message, "unterminated string literal");
}

TEST_F(PythonTokenizerTest, UnclosedBracketRecordsError)
{
    auto stream = tokenize({"x = (1,", "2"});

    ASSERT_TRUE(stream.error.has_value());
    EXPECT_EQ(stream.error->line, 1);
    EXPECT_EQ(stream.error->message, "'(' was never closed");
}

TEST_F(PythonTokenizerTest, OnlyFirstErrorIsKept)
{
    auto stream = tokenize({"x = 1 ]", "y = $"});

    ASSERT_TRUE(stream.error.has_value());
    EXPECT_EQ(stream.error->line, 1);
    EXPECT_EQ(stream.error->message, "unmatched ']'");
}

TEST_F(PythonTokenizerTest, OperandEndings)
{
    auto tokens = significant(tokenize({"return None - (a) + -b"}));

    ASSERT_EQ(tokens.size(), 9);
    EXPECT_FALSE(ends_operand(tokens[0]));  // return
    EXPECT_TRUE(ends_operand(tokens[1]));   // None
    EXPECT_FALSE(ends_operand(tokens[2]));  // -
    EXPECT_TRUE(ends_operand(tokens[5]));   // )
    EXPECT_FALSE(ends_operand(tokens[7]));  // unary -
}

TEST_F(PythonTokenizerTest, KeywordLookup)
{
    EXPECT_TRUE(is_keyword("lambda"));
    EXPECT_TRUE(is_keyword("None"));
    EXPECT_FALSE(is_keyword("print"));
    EXPECT_FALSE(is_keyword("match"));
}

} // namespace pystyle
