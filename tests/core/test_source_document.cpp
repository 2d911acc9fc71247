#include "pystyle/core/source_document.hpp"
#include <gtest/gtest.h>

namespace pystyle {

class SourceDocumentTest : public ::testing::Test {
protected:
    std::string sample_ =
        "import os\n"
        "\n"
        "class Config:\n"
        "    # settings\n"
        "    debug = False\n"
        "\n"
        "    def load(self):\n"
        "        return os.environ\n";
};

TEST_F(SourceDocumentTest, SplitPreservesLineEndings)
{
    auto lines = split_lines("a\r\nb\nc");

    ASSERT_EQ(lines.size(), 3);
    EXPECT_EQ(lines[0], (Line{.number = 1, .text = "a", .ending = "\r\n"}));
    EXPECT_EQ(lines[1], (Line{.number = 2, .text = "b", .ending = "\n"}));
    EXPECT_EQ(lines[2], (Line{.number = 3, .text = "c", .ending = ""}));
}

TEST_F(SourceDocumentTest, EmptyTextHasNoLines)
{
    auto document = build_source_document("");

    EXPECT_TRUE(document.lines.empty());
    EXPECT_TRUE(document.declarations.empty());
    EXPECT_FALSE(document.parse_error.has_value());
}

TEST_F(SourceDocumentTest, RenderReproducesInputExactly)
{
    for (const std::string text : {"x = 1\n", "x = 1", "a\r\nb\r\n", "\n\n", "tab\there  \n"}) {
        EXPECT_EQ(render_lines(split_lines(text)), text);
    }
}

TEST_F(SourceDocumentTest, BuildsDeclarationTree)
{
    auto document = build_source_document(sample_);

    EXPECT_EQ(document.text, sample_);
    EXPECT_EQ(document.lines.size(), 8);
    EXPECT_FALSE(document.parse_error.has_value());

    ASSERT_EQ(document.declarations.size(), 4);
    EXPECT_EQ(document.declarations[0].kind, DeclarationKind::IMPORT);
    EXPECT_EQ(document.declarations[1].kind, DeclarationKind::CLASS);
    EXPECT_EQ(document.declarations[1].start_line, 3);
    EXPECT_EQ(document.declarations[1].end_line, 8);
    EXPECT_EQ(document.declarations[2].name, "debug");
    EXPECT_EQ(document.declarations[3].name, "load");
}

TEST_F(SourceDocumentTest, BlankAndCommentLinesAreNotDeclarations)
{
    auto document = build_source_document(sample_);

    for (const auto& declaration : document.declarations) {
        EXPECT_NE(declaration.start_line, 2);
        EXPECT_NE(declaration.start_line, 4);
        EXPECT_NE(declaration.start_line, 6);
    }
}

TEST_F(SourceDocumentTest, ParseErrorIsRecordedNotThrown)
{
    auto document = build_source_document("def f(:\n    pass\nx = 1   \n");

    ASSERT_TRUE(document.parse_error.has_value());
    EXPECT_TRUE(document.declarations.empty());
    // Line view stays usable for line checks
    EXPECT_EQ(document.lines.size(), 3);
    EXPECT_EQ(document.lines[2].text, "x = 1   ");
}

TEST_F(SourceDocumentTest, ParseDiagnosticCarriesLineAndMessage)
{
    auto document = build_source_document("x = 1\n  y = 2\n");

    ASSERT_TRUE(document.parse_error.has_value());
    EXPECT_EQ(document.parse_error->line, 2);
    EXPECT_EQ(document.parse_error->message, "unexpected indent");
}

TEST_F(SourceDocumentTest, RebuildFromEditedLines)
{
    auto lines = split_lines("class A:\n    pass\n");
    lines[0].text = "class B:";

    auto document = build_source_document(lines);

    EXPECT_EQ(document.text, "class B:\n    pass\n");
    ASSERT_EQ(document.declarations.size(), 1);
    EXPECT_EQ(document.declarations[0].name, "B");
}

} // namespace pystyle
