#include "pystyle/core/corrector.hpp"
#include "pystyle/core/engine.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace pystyle {

class CorrectorTest : public ::testing::Test {
protected:
    AnalysisOptions options_;

    auto fix(const std::string& text) -> CorrectionResult {
        auto document = build_source_document(text);
        auto report = analyze_document(document, options_);
        return run_corrector(document, report, options_);
    }

    static auto codes_of(const std::vector<Violation>& violations) -> std::vector<RuleCode> {
        std::vector<RuleCode> result;
        for (const auto& violation : violations) {
            result.push_back(violation.code);
        }
        return result;
    }
};

TEST_F(CorrectorTest, PipelineOrder)
{
    EXPECT_THAT(fixer_pipeline(),
                ::testing::ElementsAre(FixerKind::TRAILING_WHITESPACE, FixerKind::INDENTATION,
                                       FixerKind::OPERATOR_SPACING, FixerKind::IMPORT_ORDER));
    EXPECT_EQ(fixer_name(FixerKind::OPERATOR_SPACING), "missing-operator-space");
    EXPECT_THAT(fixer_codes(FixerKind::INDENTATION),
                ::testing::ElementsAre(RuleCode::BAD_INDENTATION));
}

TEST_F(CorrectorTest, StripsTrailingWhitespace)
{
    auto result = fix("y = 2   \nz = 3\t\n");

    EXPECT_EQ(result.text, "y = 2\nz = 3\n");
    EXPECT_EQ(result.resolved.size(), 2);
    EXPECT_TRUE(result.manual.empty());
    EXPECT_FALSE(result.rolled_back);
}

TEST_F(CorrectorTest, KeepsWhitespaceAfterBackslash)
{
    auto document = build_source_document("x = 1\n");
    Violation target{.line = 1, .column = 6, .code = RuleCode::TRAILING_WHITESPACE, .message = ""};
    auto backslash = build_source_document("total = 1 \\ \n");

    auto outcome = apply_fixer(FixerKind::TRAILING_WHITESPACE, backslash, {target}, options_);

    EXPECT_TRUE(outcome.fixed.empty());
    ASSERT_EQ(outcome.conflicts.size(), 1);
    EXPECT_EQ(outcome.conflicts[0].reason, "whitespace follows a backslash");
    EXPECT_EQ(outcome.lines, backslash.lines);

    // Nothing left to strip
    auto clean = apply_fixer(FixerKind::TRAILING_WHITESPACE, document, {target}, options_);
    ASSERT_EQ(clean.conflicts.size(), 1);
    EXPECT_EQ(clean.conflicts[0].reason, "line has no trailing whitespace");
}

TEST_F(CorrectorTest, WhitespaceInsideStringIsAConflict)
{
    auto document = build_source_document("doc = '''\nkeep   \n'''\n");
    Violation target{.line = 2, .column = 5, .code = RuleCode::TRAILING_WHITESPACE, .message = ""};

    auto outcome = apply_fixer(FixerKind::TRAILING_WHITESPACE, document, {target}, options_);

    EXPECT_TRUE(outcome.fixed.empty());
    ASSERT_EQ(outcome.conflicts.size(), 1);
    EXPECT_EQ(outcome.conflicts[0].violation, target);
    EXPECT_EQ(outcome.conflicts[0].reason, "whitespace belongs to a string literal");
}

TEST_F(CorrectorTest, ReindentsToBlockLevel)
{
    auto result = fix("def f():\n"
                      "   x = 1\n"
                      "   if x:\n"
                      "         return x\n"
                      "   return 0\n");

    EXPECT_EQ(result.text, "def f():\n"
                           "    x = 1\n"
                           "    if x:\n"
                           "        return x\n"
                           "    return 0\n");
    EXPECT_EQ(result.resolved.size(), 4);
    EXPECT_TRUE(result.conflicts.empty());
}

TEST_F(CorrectorTest, ReplacesMixedTabsAndSpaces)
{
    auto result = fix("if True:\n\t  y = 2\n");

    EXPECT_EQ(result.text, "if True:\n    y = 2\n");
}

TEST_F(CorrectorTest, ContinuationLinesKeepTheirIndentation)
{
    auto result = fix("def f():\n"
                      "  return g(1,\n"
                      "           2)\n");

    EXPECT_EQ(result.text, "def f():\n"
                           "    return g(1,\n"
                           "           2)\n");
}

TEST_F(CorrectorTest, ReindentThatChangesStructureIsReverted)
{
    std::string text = "if a:\n"
                       "        b = 1\n"
                       "        if c:\n"
                       "          d = 2\n";

    auto result = fix(text);

    EXPECT_EQ(result.text, text);
    ASSERT_EQ(result.conflicts.size(), 1);
    EXPECT_EQ(result.conflicts[0].violation.line, 4);
    EXPECT_EQ(result.conflicts[0].reason, "re-indenting would change the block structure");
    EXPECT_THAT(codes_of(result.manual), ::testing::ElementsAre(RuleCode::BAD_INDENTATION));
}

TEST_F(CorrectorTest, SegmentsAreIndependent)
{
    auto result = fix("if a:\n"
                      "        b = 1\n"
                      "        if c:\n"
                      "          d = 2\n"
                      "def g():\n"
                      "  return 1\n");

    // First statement is left alone, the function is fixed
    EXPECT_EQ(result.text, "if a:\n"
                           "        b = 1\n"
                           "        if c:\n"
                           "          d = 2\n"
                           "def g():\n"
                           "    return 1\n");
    EXPECT_EQ(result.resolved.size(), 1);
    EXPECT_EQ(result.conflicts.size(), 1);
}

TEST_F(CorrectorTest, InsertsSpacesAroundOperators)
{
    auto result = fix("x=1\ny = a+ b\nflags = [a==b, c <d]\n");

    EXPECT_EQ(result.text, "x = 1\ny = a + b\nflags = [a == b, c < d]\n");
    EXPECT_EQ(result.resolved.size(), 4);
}

TEST_F(CorrectorTest, OperatorFixLeavesExcludedContextsAlone)
{
    auto result = fix("def f(a, b=1):\n    return g(key=-a)+1\n");

    EXPECT_EQ(result.text, "def f(a, b=1):\n    return g(key=-a) + 1\n");
}

TEST_F(CorrectorTest, OperatorFixMayNotOverflowTheLine)
{
    std::string line = "x='" + std::string(96, 'a') + "'";
    ASSERT_EQ(line.size(), 100);

    auto result = fix(line + "\n");

    EXPECT_EQ(result.text, line + "\n");
    ASSERT_EQ(result.conflicts.size(), 1);
    EXPECT_THAT(result.conflicts[0].reason, ::testing::HasSubstr("longer than 100"));
}

TEST_F(CorrectorTest, ReordersImportBlock)
{
    auto result = fix("import requests\nimport os\nimport sys\n");

    EXPECT_EQ(result.text, "import os\nimport sys\nimport requests\n");
    EXPECT_EQ(result.resolved.size(), 3);
}

TEST_F(CorrectorTest, BlankLinesKeepTheirPositions)
{
    auto result = fix("import sys\n"
                      "\n"
                      "import os\n"
                      "import abc\n"
                      "\n"
                      "x = 1\n");

    EXPECT_EQ(result.text, "import abc\n"
                           "\n"
                           "import os\n"
                           "import sys\n"
                           "\n"
                           "x = 1\n");
}

TEST_F(CorrectorTest, MultiLineImportsMoveAsAUnit)
{
    auto result = fix("from typing import (\n"
                      "    Any,\n"
                      ")\n"
                      "import abc  # keep\n");

    EXPECT_EQ(result.text, "import abc  # keep\n"
                           "from typing import (\n"
                           "    Any,\n"
                           ")\n");
}

TEST_F(CorrectorTest, FinalLineWithoutTerminatorStaysLast)
{
    auto result = fix("import sys\r\nimport os");

    EXPECT_EQ(result.text, "import os\r\nimport sys");
}

TEST_F(CorrectorTest, ManualViolationsAreUntouched)
{
    std::string text = "class my_class:\n    pass\n";

    auto result = fix(text);

    EXPECT_EQ(result.text, text);
    EXPECT_TRUE(result.resolved.empty());
    EXPECT_THAT(codes_of(result.manual), ::testing::ElementsAre(RuleCode::CLASS_NAMING));
}

TEST_F(CorrectorTest, StaleReportBecomesConflicts)
{
    auto document = build_source_document("x = 1\n");
    ViolationReport stale{.violations = {{.line = 1,
                                          .column = 6,
                                          .code = RuleCode::TRAILING_WHITESPACE,
                                          .message = "Trailing whitespace"},
                                         {.line = 7,
                                          .column = 2,
                                          .code = RuleCode::MISSING_OPERATOR_SPACE,
                                          .message = "Missing whitespace around operator \"=\""}},
                          .parse_error = std::nullopt};

    auto result = run_corrector(document, stale, options_);

    EXPECT_EQ(result.text, "x = 1\n");
    EXPECT_TRUE(result.resolved.empty());
    EXPECT_EQ(result.conflicts.size(), 2);
    EXPECT_EQ(result.manual.size(), 2);
}

TEST_F(CorrectorTest, LineFixesStillApplyWhenStructureIsBroken)
{
    auto result = fix("x = 1  \ny = (\n");

    EXPECT_EQ(result.text, "x = 1\ny = (\n");
}

TEST_F(CorrectorTest, AllFixersTogether)
{
    auto result = fix("import sys   \n"
                      "import os\n"
                      "\n"
                      "def main():\n"
                      "  total=0\n"
                      "  return total\n");

    EXPECT_EQ(result.text, "import os\n"
                           "import sys\n"
                           "\n"
                           "def main():\n"
                           "    total = 0\n"
                           "    return total\n");
    EXPECT_TRUE(result.manual.empty());
    EXPECT_FALSE(result.rolled_back);

    auto after = analyze(result.text);
    EXPECT_TRUE(after.violations.empty());
}

TEST_F(CorrectorTest, StageSoundness)
{
    Violation spacing{.line = 1, .column = 2, .code = RuleCode::MISSING_OPERATOR_SPACE,
                      .message = ""};
    Violation trailing{.line = 1, .column = 4, .code = RuleCode::TRAILING_WHITESPACE,
                       .message = ""};

    EXPECT_TRUE(stage_is_sound(FixerKind::OPERATOR_SPACING, {spacing, trailing}, {trailing},
                               {spacing}));
    // Claims more than it removed
    EXPECT_FALSE(stage_is_sound(FixerKind::OPERATOR_SPACING, {spacing, trailing},
                                {spacing, trailing}, {spacing}));
    // Introduces a violation of another code
    EXPECT_FALSE(stage_is_sound(FixerKind::TRAILING_WHITESPACE, {trailing}, {spacing}, {trailing}));
}

TEST_F(CorrectorTest, UnsoundStageIsReverted)
{
    auto document = build_source_document("x=1  \n");
    auto report = analyze_document(document, options_);

    // Strips the whitespace but adds a new operator problem
    FixerFunction fixer = [](FixerKind kind, const SourceDocument& current,
                             const std::vector<Violation>& targets,
                             const AnalysisOptions& options) {
        if (kind != FixerKind::TRAILING_WHITESPACE) {
            return apply_fixer(kind, current, targets, options);
        }
        FixOutcome outcome{.lines = current.lines, .fixed = targets};
        outcome.lines[0].text = "x=1;y=2";
        return outcome;
    };

    auto result = run_corrector(document, report, options_, fixer);

    EXPECT_EQ(result.text, "x = 1  \n");
    EXPECT_FALSE(result.rolled_back);
    ASSERT_EQ(result.conflicts.size(), 1);
    EXPECT_EQ(result.conflicts[0].violation.code, RuleCode::TRAILING_WHITESPACE);
    EXPECT_EQ(result.conflicts[0].reason,
              "trailing-whitespace fix changed other violations; reverted");
    EXPECT_THAT(codes_of(result.resolved),
                ::testing::ElementsAre(RuleCode::MISSING_OPERATOR_SPACE));
    EXPECT_THAT(codes_of(result.manual), ::testing::ElementsAre(RuleCode::TRAILING_WHITESPACE));
}

TEST_F(CorrectorTest, FailedFinalCheckRestoresInput)
{
    std::string text = "x=1  \n";
    auto document = build_source_document(text);
    auto report = analyze_document(document, options_);
    ASSERT_EQ(report.violations.size(), 2);
    auto trailing = report.violations[1];

    // The operator stage claims the whitespace it never touched
    FixerFunction fixer = [trailing](FixerKind kind, const SourceDocument& current,
                                     const std::vector<Violation>& targets,
                                     const AnalysisOptions& options) {
        if (kind == FixerKind::TRAILING_WHITESPACE) {
            return FixOutcome{.lines = current.lines};
        }
        auto outcome = apply_fixer(kind, current, targets, options);
        if (kind == FixerKind::OPERATOR_SPACING) {
            outcome.fixed.push_back(trailing);
        }
        return outcome;
    };

    auto result = run_corrector(document, report, options_, fixer);

    EXPECT_TRUE(result.rolled_back);
    EXPECT_EQ(result.text, text);
    EXPECT_TRUE(result.resolved.empty());
    EXPECT_EQ(result.manual, report.violations);
}

} // namespace pystyle
