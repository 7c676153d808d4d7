/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   test/unit/gs1_parser_tests.cc
 * Description: GoogleTest suite for the fast-path parser and the ambiguity solver.
 *
 * Copyright (C) 2026 Dieter J Kybelksties <github@kybelksties.com>
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * as published by the Free Software Foundation; either version 2
 * of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.
 *
 * @date: 2026-10-18
 * @author: Dieter J Kybelksties
 */

#include "gs1_fast_path.h"
#include "gs1_solver.h"
#include "gs1_test_utils.h"

#include <algorithm>
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <vector>

namespace
{

const std::string kGs(1, gs1::kGroupSeparator);

std::vector<std::string> aiCodes(const std::vector<gs1::ParsedElement> &elements)
{
    std::vector<std::string> codes;
    for(const auto &element: elements)
    {
        codes.push_back(element.ai);
    }
    return codes;
}

bool hasDiagnostic(const std::vector<gs1::Diagnostic> &diagnostics, gs1::DiagnosticCode code)
{
    return std::ranges::any_of(diagnostics,
                               [code](const gs1::Diagnostic &diagnostic) { return diagnostic.code == code; });
}

}  // namespace

TEST(FastPathTest, ParsesSeparatorDelimitedString)
{
    const gs1::ParseOptions   options;
    const gs1::FastPathParser parser(gs1::Catalog::instance(), options);
    const gs1::FastPathResult result = parser.parse("010950600013435210ABC" + kGs + "21XYZ", true);

    EXPECT_EQ(aiCodes(result.elements), (std::vector<std::string>{"01", "10", "21"}));
    EXPECT_EQ(gs1::test::rawValues(result.elements), (std::vector<std::string>{"09506000134352", "ABC", "XYZ"}));
    EXPECT_TRUE(result.diagnostics.empty());
    EXPECT_FALSE(result.needs_solver);
    EXPECT_DOUBLE_EQ(gs1::FastPathParser::confidence(result), 1.0);

    EXPECT_EQ(result.elements[1].start, 16U);
    EXPECT_EQ(result.elements[1].end, 21U);
}

TEST(FastPathTest, SkipsUnknownAiToNextSeparator)
{
    const gs1::ParseOptions   options;
    const gs1::FastPathParser parser(gs1::Catalog::instance(), options);
    const gs1::FastPathResult result = parser.parse("010950600013435210X" + kGs + "55ABC" + kGs + "21Y", true);

    EXPECT_EQ(aiCodes(result.elements), (std::vector<std::string>{"01", "10", "21"}));
    ASSERT_EQ(result.diagnostics.size(), 1U);
    EXPECT_EQ(result.diagnostics.front().code, gs1::DiagnosticCode::kUnknownAi);
    EXPECT_EQ(result.diagnostics.front().message, "Unknown AI at position 20: 55AB");
    EXPECT_EQ(result.diagnostics.front().at_index, std::optional<std::size_t>(20));
    EXPECT_DOUBLE_EQ(gs1::FastPathParser::confidence(result), 0.85);
}

TEST(FastPathTest, ReportsTruncatedFixedLengthValue)
{
    const gs1::ParseOptions   options;
    const gs1::FastPathParser parser(gs1::Catalog::instance(), options);
    const gs1::FastPathResult result = parser.parse("01095060001343", false);

    ASSERT_EQ(result.elements.size(), 1U);
    EXPECT_EQ(result.elements.front().raw_value, "095060001343");
    EXPECT_FALSE(result.elements.front().valid);
    EXPECT_TRUE(hasDiagnostic(result.diagnostics, gs1::DiagnosticCode::kTruncatedData));
    EXPECT_DOUBLE_EQ(gs1::FastPathParser::confidence(result), 0.85 * 0.8);
}

TEST(FastPathTest, FlagsSuperfluousSeparatorAfterFixedLengthAi)
{
    const gs1::ParseOptions   options;
    const gs1::FastPathParser parser(gs1::Catalog::instance(), options);

    const gs1::FastPathResult trailing = parser.parse("0109506000134352" + kGs, true);
    ASSERT_EQ(trailing.diagnostics.size(), 1U);
    EXPECT_EQ(trailing.diagnostics.front().code, gs1::DiagnosticCode::kExtraSeparator);

    const gs1::FastPathResult before_ai = parser.parse("0109506000134352" + kGs + "10ABC", true);
    EXPECT_TRUE(before_ai.diagnostics.empty());
}

TEST(FastPathTest, EscalatesWhenUnterminatedFieldHidesAnotherAi)
{
    const gs1::ParseOptions   options;
    const gs1::FastPathParser parser(gs1::Catalog::instance(), options);

    const gs1::FastPathResult without_gs = parser.parse("010950600013435210ABC1725123121XYZ", false);
    EXPECT_TRUE(without_gs.needs_solver);
    EXPECT_FALSE(hasDiagnostic(without_gs.diagnostics, gs1::DiagnosticCode::kMissingSeparator));

    const gs1::FastPathResult with_gs = parser.parse("0109506000134352" + kGs + "10ABC1725123121XYZ", true);
    EXPECT_TRUE(with_gs.needs_solver);
    ASSERT_TRUE(hasDiagnostic(with_gs.diagnostics, gs1::DiagnosticCode::kMissingSeparator));
    EXPECT_EQ(with_gs.diagnostics.front().severity, gs1::Severity::kWarning);
    EXPECT_DOUBLE_EQ(gs1::FastPathParser::confidence(with_gs), 1.0);
}

TEST(SolverTest, SkipsSeparatorAndFindsUniqueBestPath)
{
    const gs1::ParseOptions    options;
    const gs1::AmbiguitySolver solver(gs1::Catalog::instance(), options);
    const gs1::SolverResult    result = solver.solve("10ABC" + kGs + "3103000125", true);

    ASSERT_FALSE(result.declined);
    ASSERT_FALSE(result.paths.empty());

    const gs1::SolverPath &best = result.paths.front();
    EXPECT_EQ(aiCodes(best.elements), (std::vector<std::string>{"10", "3103"}));
    EXPECT_EQ(gs1::test::rawValues(best.elements), (std::vector<std::string>{"ABC", "000125"}));
    EXPECT_DOUBLE_EQ(best.score, 1.0);
    EXPECT_TRUE(best.notes.empty());
    EXPECT_EQ(best.elements[1].start, 6U);
}

TEST(SolverTest, NotesGuessedBoundaryWithoutSeparator)
{
    const gs1::ParseOptions    options;
    const gs1::AmbiguitySolver solver(gs1::Catalog::instance(), options);
    const gs1::SolverResult    result = solver.solve("10ABC3103000125", false);

    ASSERT_GE(result.paths.size(), 2U);
    const gs1::SolverPath &best = result.paths.front();
    EXPECT_EQ(gs1::test::rawValues(best.elements), (std::vector<std::string>{"ABC", "000125"}));
    ASSERT_EQ(best.notes.size(), 1U);
    EXPECT_EQ(best.notes.front(), "Guessed boundary for AI(10)");
    EXPECT_NEAR(best.confidence, 0.83, 1e-9);

    const gs1::SolverPath &runner_up = result.paths[1];
    EXPECT_EQ(gs1::test::rawValues(runner_up.elements), (std::vector<std::string>{"ABC3103000125"}));
    EXPECT_NEAR(runner_up.score, 0.9, 1e-9);
}

TEST(SolverTest, PathsAreBoundedAndSortedByScore)
{
    gs1::ParseOptions options;
    options.max_alternatives = 2;
    const gs1::AmbiguitySolver solver(gs1::Catalog::instance(), options);
    const gs1::SolverResult    result = solver.solve("10ABC3103000125", false);

    ASSERT_FALSE(result.paths.empty());
    EXPECT_LE(result.paths.size(), 3U);
    EXPECT_TRUE(std::ranges::is_sorted(result.paths, [](const gs1::SolverPath &lhs, const gs1::SolverPath &rhs) {
        return lhs.score > rhs.score;
    }));
}

TEST(SolverTest, StrictModePrunesInvalidElements)
{
    gs1::ParseOptions options;

    const gs1::AmbiguitySolver lenient(gs1::Catalog::instance(), options);
    const gs1::SolverResult    flagged = lenient.solve("0109506000134353", false);
    ASSERT_EQ(flagged.paths.size(), 1U);
    EXPECT_FALSE(flagged.paths.front().elements.front().valid);
    EXPECT_NEAR(flagged.paths.front().score, 0.7, 1e-9);

    options.strict_mode = true;
    const gs1::AmbiguitySolver strict(gs1::Catalog::instance(), options);
    EXPECT_TRUE(strict.solve("0109506000134353", false).paths.empty());
}

TEST(SolverTest, HonoursPositionAndDepthCaps)
{
    gs1::ParseOptions options;
    options.max_solver_positions = 10;
    const gs1::AmbiguitySolver short_memo(gs1::Catalog::instance(), options);
    const gs1::SolverResult    declined = short_memo.solve("10ABC3103000125", false);
    EXPECT_TRUE(declined.declined);
    EXPECT_TRUE(declined.paths.empty());

    options                      = gs1::ParseOptions{};
    options.max_solver_depth     = 1;
    const gs1::AmbiguitySolver shallow(gs1::Catalog::instance(), options);
    EXPECT_TRUE(shallow.solve("0109506000134352" + kGs + "10ABC", true).paths.empty());
}
