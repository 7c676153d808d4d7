/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   test/unit/gs1_options_tests.cc
 * Description: GoogleTest suite for loading parse options from XML.
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

#include "gs1_options.h"
#include "gs1_test_utils.h"

#include <gtest/gtest.h>
#include <string>

namespace
{

const char *kFullOptions = "<?xml version=\"1.0\"?>\n"
                           "<gs1decoder>\n"
                           "  <parser strict=\"Y\" normalize_separators=\"N\" allow_ambiguity=\"N\"\n"
                           "          max_alternatives=\"3\" century_pivot=\"60\"/>\n"
                           "  <beam width=\"50\" max_iterations=\"12\"/>\n"
                           "  <solver max_positions=\"256\" max_depth=\"20\"/>\n"
                           "  <whitelist>\n"
                           "    <ai code=\"91\"/>\n"
                           "    <ai code=\"92\"/>\n"
                           "  </whitelist>\n"
                           "  <weights valid_gtin=\"900\" ambiguity_gap=\"25.5\"/>\n"
                           "</gs1decoder>\n";

}  // namespace

TEST(OptionsTest, DefaultsMatchDocumentedValues)
{
    const gs1::ParseOptions options;

    EXPECT_FALSE(options.strict_mode);
    EXPECT_EQ(options.max_alternatives, 5U);
    EXPECT_EQ(options.century_pivot, 51);
    EXPECT_TRUE(options.normalize_separators);
    EXPECT_TRUE(options.allow_ambiguity);
    EXPECT_EQ(options.beam_width, 200U);
    EXPECT_EQ(options.max_beam_iterations, 20U);
    EXPECT_TRUE(options.vendor_whitelist.empty());
    EXPECT_DOUBLE_EQ(options.weights.valid_gtin, 1000.0);
    EXPECT_DOUBLE_EQ(options.weights.ambiguity_gap, 40.0);
}

TEST(OptionsTest, LoadsEverySectionFromFile)
{
    gs1::test::TempDir temp;
    const auto         xml_path = temp.path() / "options.xml";
    ASSERT_TRUE(gs1::test::writeFile(xml_path, kFullOptions));

    gs1::ParseOptions options;
    std::string       error;
    ASSERT_TRUE(gs1::loadOptionsFromFile(xml_path.string(), options, &error)) << error;

    EXPECT_TRUE(options.strict_mode);
    EXPECT_FALSE(options.normalize_separators);
    EXPECT_FALSE(options.allow_ambiguity);
    EXPECT_EQ(options.max_alternatives, 3U);
    EXPECT_EQ(options.century_pivot, 60);
    EXPECT_EQ(options.beam_width, 50U);
    EXPECT_EQ(options.max_beam_iterations, 12U);
    EXPECT_EQ(options.max_solver_positions, 256U);
    EXPECT_EQ(options.max_solver_depth, 20U);
    EXPECT_EQ(options.vendor_whitelist, (std::set<std::string>{"91", "92"}));
    EXPECT_DOUBLE_EQ(options.weights.valid_gtin, 900.0);
    EXPECT_DOUBLE_EQ(options.weights.ambiguity_gap, 25.5);
    EXPECT_DOUBLE_EQ(options.weights.valid_expiry, 250.0);
}

TEST(OptionsTest, AbsentAttributesKeepCurrentValues)
{
    gs1::ParseOptions options;
    options.beam_width = 77;

    std::string error;
    ASSERT_TRUE(gs1::loadOptionsFromString("<gs1decoder><parser strict=\"Y\"/></gs1decoder>", options, &error))
        << error;

    EXPECT_TRUE(options.strict_mode);
    EXPECT_EQ(options.beam_width, 77U);
    EXPECT_TRUE(options.allow_ambiguity);
}

TEST(OptionsTest, FailuresLeaveOptionsUntouched)
{
    gs1::ParseOptions options;
    std::string       error;

    EXPECT_FALSE(gs1::loadOptionsFromFile("/nonexistent/options.xml", options, &error));
    EXPECT_NE(error.find("Failed to load XML"), std::string::npos);

    EXPECT_FALSE(gs1::loadOptionsFromString("<gs1decoder><parser", options, &error));
    EXPECT_NE(error.find("Failed to parse options XML"), std::string::npos);

    EXPECT_FALSE(gs1::loadOptionsFromString("<options/>", options, &error));
    EXPECT_NE(error.find("Missing <gs1decoder> root element"), std::string::npos);

    EXPECT_FALSE(gs1::loadOptionsFromString(
        "<gs1decoder><parser strict=\"Y\"/><whitelist><ai code=\"10\"/></whitelist></gs1decoder>", options, &error));
    EXPECT_NE(error.find("not an internal-use AI"), std::string::npos);

    EXPECT_FALSE(gs1::loadOptionsFromString(
        "<gs1decoder><parser strict=\"Y\"/><beam width=\"0\"/></gs1decoder>", options, &error));
    EXPECT_NE(error.find("width"), std::string::npos);

    EXPECT_FALSE(gs1::loadOptionsFromString(
        "<gs1decoder><weights valid_gtin=\"lots\"/></gs1decoder>", options, &error));
    EXPECT_NE(error.find("valid_gtin"), std::string::npos);

    EXPECT_FALSE(gs1::loadOptionsFromString(
        "<gs1decoder><parser century_pivot=\"100\"/></gs1decoder>", options, &error));
    EXPECT_NE(error.find("century_pivot"), std::string::npos);

    EXPECT_FALSE(options.strict_mode);
    EXPECT_EQ(options.beam_width, 200U);
    EXPECT_DOUBLE_EQ(options.weights.valid_gtin, 1000.0);
    EXPECT_EQ(options.century_pivot, 51);
}
