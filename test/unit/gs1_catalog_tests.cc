/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   test/unit/gs1_catalog_tests.cc
 * Description: GoogleTest suite for the AI catalog.
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

#include "gs1_catalog.h"
#include "gs1_test_utils.h"

#include <gtest/gtest.h>
#include <string>

namespace
{

const char *kMinimalTable = "<?xml version=\"1.0\"?>\n"
                            "<gs1 type=\"GS1\" version=\"test\">\n"
                            "  <ais>\n"
                            "    <ai code=\"01\" fixed=\"Y\" spec=\"N14,csum\" title=\"GTIN\"/>\n"
                            "    <ai code=\"10\" spec=\"X..20\" req=\"01\" title=\"BATCH/LOT\"/>\n"
                            "    <ai code=\"310n\" fixed=\"Y\" spec=\"N6\" req=\"01\" ex=\"320n\" title=\"NET WEIGHT (kg)\"/>\n"
                            "    <ai code=\"77\" spec=\"Q..5\" title=\"BROKEN SPEC\"/>\n"
                            "    <ai code=\"abc\" spec=\"N4\" title=\"BROKEN CODE\"/>\n"
                            "  </ais>\n"
                            "</gs1>\n";

gs1::AiDefinition makeDefinition(const std::string &code, std::size_t min_length, std::size_t max_length)
{
    gs1::AiDefinition definition;
    definition.code       = code;
    definition.title      = "TEST " + code;
    definition.min_length = min_length;
    definition.max_length = max_length;
    return definition;
}

}  // namespace

TEST(CatalogTest, EmbeddedCatalogIsBuiltOnce)
{
    const gs1::Catalog &first  = gs1::Catalog::instance();
    const gs1::Catalog &second = gs1::Catalog::instance();

    EXPECT_EQ(&first, &second);
    EXPECT_GT(first.size(), 400U);
    EXPECT_EQ(first.skippedRows(), 0U);
    EXPECT_EQ(first.type(), "GS1");
    EXPECT_FALSE(first.version().empty());
}

TEST(CatalogTest, BuildEmbeddedDoesNotTouchTheSharedInstance)
{
    std::string        error;
    const gs1::Catalog rebuilt = gs1::Catalog::buildEmbedded(&error);

    EXPECT_TRUE(error.empty()) << error;
    EXPECT_EQ(rebuilt.size(), gs1::Catalog::instance().size());
    EXPECT_NE(rebuilt.lookup("01"), gs1::Catalog::instance().lookup("01"));
}

TEST(CatalogTest, GtinIsFixedLengthWithCheckDigit)
{
    const gs1::AiDefinition *gtin = gs1::Catalog::instance().lookup("01");
    ASSERT_NE(gtin, nullptr);

    EXPECT_EQ(gtin->title, "GTIN");
    EXPECT_EQ(gtin->data_type, gs1::DataType::kNumeric);
    ASSERT_TRUE(gtin->isFixedLength());
    EXPECT_EQ(*gtin->fixed_length, 14U);
    EXPECT_TRUE(gtin->check_digit);
    EXPECT_FALSE(gtin->separator_required);
    EXPECT_TRUE(gtin->is_dlp_key);
}

TEST(CatalogTest, BatchIsVariableLengthAlphanumeric)
{
    const gs1::AiDefinition *batch = gs1::Catalog::instance().lookup("10");
    ASSERT_NE(batch, nullptr);

    EXPECT_EQ(batch->data_type, gs1::DataType::kAlphanumeric);
    EXPECT_FALSE(batch->isFixedLength());
    EXPECT_EQ(batch->min_length, 1U);
    EXPECT_EQ(batch->max_length, 20U);
    EXPECT_TRUE(batch->separator_required);
    EXPECT_FALSE(batch->required_ais.empty());
}

TEST(CatalogTest, ExpiryCarriesDayZeroDateFormat)
{
    const gs1::AiDefinition *expiry = gs1::Catalog::instance().lookup("17");
    ASSERT_NE(expiry, nullptr);
    EXPECT_EQ(expiry->date_format, gs1::DateFormat::kYYMMD0);
    EXPECT_FALSE(expiry->check_digit);
}

TEST(CatalogTest, MixedSyntaxKeepsComponents)
{
    const gs1::AiDefinition *document = gs1::Catalog::instance().lookup("253");
    ASSERT_NE(document, nullptr);
    ASSERT_EQ(document->components.size(), 2U);
    EXPECT_EQ(document->components[0].data_type, gs1::DataType::kNumeric);
    EXPECT_EQ(document->components[0].min_length, 13U);
    EXPECT_EQ(document->components[0].max_length, 13U);
    EXPECT_EQ(document->components[1].data_type, gs1::DataType::kAlphanumeric);
    EXPECT_EQ(document->components[1].min_length, 1U);
    EXPECT_EQ(document->components[1].max_length, 17U);
    EXPECT_EQ(document->data_type, gs1::DataType::kAlphanumeric);

    EXPECT_EQ(gs1::Catalog::instance().lookup("10")->components.size(), 1U);
}

TEST(CatalogTest, DecimalFamiliesExpandEagerly)
{
    const gs1::Catalog &catalog = gs1::Catalog::instance();

    for(int n = 0; n < 10; ++n)
    {
        const std::string        code       = "310" + std::to_string(n);
        const gs1::AiDefinition *definition = catalog.lookup(code);
        ASSERT_NE(definition, nullptr) << code;
        ASSERT_TRUE(definition->decimal_positions.has_value()) << code;
        EXPECT_EQ(*definition->decimal_positions, n) << code;
        EXPECT_EQ(definition->decimal_offset, 0U) << code;
    }

    const gs1::AiDefinition *price_with_currency = catalog.lookup("3932");
    ASSERT_NE(price_with_currency, nullptr);
    EXPECT_EQ(price_with_currency->decimal_offset, 3U);
    EXPECT_EQ(price_with_currency->min_length, 4U);
    EXPECT_EQ(price_with_currency->max_length, 18U);

    EXPECT_EQ(catalog.lookup("310"), nullptr);
}

TEST(CatalogTest, InternalRangeExpandsWithoutDecimals)
{
    const gs1::Catalog &catalog = gs1::Catalog::instance();
    for(int n = 90; n <= 99; ++n)
    {
        const gs1::AiDefinition *definition = catalog.lookup(std::to_string(n));
        ASSERT_NE(definition, nullptr) << n;
        EXPECT_FALSE(definition->decimal_positions.has_value()) << n;
    }
    EXPECT_EQ(catalog.lookup("91")->max_length, 90U);
    EXPECT_EQ(catalog.lookup("9"), nullptr);
}

TEST(CatalogTest, LongestMatchPrefersRegisteredPrefix)
{
    const gs1::Catalog &catalog = gs1::Catalog::instance();

    const gs1::AiMatch weight = catalog.longestMatch("3103000125");
    ASSERT_TRUE(weight);
    EXPECT_EQ(weight.definition->code, "3103");
    EXPECT_EQ(weight.length, 4U);

    const gs1::AiMatch batch = catalog.longestMatch("xx10ABC", 2);
    ASSERT_TRUE(batch);
    EXPECT_EQ(batch.definition->code, "10");

    EXPECT_FALSE(catalog.longestMatch("5"));
    EXPECT_FALSE(catalog.longestMatch("ABC"));
    EXPECT_FALSE(catalog.longestMatch("01", 2));
}

TEST(CatalogTest, AllMatchesReturnsShorterSubMatches)
{
    gs1::Catalog catalog;
    catalog.add(makeDefinition("12", 1, 10));
    catalog.add(makeDefinition("123", 1, 10));
    catalog.add(makeDefinition("1234", 1, 10));

    const auto matches = catalog.allMatches("123456");
    ASSERT_EQ(matches.size(), 3U);
    EXPECT_EQ(matches[0].definition->code, "1234");
    EXPECT_EQ(matches[1].definition->code, "123");
    EXPECT_EQ(matches[2].definition->code, "12");

    EXPECT_EQ(catalog.longestMatch("1239").definition->code, "123");
}

TEST(CatalogTest, AddReplacesExistingDefinition)
{
    gs1::Catalog catalog;
    catalog.add(makeDefinition("12", 1, 10));
    catalog.add(makeDefinition("12", 2, 4));

    EXPECT_EQ(catalog.size(), 1U);
    const gs1::AiDefinition *definition = catalog.lookup("12");
    ASSERT_NE(definition, nullptr);
    EXPECT_EQ(definition->max_length, 4U);
    EXPECT_EQ(catalog.longestMatch("12AB").definition, definition);
}

TEST(CatalogTest, LoadsFileAndSkipsMalformedRows)
{
    gs1::test::TempDir temp;
    const auto         xml_path = temp.path() / "ai_table.xml";
    ASSERT_TRUE(gs1::test::writeFile(xml_path, kMinimalTable));

    gs1::Catalog catalog;
    std::string  error;
    ASSERT_TRUE(catalog.loadFromFile(xml_path.string(), &error)) << error;

    EXPECT_EQ(catalog.version(), "test");
    EXPECT_EQ(catalog.size(), 12U);
    EXPECT_EQ(catalog.skippedRows(), 2U);

    const gs1::AiDefinition *weight = catalog.lookup("3105");
    ASSERT_NE(weight, nullptr);
    EXPECT_EQ(weight->title, "NET WEIGHT (kg)");
    ASSERT_EQ(weight->exclusive_ais.size(), 1U);
    EXPECT_EQ(weight->exclusive_ais.front(), "320n");
    EXPECT_EQ(catalog.lookup("77"), nullptr);
}

TEST(CatalogTest, ReportsUnreadableInput)
{
    gs1::Catalog catalog;
    std::string  error;

    EXPECT_FALSE(catalog.loadFromFile("/nonexistent/ai_table.xml", &error));
    EXPECT_NE(error.find("Failed to load XML"), std::string::npos);

    EXPECT_FALSE(catalog.loadFromString("<gs1><ais>", &error));
    EXPECT_NE(error.find("Failed to parse AI table XML"), std::string::npos);

    EXPECT_FALSE(catalog.loadFromString("<fix/>", &error));
    EXPECT_NE(error.find("Missing <gs1> root element"), std::string::npos);

    EXPECT_FALSE(catalog.loadFromString("<gs1 type=\"GS1\"/>", &error));
    EXPECT_NE(error.find("Missing <ais> element"), std::string::npos);
    EXPECT_EQ(catalog.size(), 0U);
}

TEST(CatalogTest, CompanionEntriesMatchFamilies)
{
    EXPECT_TRUE(gs1::Catalog::companionMatches("320n", "3203"));
    EXPECT_FALSE(gs1::Catalog::companionMatches("320n", "320"));
    EXPECT_FALSE(gs1::Catalog::companionMatches("320n", "3103"));
    EXPECT_TRUE(gs1::Catalog::companionMatches("01", "01"));
    EXPECT_FALSE(gs1::Catalog::companionMatches("01", "02"));
}

TEST(CatalogTest, YesAttributeParsing)
{
    EXPECT_TRUE(gs1::Catalog::isYesAttr("Y"));
    EXPECT_TRUE(gs1::Catalog::isYesAttr("y"));
    EXPECT_FALSE(gs1::Catalog::isYesAttr("N"));
    EXPECT_FALSE(gs1::Catalog::isYesAttr(nullptr));
}
