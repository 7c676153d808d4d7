/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   include/gs1_validators.h
 * Description: Check digit, date, character set and decimal validators for GS1 values.
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

#ifndef GS1DECODER_GS1_VALIDATORS_H_INCLUDED
#define GS1DECODER_GS1_VALIDATORS_H_INCLUDED

#include "gs1_catalog.h"
#include "gs1_types.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gs1
{

/** Default two-digit-year pivot: `YY >= 51` resolves to 19YY, otherwise 20YY. */
inline constexpr int kDefaultCenturyPivot = 51;

/**
 * @brief Outcome of a validator. Validators never throw.
 */
struct ValidationResult
{
    bool                     valid = true;
    std::vector<std::string> errors;
    Metadata                 meta;

    /** Diagnostic code of each entry in `errors`. */
    std::vector<DiagnosticCode> codes;

    /** @brief Marks the result invalid and records `message` under `code`. */
    void fail(const DiagnosticCode code, std::string message)
    {
        valid = false;
        errors.push_back(std::move(message));
        codes.push_back(code);
    }

    /** @brief Folds another result into this one. */
    void merge(const ValidationResult &other)
    {
        valid = valid && other.valid;
        errors.insert(errors.end(), other.errors.begin(), other.errors.end());
        codes.insert(codes.end(), other.codes.begin(), other.codes.end());
        for(const auto &[key, value]: other.meta)
        {
            meta.insert_or_assign(key, value);
        }
    }
};

/**
 * @brief GS1 character sets for alphanumeric values.
 */
enum class Charset
{
    /** Broad set of 82 characters. */
    kCset82,
    /** Restricted set of 39 characters (`#-/0-9A-Z`). */
    kCset39
};

/** @brief Membership test for the given GS1 character set. */
bool isInCharset(char ch, Charset charset);

/** @brief `true` if `text` is non-empty and all ASCII digits. */
bool isAllDigits(std::string_view text);

/**
 * @brief Computes the GS1 Mod-10 check digit of a digit string.
 * @param digits Digits without the check digit.
 * @return The check digit, or `std::nullopt` if `digits` is empty or not numeric.
 */
std::optional<int> computeCheckDigit(std::string_view digits);

/**
 * @brief Validates the trailing Mod-10 check digit of `value`.
 *
 * Metadata: `calculated_check_digit`, `provided_check_digit`, `check_digit_valid`.
 */
ValidationResult validateCheckDigit(std::string_view value);

/**
 * @brief Number of characters a date format occupies.
 */
std::size_t dateLength(DateFormat format);

/**
 * @brief Validates and decodes a GS1 date.
 *
 * Metadata: `year`, `month`, `day`, `iso_date`, `date_ddmmyyyy`, plus `hour` for `kYYMMDDHH` and
 * `day_unspecified` when a `kYYMMD0` day of `00` was resolved to the last day of the month.
 *
 * @param value Date digits.
 * @param format Expected layout.
 * @param century_pivot Two-digit-year pivot.
 */
ValidationResult validateDate(std::string_view value, DateFormat format, int century_pivot = kDefaultCenturyPivot);

/**
 * @brief Validates a numeric value and its length.
 * @param fixed_length If set, exact length required; otherwise `[min_length, max_length]` (0 = unbounded).
 */
ValidationResult validateNumeric(std::string_view           value,
                                 std::size_t                min_length,
                                 std::size_t                max_length,
                                 std::optional<std::size_t> fixed_length = std::nullopt);

/**
 * @brief Validates an alphanumeric value against a GS1 character set and its length.
 */
ValidationResult validateAlphanumeric(std::string_view           value,
                                      std::size_t                min_length,
                                      std::size_t                max_length,
                                      std::optional<std::size_t> fixed_length = std::nullopt,
                                      Charset                    charset      = Charset::kCset82);

/**
 * @brief A value with implied decimal positions.
 */
struct DecimalValue
{
    double      value = 0.0;
    std::string display;
};

/**
 * @brief Decodes a digit string with `decimal_positions` implied decimals.
 *
 * `"001234"` with 2 positions gives 12.34 and `"0012.34"`.
 *
 * @return Decoded value, or `std::nullopt` for non-numeric input or a negative position count.
 */
std::optional<DecimalValue> decodeDecimal(std::string_view value, int decimal_positions);

/**
 * @brief Applies all rules of `definition` to `value`.
 * @return Combined length, data type, component layout, check digit, date and decimal result.
 */
ValidationResult validateValue(const AiDefinition &definition,
                               std::string_view    value,
                               int                 century_pivot = kDefaultCenturyPivot);

/**
 * @brief Validates `value` for `definition` and builds the parsed element.
 * @param start Offset of the AI code in the normalized input.
 * @param end One past the last value character.
 */
ParsedElement buildElement(const AiDefinition &definition,
                           std::string_view    value,
                           std::size_t         start,
                           std::size_t         end,
                           int                 century_pivot = kDefaultCenturyPivot);

}  // namespace gs1

#endif  // GS1DECODER_GS1_VALIDATORS_H_INCLUDED
