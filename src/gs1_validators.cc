/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   src/gs1_validators.cc
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

#include "gs1_validators.h"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace gs1
{

namespace
{

    int parseDigits(const std::string_view text)
    {
        int value            = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if(ec != std::errc{} || ptr != text.data() + text.size())
        {
            return -1;
        }
        return value;
    }

    int resolveYear(const int yy, const int century_pivot)
    {
        return (yy >= century_pivot) ? 1900 + yy : 2000 + yy;
    }

    int lastDayOfMonth(const int year, const int month)
    {
        const std::chrono::year_month_day_last ymdl{std::chrono::year{year},
                                                    std::chrono::month_day_last{
                                                        std::chrono::month{static_cast<unsigned>(month)}}};
        return static_cast<int>(static_cast<unsigned>(ymdl.day()));
    }

    std::string formatIsoDate(const int year, const int month, const int day)
    {
        std::ostringstream out;
        out << std::setfill('0') << std::setw(4) << year << '-' << std::setw(2) << month << '-' << std::setw(2)
            << day;
        return out.str();
    }

    std::string formatDayFirst(const int year, const int month, const int day)
    {
        std::ostringstream out;
        out << std::setfill('0') << std::setw(2) << day << '/' << std::setw(2) << month << '/' << std::setw(4)
            << year;
        return out.str();
    }

    void checkLength(ValidationResult                &result,
                     const std::size_t                length,
                     const std::size_t                min_length,
                     const std::size_t                max_length,
                     const std::optional<std::size_t> fixed_length)
    {
        if(fixed_length)
        {
            if(length != *fixed_length)
            {
                result.fail(DiagnosticCode::kInvalidLength,
                            "Length must be exactly " + std::to_string(*fixed_length) + ", got "
                                + std::to_string(length));
            }
            return;
        }
        if(min_length != 0 && length < min_length)
        {
            result.fail(DiagnosticCode::kInvalidLength,
                        "Length " + std::to_string(length) + " below minimum " + std::to_string(min_length));
        }
        if(max_length != 0 && length > max_length)
        {
            result.fail(DiagnosticCode::kInvalidLength,
                        "Length " + std::to_string(length) + " exceeds maximum " + std::to_string(max_length));
        }
    }

    std::string_view dateFormatName(const DateFormat format)
    {
        switch(format)
        {
            case DateFormat::kYYMMDD:
                return "YYMMDD";
            case DateFormat::kYYMMD0:
                return "YYMMD0";
            case DateFormat::kYYYYMMDD:
                return "YYYYMMDD";
            case DateFormat::kYYMMDDHH:
                return "YYMMDDHH";
            case DateFormat::kNone:
                break;
        }
        return "NONE";
    }

    // Greedy split: every component takes as much as the minimum of the ones after it leaves.
    bool matchesComponents(const std::vector<ValueComponent> &components, const std::string_view value)
    {
        std::size_t rest_min = 0;
        for(const ValueComponent &component: components)
        {
            rest_min += component.min_length;
        }

        std::size_t pos = 0;
        for(const ValueComponent &component: components)
        {
            rest_min -= component.min_length;
            const std::size_t remaining = value.size() - pos;
            if(remaining < component.min_length + rest_min)
            {
                return false;
            }
            const std::size_t      take  = std::min(component.max_length, remaining - rest_min);
            const std::string_view chunk = value.substr(pos, take);
            if(component.data_type == DataType::kNumeric && !isAllDigits(chunk))
            {
                return false;
            }
            pos += take;
        }
        return pos == value.size();
    }

}  // namespace

bool isInCharset(const char ch, const Charset charset)
{
    if(charset == Charset::kCset39)
    {
        return (ch >= '0' && ch <= '9') || (ch >= 'A' && ch <= 'Z') || ch == '#' || ch == '-' || ch == '/';
    }

    // CSET82 is the contiguous printable range 0x21..0x7d.
    return ch >= '!' && ch <= '}';
}

bool isAllDigits(const std::string_view text)
{
    return !text.empty() && std::ranges::all_of(text, [](const char c) { return c >= '0' && c <= '9'; });
}

std::optional<int> computeCheckDigit(const std::string_view digits)
{
    if(!isAllDigits(digits))
    {
        return std::nullopt;
    }

    int  total  = 0;
    bool triple = true;
    for(auto it = digits.rbegin(); it != digits.rend(); ++it)
    {
        total += (*it - '0') * (triple ? 3 : 1);
        triple = !triple;
    }
    return (10 - (total % 10)) % 10;
}

ValidationResult validateCheckDigit(const std::string_view value)
{
    ValidationResult result;
    if(!isAllDigits(value))
    {
        result.fail(DiagnosticCode::kInvalidFormat, "Value must be numeric for check digit validation");
        return result;
    }
    if(value.size() < 2)
    {
        result.fail(DiagnosticCode::kInvalidLength, "Value too short for check digit validation");
        return result;
    }

    const int calculated = computeCheckDigit(value.substr(0, value.size() - 1)).value_or(-1);
    const int provided   = value.back() - '0';

    result.meta["calculated_check_digit"] = static_cast<std::int64_t>(calculated);
    result.meta["provided_check_digit"]   = static_cast<std::int64_t>(provided);
    result.meta["check_digit_valid"]      = (calculated == provided);

    if(calculated != provided)
    {
        result.fail(DiagnosticCode::kInvalidCheckDigit,
                    "Check digit mismatch: expected " + std::to_string(calculated) + ", got "
                        + std::to_string(provided));
    }
    return result;
}

std::size_t dateLength(const DateFormat format)
{
    switch(format)
    {
        case DateFormat::kYYMMDD:
        case DateFormat::kYYMMD0:
            return 6;
        case DateFormat::kYYYYMMDD:
        case DateFormat::kYYMMDDHH:
            return 8;
        case DateFormat::kNone:
            break;
    }
    return 0;
}

ValidationResult validateDate(const std::string_view value, const DateFormat format, const int century_pivot)
{
    ValidationResult result;
    if(format == DateFormat::kNone)
    {
        result.fail(DiagnosticCode::kInvalidDate, "Unknown date format");
        return result;
    }
    if(!isAllDigits(value))
    {
        result.fail(DiagnosticCode::kInvalidDate, "Date must be numeric");
        return result;
    }
    if(value.size() != dateLength(format))
    {
        result.fail(DiagnosticCode::kInvalidDate,
                    std::string(dateFormatName(format)) + " date must be " + std::to_string(dateLength(format))
                        + " digits, got " + std::to_string(value.size()));
        return result;
    }

    int         year   = 0;
    std::size_t offset = 0;
    if(format == DateFormat::kYYYYMMDD)
    {
        year   = parseDigits(value.substr(0, 4));
        offset = 4;
    }
    else
    {
        year   = resolveYear(parseDigits(value.substr(0, 2)), century_pivot);
        offset = 2;
    }
    const int month = parseDigits(value.substr(offset, 2));
    int       day   = parseDigits(value.substr(offset + 2, 2));

    if(month < 1 || month > 12)
    {
        result.fail(DiagnosticCode::kInvalidDate, "Invalid month: " + std::to_string(month));
        return result;
    }

    const int last_day = lastDayOfMonth(year, month);
    if(day == 0 && format == DateFormat::kYYMMD0)
    {
        result.meta["day_unspecified"] = true;
        day                            = last_day;
    }
    else if(day < 1 || day > 31)
    {
        result.fail(DiagnosticCode::kInvalidDate, "Invalid day: " + std::to_string(day));
        return result;
    }
    else if(day > last_day)
    {
        result.fail(DiagnosticCode::kInvalidDate,
                    "Day " + std::to_string(day) + " invalid for month " + std::to_string(month) + " in year "
                        + std::to_string(year));
        return result;
    }

    int hour = 0;
    if(format == DateFormat::kYYMMDDHH)
    {
        hour = parseDigits(value.substr(6, 2));
        if(hour > 23)
        {
            result.fail(DiagnosticCode::kInvalidDate, "Invalid hour: " + std::to_string(hour));
            return result;
        }
    }

    result.meta["year"]          = static_cast<std::int64_t>(year);
    result.meta["month"]         = static_cast<std::int64_t>(month);
    result.meta["day"]           = static_cast<std::int64_t>(day);
    result.meta["iso_date"]      = formatIsoDate(year, month, day);
    result.meta["date_ddmmyyyy"] = formatDayFirst(year, month, day);

    if(format == DateFormat::kYYMMDDHH)
    {
        std::ostringstream iso_datetime;
        iso_datetime << formatIsoDate(year, month, day) << 'T' << std::setfill('0') << std::setw(2) << hour
                     << ":00:00";
        result.meta["hour"]         = static_cast<std::int64_t>(hour);
        result.meta["iso_datetime"] = iso_datetime.str();
    }
    return result;
}

ValidationResult validateNumeric(const std::string_view           value,
                                 const std::size_t                min_length,
                                 const std::size_t                max_length,
                                 const std::optional<std::size_t> fixed_length)
{
    ValidationResult result;
    if(value.empty())
    {
        if(min_length > 0 || fixed_length.value_or(0) > 0)
        {
            result.fail(DiagnosticCode::kInvalidLength, "Value is empty but minimum length required");
        }
        return result;
    }
    if(!isAllDigits(value))
    {
        result.fail(DiagnosticCode::kInvalidFormat, "Value contains non-numeric characters");
        return result;
    }
    checkLength(result, value.size(), min_length, max_length, fixed_length);
    return result;
}

ValidationResult validateAlphanumeric(const std::string_view           value,
                                      const std::size_t                min_length,
                                      const std::size_t                max_length,
                                      const std::optional<std::size_t> fixed_length,
                                      const Charset                    charset)
{
    ValidationResult result;
    if(value.empty())
    {
        if(min_length > 0 || fixed_length.value_or(0) > 0)
        {
            result.fail(DiagnosticCode::kInvalidLength, "Value is empty but minimum length required");
        }
        return result;
    }

    std::string invalid;
    for(const char ch: value)
    {
        if(!isInCharset(ch, charset) && invalid.find(ch) == std::string::npos)
        {
            invalid.push_back(ch);
        }
    }
    if(!invalid.empty())
    {
        result.fail(DiagnosticCode::kInvalidFormat, "Invalid characters: '" + invalid + "'");
    }
    checkLength(result, value.size(), min_length, max_length, fixed_length);
    return result;
}

std::optional<DecimalValue> decodeDecimal(const std::string_view value, const int decimal_positions)
{
    if(!isAllDigits(value) || decimal_positions < 0)
    {
        return std::nullopt;
    }

    DecimalValue decoded;
    if(decimal_positions == 0)
    {
        decoded.display = std::string(value);
    }
    else
    {
        const auto  positions = static_cast<std::size_t>(decimal_positions);
        std::string digits(value);
        if(digits.size() <= positions)
        {
            digits.insert(0, positions + 1 - digits.size(), '0');
        }
        decoded.display = digits.substr(0, digits.size() - positions) + "." + digits.substr(digits.size() - positions);
    }

    const char *first = decoded.display.data();
    const char *last  = first + decoded.display.size();
    const auto [ptr, ec] = std::from_chars(first, last, decoded.value);
    if(ec != std::errc{} || ptr != last)
    {
        return std::nullopt;
    }
    return decoded;
}

ValidationResult validateValue(const AiDefinition &definition, const std::string_view value, const int century_pivot)
{
    ValidationResult result;
    if(definition.data_type == DataType::kNumeric)
    {
        result.merge(validateNumeric(value, definition.min_length, definition.max_length, definition.fixed_length));
    }
    else
    {
        result.merge(
            validateAlphanumeric(value, definition.min_length, definition.max_length, definition.fixed_length));
    }

    if(result.valid && definition.components.size() > 1 && !matchesComponents(definition.components, value))
    {
        result.fail(DiagnosticCode::kInvalidFormat, "Value does not match expected format");
    }

    const bool digits = isAllDigits(value);
    if(definition.check_digit && digits && value.size() >= 2)
    {
        result.merge(validateCheckDigit(value));
    }

    if(definition.date_format != DateFormat::kNone)
    {
        const std::size_t date_len = dateLength(definition.date_format);
        if(value.size() >= date_len)
        {
            result.merge(validateDate(value.substr(0, date_len), definition.date_format, century_pivot));
        }
        else
        {
            result.fail(DiagnosticCode::kInvalidDate,
                        "Date needs " + std::to_string(date_len) + " digits, got " + std::to_string(value.size()));
        }
    }

    if(definition.decimal_positions && value.size() > definition.decimal_offset)
    {
        const auto decoded = decodeDecimal(value.substr(definition.decimal_offset), *definition.decimal_positions);
        if(decoded)
        {
            result.meta["decimal_value"]     = decoded->value;
            result.meta["decimal_formatted"] = decoded->display;
            result.meta["decimal_positions"] = static_cast<std::int64_t>(*definition.decimal_positions);
        }
    }
    return result;
}

ParsedElement buildElement(const AiDefinition    &definition,
                           const std::string_view value,
                           const std::size_t      start,
                           const std::size_t      end,
                           const int              century_pivot)
{
    ValidationResult validation = validateValue(definition, value, century_pivot);

    ParsedElement element;
    element.ai          = definition.code;
    element.title       = definition.title;
    element.raw_value   = std::string(value);
    element.valid       = validation.valid;
    element.errors      = std::move(validation.errors);
    element.error_codes = std::move(validation.codes);
    element.meta        = std::move(validation.meta);
    element.start       = start;
    element.end         = end;

    if(definition.date_format == DateFormat::kYYMMD0 && element.metaFlag("day_unspecified"))
    {
        element.meta["unknown_day"] = true;
    }

    if(const auto *iso_datetime = element.metaAs<std::string>("iso_datetime"))
    {
        element.value = *iso_datetime;
    }
    else if(const auto *iso_date = element.metaAs<std::string>("iso_date"))
    {
        element.value = *iso_date;
    }
    else if(const auto *decimal = element.metaAs<double>("decimal_value"))
    {
        element.value = *decimal;
    }
    else
    {
        element.value = element.raw_value;
    }
    return element;
}

}  // namespace gs1
