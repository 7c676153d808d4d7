/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   include/gs1_types.h
 * Description: Element, diagnostic and result types shared by all GS1 parsers.
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

#ifndef GS1DECODER_GS1_TYPES_H_INCLUDED
#define GS1DECODER_GS1_TYPES_H_INCLUDED

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gs1
{

/** ASCII group separator (FNC1 as transmitted by scanners). */
inline constexpr char kGroupSeparator = 0x1d;

/**
 * @brief Metadata value attached to a parsed element (check digit outcome, date parts, decimal value).
 */
using MetaValue = std::variant<bool, std::int64_t, double, std::string>;

/**
 * @brief Ordered metadata map of a parsed element.
 */
using Metadata = std::map<std::string, MetaValue>;

/**
 * @brief Normalized typed value of an element.
 *
 * Dates normalize to an ISO date string, decimal-position AIs to a double, everything else keeps the
 * raw string. `std::monostate` marks a value that could not be normalized.
 */
using ElementValue = std::variant<std::monostate, std::string, double>;

/**
 * @brief Diagnostic codes reported by the parsers.
 */
enum class DiagnosticCode
{
    kUnknownAi,
    kInvalidLength,
    kInvalidFormat,
    kInvalidCheckDigit,
    kInvalidDate,
    kMissingSeparator,
    kAmbiguousParse,
    kExtraSeparator,
    kTruncatedData
};

/**
 * @brief One decoded AI element of a GS1 element string.
 */
struct ParsedElement
{
    /** Application identifier code (for example `01`). */
    std::string ai;
    /** Catalog title of the AI, empty if unknown. */
    std::string title;
    /** Raw value substring as found in the normalized input. */
    std::string raw_value;
    /** Normalized typed value. */
    ElementValue value;
    /** `true` when all validators accepted the value. */
    bool valid = true;
    /** Human-readable validation errors. */
    std::vector<std::string> errors;
    /** Diagnostic code of each entry in `errors`. */
    std::vector<DiagnosticCode> error_codes;
    /** Validator metadata. */
    Metadata meta;
    /** Offset of the AI code in the normalized input. */
    std::size_t start = 0;
    /** One past the last value character in the normalized input. */
    std::size_t end = 0;

    /**
     * @brief Typed metadata accessor.
     * @tparam T Requested alternative of `MetaValue`.
     * @param key Metadata key.
     * @return Pointer to the value, or `nullptr` if missing or of another type.
     */
    template<typename T>
    const T *metaAs(const std::string &key) const
    {
        const auto it = meta.find(key);
        if(it == meta.end())
        {
            return nullptr;
        }
        return std::get_if<T>(&it->second);
    }

    /** @brief Returns `true` if the boolean metadata flag `key` is present and set. */
    bool metaFlag(const std::string &key) const
    {
        const bool *flag = metaAs<bool>(key);
        return flag && *flag;
    }
};

/** @brief Distinguishes hard problems from informational warnings. */
enum class Severity
{
    kError,
    kWarning
};

/**
 * @brief A coded parse diagnostic.
 */
struct Diagnostic
{
    DiagnosticCode code     = DiagnosticCode::kInvalidFormat;
    Severity       severity = Severity::kError;
    /** Human-readable message. */
    std::string message;
    /** Offset in the normalized input, if the problem has a position. */
    std::optional<std::size_t> at_index;
    /** AI the problem relates to, empty if none. */
    std::string ai;
    /** Number of alternative parses (ambiguity diagnostics only). */
    std::optional<std::size_t> alternatives;
};

/**
 * @brief Upper-case wire name of a diagnostic code (for example `MISSING_SEPARATOR`).
 */
std::string_view toString(DiagnosticCode code);

/**
 * @brief Engine that produced a parse result.
 */
enum class ParseEngine
{
    /** Nothing was parsed (empty input). */
    kNone,
    /** Deterministic left-to-right scan. */
    kFastPath,
    /** Memoized ambiguity solver. */
    kSolver,
    /** Scored beam search for separator-free input. */
    kBeam
};

std::string_view toString(ParseEngine engine);

/**
 * @brief An alternative interpretation kept next to the best parse.
 */
struct Alternative
{
    /** Confidence in [0,1] relative to the best parse. */
    double confidence = 0.0;
    /** Raw engine score (beam score or solver path score). */
    double score = 0.0;
    std::vector<ParsedElement> elements;
    /** Reasoning trail or boundary notes that produced this alternative. */
    std::vector<std::string> notes;
};

/**
 * @brief Complete result of decoding one GS1 element string.
 */
struct ParseResult
{
    /** Input exactly as given. */
    std::string raw;
    /** Input after symbology stripping, separator normalization and trimming. */
    std::string normalized;
    /** `true` if an ISO/IEC 15424 symbology identifier was stripped. */
    bool symbology_removed = false;
    /** The stripped identifier (for example `]d2`), empty if none. */
    std::string symbology_identifier;
    /** Human-readable symbology name (for example `GS1 DataMatrix`), empty if none. */
    std::string symbology_name;
    /** `true` if the input contained a separator or one of its stand-ins. */
    bool separator_seen = false;
    /** Best element sequence. */
    std::vector<ParsedElement> elements;
    /** Coded errors and warnings. */
    std::vector<Diagnostic> diagnostics;
    /** Bounded list of alternative parses. */
    std::vector<Alternative> alternatives;
    /** Overall confidence in [0,1]. */
    double confidence = 1.0;
    /** Engine that produced `elements`. */
    ParseEngine engine = ParseEngine::kNone;
    /** Companion-AI (`req`/`ex`) check status. */
    bool structurally_valid = true;
    /** Human-readable companion-AI violations when `structurally_valid` is `false`. */
    std::vector<std::string> validation_errors;
    /** Human-readable engine decisions emitted during decoding (for logs/tests). */
    std::vector<std::string> events;

    /**
     * @brief Finds the first element with the given AI.
     * @return Pointer to the element, or `nullptr` if the AI was not decoded.
     */
    const ParsedElement *find(std::string_view ai) const;

    /** @brief Returns `true` if any diagnostic carries `code`. */
    bool hasDiagnostic(DiagnosticCode code) const;

    /** @brief AI codes of `elements` in order. */
    std::vector<std::string> aiSequence() const;
};

}  // namespace gs1

#endif  // GS1DECODER_GS1_TYPES_H_INCLUDED
