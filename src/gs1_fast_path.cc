/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   src/gs1_fast_path.cc
 * Description: Deterministic left-to-right parser for separator-bearing GS1 element strings.
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

#include "gs1_validators.h"

#include <algorithm>

namespace gs1
{

FastPathParser::FastPathParser(const Catalog &catalog, const ParseOptions &options)
: catalog_(catalog)
, options_(options)
{
}

bool FastPathParser::hidesAnotherAi(const std::string_view remaining, const AiDefinition &definition) const
{
    const std::size_t max_check = std::min(definition.max_length, remaining.size());
    for(std::size_t check_len = definition.min_length; check_len < max_check; ++check_len)
    {
        const std::string_view potential_next = remaining.substr(check_len);
        if(potential_next.size() >= Catalog::kMinCodeLength && catalog_.longestMatch(potential_next))
        {
            return true;
        }
    }
    return false;
}

FastPathResult FastPathParser::parse(const std::string_view text, const bool separator_seen) const
{
    FastPathResult result;
    bool           previous_requires_separator = true;
    std::size_t    pos                         = 0;

    while(pos < text.size())
    {
        // SCAN
        if(text[pos] == kGroupSeparator)
        {
            if(!result.elements.empty() && !previous_requires_separator)
            {
                const std::size_t next_pos = pos + 1;
                if(next_pos >= text.size() || !catalog_.longestMatch(text, next_pos))
                {
                    result.diagnostics.push_back(Diagnostic{DiagnosticCode::kExtraSeparator,
                                                            Severity::kError,
                                                            "Superfluous GS after fixed-length AI",
                                                            pos,
                                                            {},
                                                            std::nullopt});
                }
            }
            ++pos;
            continue;
        }

        // MATCH_AI
        const AiMatch match = catalog_.longestMatch(text, pos);
        if(!match)
        {
            result.diagnostics.push_back(
                Diagnostic{DiagnosticCode::kUnknownAi,
                           Severity::kError,
                           "Unknown AI at position " + std::to_string(pos) + ": " + std::string(text.substr(pos, 4)),
                           pos,
                           {},
                           std::nullopt});
            const std::size_t next_gs = text.find(kGroupSeparator, pos);
            pos                       = (next_gs == std::string_view::npos) ? text.size() : next_gs + 1;
            continue;
        }

        const AiDefinition &definition = *match.definition;
        const std::size_t   ai_start   = pos;
        pos += match.length;

        // CONSUME
        std::string_view value;
        std::size_t      value_end = pos;
        if(definition.isFixedLength())
        {
            std::size_t data_len = *definition.fixed_length;
            if(pos + data_len > text.size())
            {
                result.diagnostics.push_back(Diagnostic{DiagnosticCode::kTruncatedData,
                                                        Severity::kError,
                                                        "Truncated data for AI " + definition.code,
                                                        pos,
                                                        definition.code,
                                                        std::nullopt});
                data_len = text.size() - pos;
            }
            value     = text.substr(pos, data_len);
            pos += data_len;
            value_end = pos;
        }
        else
        {
            const std::size_t next_gs = text.find(kGroupSeparator, pos);
            if(next_gs != std::string_view::npos)
            {
                value     = text.substr(pos, next_gs - pos);
                value_end = next_gs;
                pos       = next_gs + 1;
            }
            else
            {
                const std::string_view remaining = text.substr(pos);
                if(hidesAnotherAi(remaining, definition))
                {
                    result.needs_solver = true;
                    if(separator_seen)
                    {
                        result.diagnostics.push_back(
                            Diagnostic{DiagnosticCode::kMissingSeparator,
                                       Severity::kWarning,
                                       "AI(" + definition.code + ") variable-length followed by another AI without GS",
                                       pos,
                                       definition.code,
                                       std::nullopt});
                    }
                    // Provisional maximal length; the solver decides the real boundary.
                    value = remaining.substr(0, std::min(definition.max_length, remaining.size()));
                }
                else
                {
                    value = remaining;
                }
                pos += value.size();
                value_end = pos;
            }
        }

        result.elements.push_back(buildElement(definition, value, ai_start, value_end, options_.century_pivot));
        previous_requires_separator = definition.separator_required;
    }

    return result;
}

double FastPathParser::confidence(const FastPathResult &result)
{
    const auto problems = static_cast<double>(std::ranges::count_if(
        result.diagnostics, [](const Diagnostic &diagnostic) { return diagnostic.severity == Severity::kError; }));
    double confidence = (problems > 0.0) ? 0.9 - problems * 0.05 : 1.0;
    if(!result.elements.empty())
    {
        const auto valid = static_cast<double>(
            std::ranges::count_if(result.elements, [](const ParsedElement &element) { return element.valid; }));
        confidence *= 0.8 + 0.2 * (valid / static_cast<double>(result.elements.size()));
    }
    return std::clamp(confidence, 0.0, 1.0);
}

}  // namespace gs1
