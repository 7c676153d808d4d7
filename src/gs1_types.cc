/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   src/gs1_types.cc
 * Description: Helpers of the shared GS1 result types.
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

#include "gs1_types.h"

#include <algorithm>

namespace gs1
{

std::string_view toString(const DiagnosticCode code)
{
    switch(code)
    {
        case DiagnosticCode::kUnknownAi:
            return "UNKNOWN_AI";
        case DiagnosticCode::kInvalidLength:
            return "INVALID_LENGTH";
        case DiagnosticCode::kInvalidFormat:
            return "INVALID_FORMAT";
        case DiagnosticCode::kInvalidCheckDigit:
            return "INVALID_CHECK_DIGIT";
        case DiagnosticCode::kInvalidDate:
            return "INVALID_DATE";
        case DiagnosticCode::kMissingSeparator:
            return "MISSING_SEPARATOR";
        case DiagnosticCode::kAmbiguousParse:
            return "AMBIGUOUS_PARSE";
        case DiagnosticCode::kExtraSeparator:
            return "EXTRA_SEPARATOR";
        case DiagnosticCode::kTruncatedData:
            return "TRUNCATED_DATA";
    }
    return "INVALID_FORMAT";
}

std::string_view toString(const ParseEngine engine)
{
    switch(engine)
    {
        case ParseEngine::kNone:
            return "none";
        case ParseEngine::kFastPath:
            return "fast-path";
        case ParseEngine::kSolver:
            return "solver";
        case ParseEngine::kBeam:
            return "beam";
    }
    return "none";
}

const ParsedElement *ParseResult::find(const std::string_view ai) const
{
    const auto it = std::ranges::find_if(elements, [ai](const ParsedElement &element) { return element.ai == ai; });
    if(it == elements.end())
    {
        return nullptr;
    }
    return &*it;
}

bool ParseResult::hasDiagnostic(const DiagnosticCode code) const
{
    return std::ranges::any_of(diagnostics, [code](const Diagnostic &diagnostic) { return diagnostic.code == code; });
}

std::vector<std::string> ParseResult::aiSequence() const
{
    std::vector<std::string> sequence;
    sequence.reserve(elements.size());
    for(const auto &element: elements)
    {
        sequence.push_back(element.ai);
    }
    return sequence;
}

}  // namespace gs1
