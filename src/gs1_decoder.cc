/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   src/gs1_decoder.cc
 * Description: Decoder front end that normalizes input, selects an engine and assembles the result.
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

#include "gs1_decoder.h"

#include "gs1_fast_path.h"
#include "gs1_no_separator.h"
#include "gs1_solver.h"

#include <algorithm>
#include <array>
#include <sstream>
#include <utility>

namespace gs1
{

namespace
{

    constexpr std::array<Symbology, 6> kSymbologies{{{"]d2", "GS1 DataMatrix"},
                                                     {"]C1", "GS1-128"},
                                                     {"]e0", "GS1 DataBar"},
                                                     {"]e1", "GS1 DataBar Limited"},
                                                     {"]e2", "GS1 DataBar Expanded"},
                                                     {"]Q3", "GS1 QR Code"}}};

    constexpr std::string_view kGsPlaceholder = "<GS>";
    constexpr std::string_view kSeparatorSet  = "\x1d~|^";
    // Separators at either end terminate nothing and are trimmed like whitespace.
    constexpr std::string_view kWhitespace    = " \t\r\n\v\f\x1c\x1d\x1e\x1f";

    // Confidence of a fast-path guess that the solver did not confirm.
    constexpr double kUnresolvedConfidence = 0.5;

    std::string_view trim(std::string_view text)
    {
        const auto first = text.find_first_not_of(kWhitespace);
        if(first == std::string_view::npos)
        {
            return {};
        }
        const auto last = text.find_last_not_of(kWhitespace);
        return text.substr(first, last - first + 1);
    }

    std::string joinCodes(const std::vector<std::string> &codes)
    {
        std::string joined;
        for(const std::string &code: codes)
        {
            if(!joined.empty())
            {
                joined += ", ";
            }
            joined += code;
        }
        return joined;
    }

    std::string formatScore(const double score)
    {
        std::ostringstream out;
        out << score;
        return out.str();
    }

    void noValidParse(ParseResult &result)
    {
        result.elements.clear();
        result.confidence = 0.0;
        result.diagnostics.push_back(
            Diagnostic{DiagnosticCode::kInvalidFormat, Severity::kError, "No valid parse found", {}, {}, std::nullopt});
    }

    void attachElementDiagnostics(ParseResult &result)
    {
        for(const ParsedElement &element: result.elements)
        {
            for(std::size_t idx = 0; idx < element.errors.size(); ++idx)
            {
                const DiagnosticCode code =
                    idx < element.error_codes.size() ? element.error_codes[idx] : DiagnosticCode::kInvalidFormat;
                result.diagnostics.push_back(Diagnostic{code,
                                                        Severity::kError,
                                                        "AI(" + element.ai + "): " + element.errors[idx],
                                                        element.start,
                                                        element.ai,
                                                        std::nullopt});
            }
        }
    }

}  // namespace

Decoder::Decoder(ParseOptions options)
: catalog_(Catalog::instance())
, options_(std::move(options))
{
}

Decoder::Decoder(const Catalog &catalog, ParseOptions options)
: catalog_(catalog)
, options_(std::move(options))
{
}

std::optional<Symbology> Decoder::detectSymbology(const std::string_view text)
{
    for(const Symbology &symbology: kSymbologies)
    {
        if(text.starts_with(symbology.identifier))
        {
            return symbology;
        }
    }
    return std::nullopt;
}

bool Decoder::containsSeparator(const std::string_view text)
{
    return text.find_first_of(kSeparatorSet) != std::string_view::npos
           || text.find(kGsPlaceholder) != std::string_view::npos;
}

std::string Decoder::normalizeSeparators(const std::string_view text)
{
    std::string normalized;
    normalized.reserve(text.size());
    std::size_t pos = 0;
    while(pos < text.size())
    {
        if(text.substr(pos).starts_with(kGsPlaceholder))
        {
            normalized += kGroupSeparator;
            pos += kGsPlaceholder.size();
            continue;
        }
        const char chr = text[pos];
        normalized += (kSeparatorSet.find(chr) != std::string_view::npos) ? kGroupSeparator : chr;
        ++pos;
    }
    return normalized;
}

std::vector<std::string> Decoder::checkCompanions(const std::vector<ParsedElement> &elements,
                                                  const Catalog                    &catalog)
{
    std::vector<std::string> violations;

    const auto present = [&elements](const std::string &entry, const std::string &self) {
        return std::ranges::any_of(elements, [&entry, &self](const ParsedElement &other) {
            return other.ai != self && Catalog::companionMatches(entry, other.ai);
        });
    };

    for(const ParsedElement &element: elements)
    {
        const AiDefinition *definition = catalog.lookup(element.ai);
        if(!definition)
        {
            continue;
        }

        if(!definition->required_ais.empty()
           && std::ranges::none_of(definition->required_ais,
                                   [&](const std::string &entry) { return present(entry, element.ai); }))
        {
            violations.push_back("AI(" + element.ai + ") requires one of: " + joinCodes(definition->required_ais));
        }

        for(const std::string &entry: definition->exclusive_ais)
        {
            if(present(entry, element.ai))
            {
                violations.push_back("AI(" + element.ai + ") must not appear together with AI(" + entry + ")");
            }
        }
    }
    return violations;
}

ParseResult Decoder::decode(const std::string_view raw) const
{
    ParseResult result;
    result.raw = std::string(raw);

    std::string_view text = raw;
    if(const auto symbology = detectSymbology(text))
    {
        result.symbology_removed    = true;
        result.symbology_identifier = std::string(symbology->identifier);
        result.symbology_name       = std::string(symbology->name);
        text.remove_prefix(symbology->identifier.size());
        result.events.push_back("Stripped symbology identifier " + result.symbology_identifier + " ("
                                + result.symbology_name + ")");
    }

    result.separator_seen = containsSeparator(text);
    if(result.separator_seen && options_.normalize_separators)
    {
        result.normalized = std::string(trim(normalizeSeparators(text)));
        result.events.push_back("Normalized separators to GS");
    }
    else
    {
        result.normalized = std::string(trim(text));
    }

    if(result.normalized.empty())
    {
        noValidParse(result);
        result.events.push_back("Empty input after normalization");
        return result;
    }

    if(result.separator_seen || !options_.allow_ambiguity || !decodeWithBeam(result))
    {
        decodeWithFastPath(result);
    }

    attachElementDiagnostics(result);

    result.validation_errors  = checkCompanions(result.elements, catalog_);
    result.structurally_valid = result.validation_errors.empty();
    if(!result.structurally_valid)
    {
        result.events.push_back("Companion check found " + std::to_string(result.validation_errors.size())
                                + " violation(s)");
    }
    return result;
}

bool Decoder::decodeWithBeam(ParseResult &result) const
{
    const std::string_view  input = result.normalized;
    const NoSeparatorParser parser(catalog_, options_);
    NoSeparatorResult       beam = parser.parse(input);

    result.events.push_back("Beam search: " + std::to_string(beam.candidates.size()) + " complete candidate(s) after "
                            + std::to_string(beam.iterations) + " round(s)");
    if(beam.capped)
    {
        result.events.push_back("Beam search stopped at the iteration cap");
    }

    if(beam.candidates.empty())
    {
        result.events.push_back(NoSeparatorParser::startsWithSubsetCode(input)
                                    ? "Beam found no complete candidate; using the fast path"
                                    : "Leading AI is outside the beam subset; using the fast path");
        return false;
    }

    result.engine = ParseEngine::kBeam;
    result.diagnostics.push_back(Diagnostic{DiagnosticCode::kMissingSeparator,
                                            Severity::kWarning,
                                            "Input has no separators; parsed with no-separator solver",
                                            {},
                                            {},
                                            std::nullopt});

    Candidate &best   = beam.candidates.front();
    result.elements   = std::move(best.elements);
    result.confidence = beam.confidence;
    result.events.push_back("Beam selected candidate with score " + formatScore(best.score));
    for(const std::string &reason: best.reasoning)
    {
        result.events.push_back("  " + reason);
    }

    if(beam.ambiguous)
    {
        result.diagnostics.push_back(Diagnostic{DiagnosticCode::kAmbiguousParse,
                                                Severity::kWarning,
                                                "Multiple plausible parses; returning best with alternatives",
                                                {},
                                                {},
                                                beam.alternatives.size()});
    }
    result.alternatives = std::move(beam.alternatives);
    return true;
}

void Decoder::decodeWithFastPath(ParseResult &result) const
{
    const std::string_view input = result.normalized;
    const FastPathParser   fast(catalog_, options_);
    FastPathResult         scanned = fast.parse(input, result.separator_seen);

    result.engine = ParseEngine::kFastPath;
    if(!scanned.needs_solver)
    {
        result.confidence  = FastPathParser::confidence(scanned);
        result.elements    = std::move(scanned.elements);
        result.diagnostics = std::move(scanned.diagnostics);
        return;
    }

    if(!options_.allow_ambiguity)
    {
        result.elements    = std::move(scanned.elements);
        result.diagnostics = std::move(scanned.diagnostics);
        result.confidence  = kUnresolvedConfidence;
        result.events.push_back("Ambiguity resolution disabled; keeping the fast-path guess");
        return;
    }

    result.events.push_back("Unterminated variable-length field; escalating to the solver");
    const AmbiguitySolver solver(catalog_, options_);
    SolverResult          solved = solver.solve(input, result.separator_seen);

    if(solved.declined)
    {
        result.elements    = std::move(scanned.elements);
        result.diagnostics = std::move(scanned.diagnostics);
        result.confidence  = kUnresolvedConfidence;
        result.events.push_back("Solver declined input of " + std::to_string(input.size()) + " characters (limit "
                                + std::to_string(options_.max_solver_positions) + ")");
        return;
    }

    result.engine = ParseEngine::kSolver;
    if(solved.paths.empty())
    {
        result.diagnostics = std::move(scanned.diagnostics);
        noValidParse(result);
        result.events.push_back("Solver found no complete path");
        return;
    }

    SolverPath &best  = solved.paths.front();
    result.elements   = std::move(best.elements);
    result.confidence = best.score;
    result.events.push_back("Solver found " + std::to_string(solved.paths.size()) + " path(s); best score "
                            + formatScore(best.score));

    const bool multiple = solved.paths.size() > 1;
    if(result.separator_seen || multiple)
    {
        for(const std::string &note: best.notes)
        {
            result.diagnostics.push_back(
                Diagnostic{DiagnosticCode::kMissingSeparator, Severity::kWarning, note, {}, {}, std::nullopt});
        }
    }

    if(multiple)
    {
        result.diagnostics.push_back(Diagnostic{DiagnosticCode::kAmbiguousParse,
                                                Severity::kWarning,
                                                "Multiple valid parses found; returning best with alternatives",
                                                {},
                                                {},
                                                solved.paths.size() - 1});
        for(std::size_t idx = 1; idx < solved.paths.size() && idx <= options_.max_alternatives; ++idx)
        {
            SolverPath &path = solved.paths[idx];
            result.alternatives.push_back(
                Alternative{path.score, path.score, std::move(path.elements), std::move(path.notes)});
        }
    }
}

ParseResult decode(const std::string_view raw, const ParseOptions &options)
{
    return Decoder(options).decode(raw);
}

}  // namespace gs1
