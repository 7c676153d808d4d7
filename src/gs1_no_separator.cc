/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   src/gs1_no_separator.cc
 * Description: Scored beam-search parser for GS1 element strings without any separator.
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

#include "gs1_no_separator.h"

#include "gs1_validators.h"

#include <algorithm>
#include <iterator>

namespace gs1
{

namespace
{

    // Internal-use AIs only try this many lengths from their minimum.
    constexpr std::size_t kInternalLengthWindow = 10;

    constexpr double kSingleCandidateConfidence = 0.95;

    void sortByScore(std::vector<Candidate> &candidates)
    {
        std::ranges::stable_sort(candidates,
                                 [](const Candidate &lhs, const Candidate &rhs) { return lhs.score > rhs.score; });
    }

    double gapConfidence(const double gap)
    {
        return std::min(1.0, std::max(0.5, 1.0 / (1.0 + 50.0 / (gap + 1.0))));
    }

}  // namespace

NoSeparatorParser::NoSeparatorParser(const Catalog &catalog, const ParseOptions &options)
: catalog_(catalog)
, options_(options)
{
    for(const std::string_view code: kSubsetCodes)
    {
        if(const AiDefinition *definition = catalog_.lookup(code))
        {
            subset_.push_back(definition);
        }
    }
}

bool NoSeparatorParser::startsWithSubsetCode(const std::string_view text, const std::size_t pos)
{
    if(pos >= text.size())
    {
        return false;
    }
    const std::string_view rest = text.substr(pos);
    return std::ranges::any_of(kSubsetCodes, [rest](const std::string_view code) { return rest.starts_with(code); });
}

std::vector<std::size_t> NoSeparatorParser::variableLengths(const std::string_view input,
                                                            const std::size_t      data_start,
                                                            const AiDefinition    &definition) const
{
    std::vector<std::size_t> lengths;
    const std::size_t        remaining = input.size() - data_start;
    const std::size_t        max_len   = std::min(definition.max_length, remaining);
    const std::size_t        min_len   = std::max<std::size_t>(definition.min_length, 1);
    if(max_len < min_len)
    {
        return lengths;
    }

    if(isInternalAi(definition.code))
    {
        const std::size_t last = std::min(max_len, min_len + kInternalLengthWindow - 1);
        for(std::size_t len = min_len; len <= last; ++len)
        {
            lengths.push_back(len);
        }
        return lengths;
    }

    for(std::size_t len = min_len; len <= max_len; ++len)
    {
        const std::size_t next_pos = data_start + len;
        if(next_pos >= input.size() || startsWithSubsetCode(input, next_pos) || len == max_len)
        {
            lengths.push_back(len);
        }
    }
    if(lengths.empty())
    {
        for(std::size_t len = min_len; len <= max_len; ++len)
        {
            lengths.push_back(len);
        }
    }
    return lengths;
}

void NoSeparatorParser::append(const std::string_view  input,
                               const Candidate        &candidate,
                               const AiDefinition     &definition,
                               const std::size_t       data_start,
                               const std::size_t       data_len,
                               std::vector<Candidate> &out) const
{
    const std::size_t end_pos = data_start + data_len;
    if(end_pos > input.size())
    {
        return;
    }

    ParsedElement element = buildElement(definition,
                                         input.substr(data_start, data_len),
                                         candidate.position,
                                         end_pos,
                                         options_.century_pivot);
    // Failed check digits, and in strict mode any invalid element, rule the path out.
    if(!element.valid && (definition.check_digit || options_.strict_mode))
    {
        return;
    }

    Candidate next;
    next.elements  = candidate.elements;
    next.elements.push_back(std::move(element));
    next.score     = candidate.score;
    next.position  = end_pos;
    next.reasoning = candidate.reasoning;

    const ScoringContext context{next.elements,
                                 end_pos >= input.size(),
                                 options_.weights,
                                 options_.vendor_whitelist,
                                 catalog_,
                                 options_.century_pivot};
    if(scoreExtension(next, context))
    {
        out.push_back(std::move(next));
    }
}

std::vector<Candidate> NoSeparatorParser::extend(const std::string_view input, const Candidate &candidate) const
{
    std::vector<Candidate> extensions;
    const std::size_t      pos  = candidate.position;
    const std::string_view rest = input.substr(pos);

    for(const AiDefinition *definition: subset_)
    {
        if(!rest.starts_with(definition->code))
        {
            continue;
        }
        const std::size_t data_start = pos + definition->code.size();

        if(definition->isFixedLength())
        {
            append(input, candidate, *definition, data_start, *definition->fixed_length, extensions);
            continue;
        }
        for(const std::size_t data_len: variableLengths(input, data_start, *definition))
        {
            append(input, candidate, *definition, data_start, data_len, extensions);
        }
    }
    return extensions;
}

NoSeparatorResult NoSeparatorParser::parse(const std::string_view input) const
{
    NoSeparatorResult      result;
    std::vector<Candidate> beam(1);
    std::vector<Candidate> complete;

    while(!beam.empty() && result.iterations < options_.max_beam_iterations)
    {
        ++result.iterations;
        std::vector<Candidate> next_beam;
        for(Candidate &candidate: beam)
        {
            if(candidate.position >= input.size())
            {
                complete.push_back(std::move(candidate));
                continue;
            }
            std::vector<Candidate> extensions = extend(input, candidate);
            next_beam.insert(next_beam.end(),
                             std::make_move_iterator(extensions.begin()),
                             std::make_move_iterator(extensions.end()));
        }
        sortByScore(next_beam);
        if(next_beam.size() > options_.beam_width)
        {
            next_beam.resize(options_.beam_width);
        }
        beam = std::move(next_beam);
    }

    // Members that finished in the last round are complete even though the loop stopped.
    for(Candidate &candidate: beam)
    {
        if(candidate.position >= input.size())
        {
            complete.push_back(std::move(candidate));
        }
        else
        {
            result.capped = true;
        }
    }

    sortByScore(complete);
    result.candidates = std::move(complete);
    if(result.candidates.empty())
    {
        return result;
    }

    const Candidate &best = result.candidates.front();
    if(best.elements.empty())
    {
        result.confidence = 0.0;
    }
    else if(result.candidates.size() > 1)
    {
        result.confidence = gapConfidence(best.score - result.candidates[1].score);
    }
    else
    {
        result.confidence = kSingleCandidateConfidence;
    }

    result.ambiguous = result.candidates.size() > 1
                       && (best.score - result.candidates[1].score) < options_.weights.ambiguity_gap;

    const std::size_t last = std::min(result.candidates.size(), options_.max_alternatives + 1);
    for(std::size_t idx = 1; idx < last; ++idx)
    {
        const Candidate &candidate = result.candidates[idx];
        Alternative      alternative;
        alternative.confidence = (best.score > 0.0) ? std::clamp(candidate.score / best.score, 0.0, 1.0) : 0.0;
        alternative.score      = candidate.score;
        alternative.elements   = candidate.elements;
        alternative.notes      = candidate.reasoning;
        result.alternatives.push_back(std::move(alternative));
    }
    return result;
}

}  // namespace gs1
