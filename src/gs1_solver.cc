/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   src/gs1_solver.cc
 * Description: Memoized solver for element strings with unterminated variable-length fields.
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

#include "gs1_solver.h"

#include "gs1_validators.h"

#include <algorithm>

namespace gs1
{

namespace
{

    constexpr double kSeparatorBonus     = 0.05;
    constexpr double kInvalidElementConf = 0.7;
    constexpr double kTailSwallowPenalty = 0.7;
    constexpr double kValidRatioBonus    = 0.2;

    std::vector<std::size_t> lengthsToTry(const AiDefinition &definition,
                                          const std::size_t   data_start,
                                          const std::size_t   text_size,
                                          const bool          separator_seen)
    {
        std::vector<std::size_t> lengths;
        if(definition.isFixedLength())
        {
            lengths.push_back(*definition.fixed_length);
            return lengths;
        }
        if(data_start > text_size)
        {
            return lengths;
        }

        const std::size_t max_len = std::min(definition.max_length, text_size - data_start);
        const std::size_t min_len = std::max<std::size_t>(definition.min_length, 1);
        if(max_len < min_len)
        {
            return lengths;
        }
        for(std::size_t len = min_len; len <= max_len; ++len)
        {
            lengths.push_back(len);
        }
        // Without any separator the longest reading is the likeliest.
        if(!separator_seen)
        {
            std::ranges::reverse(lengths);
        }
        return lengths;
    }

}  // namespace

double AmbiguitySolver::PathNode::score() const
{
    double value = confidence;
    if(elements > 0)
    {
        value += kValidRatioBonus * static_cast<double>(valid) / static_cast<double>(elements);
    }
    return std::clamp(value, 0.0, 1.0);
}

AmbiguitySolver::AmbiguitySolver(const Catalog &catalog, const ParseOptions &options)
: catalog_(catalog)
, options_(options)
{
}

bool AmbiguitySolver::valueHasPossibleAi(const std::string_view value, const std::size_t min_length) const
{
    for(std::size_t check_len = min_length; check_len + 1 < value.size(); ++check_len)
    {
        if(catalog_.longestMatch(value.substr(check_len)))
        {
            return true;
        }
    }
    return false;
}

SolverResult AmbiguitySolver::solve(const std::string_view text, const bool separator_seen, const std::size_t start) const
{
    SolverResult result;
    if(text.size() > options_.max_solver_positions)
    {
        result.declined = true;
        return result;
    }
    if(start > text.size())
    {
        return result;
    }

    const std::size_t n    = text.size();
    const std::size_t keep = std::max<std::size_t>(1, options_.max_alternatives * 2);

    std::vector<std::vector<PathNode>> memo(n + 1);
    memo[n].push_back(PathNode{});

    for(std::size_t pos = n; pos-- > start;)
    {
        std::vector<PathNode> paths;

        if(text[pos] == kGroupSeparator)
        {
            const std::vector<PathNode> &after = memo[pos + 1];
            for(std::size_t idx = 0; idx < after.size(); ++idx)
            {
                PathNode node    = after[idx];
                node.confidence  = std::min(1.0, after[idx].confidence + kSeparatorBonus);
                node.terminal    = false;
                node.has_element = false;
                node.guessed     = false;
                node.next_pos    = pos + 1;
                node.next_index  = idx;
                paths.push_back(node);
            }
        }

        for(const AiMatch &match: catalog_.allMatches(text, pos))
        {
            const AiDefinition &definition = *match.definition;
            const std::size_t   data_start = pos + match.length;

            for(const std::size_t data_len: lengthsToTry(definition, data_start, n, separator_seen))
            {
                const std::size_t end_pos = data_start + data_len;
                if(end_pos > n)
                {
                    continue;
                }

                const std::string_view value = text.substr(data_start, data_len);
                if(definition.data_type == DataType::kNumeric && !isAllDigits(value))
                {
                    continue;
                }

                const bool valid = validateValue(definition, value, options_.century_pivot).valid;
                if(!valid && options_.strict_mode)
                {
                    continue;
                }

                const bool delimited = end_pos == n || text[end_pos] == kGroupSeparator;
                if(!delimited && !catalog_.longestMatch(text, end_pos))
                {
                    continue;
                }

                double     element_conf = valid ? 1.0 : kInvalidElementConf;
                const bool guessed      = definition.separator_required && !delimited;
                if(guessed)
                {
                    const auto   max_len      = static_cast<double>(std::max<std::size_t>(definition.max_length, 1));
                    const double length_ratio = std::min(1.0, static_cast<double>(data_len) / max_len);
                    element_conf *= 0.8 + 0.2 * length_ratio;
                }
                if(!definition.isFixedLength() && end_pos == n && valueHasPossibleAi(value, definition.min_length))
                {
                    element_conf *= kTailSwallowPenalty;
                }

                const std::vector<PathNode> &continuations = memo[end_pos];
                for(std::size_t idx = 0; idx < continuations.size(); ++idx)
                {
                    const PathNode &sub = continuations[idx];
                    if(sub.elements + 1 > options_.max_solver_depth)
                    {
                        continue;
                    }
                    PathNode node;
                    node.confidence  = element_conf * sub.confidence;
                    node.elements    = sub.elements + 1;
                    node.valid       = sub.valid + (valid ? 1 : 0);
                    node.terminal    = false;
                    node.has_element = true;
                    node.guessed     = guessed;
                    node.element     = ElementRef{&definition, pos, data_start, end_pos, valid};
                    node.next_pos    = end_pos;
                    node.next_index  = idx;
                    paths.push_back(node);
                }
            }
        }

        std::ranges::stable_sort(paths,
                                 [](const PathNode &lhs, const PathNode &rhs) { return lhs.score() > rhs.score(); });
        if(paths.size() > keep)
        {
            paths.resize(keep);
        }
        memo[pos] = std::move(paths);
    }

    const std::vector<PathNode> &best = memo[start];
    const std::size_t            take = std::min(best.size(), options_.max_alternatives + 1);
    result.paths.reserve(take);
    for(std::size_t idx = 0; idx < take; ++idx)
    {
        result.paths.push_back(materialize(text, memo, start, idx));
    }
    return result;
}

SolverPath AmbiguitySolver::materialize(const std::string_view                  text,
                                        const std::vector<std::vector<PathNode>> &memo,
                                        std::size_t                              pos,
                                        std::size_t                              index) const
{
    SolverPath path;
    path.confidence = memo[pos][index].confidence;
    path.score      = memo[pos][index].score();

    while(true)
    {
        const PathNode &node = memo[pos][index];
        if(node.has_element)
        {
            const ElementRef &ref = node.element;
            path.elements.push_back(buildElement(*ref.definition,
                                                 text.substr(ref.data_start, ref.end - ref.data_start),
                                                 ref.start,
                                                 ref.end,
                                                 options_.century_pivot));
            if(node.guessed)
            {
                path.notes.push_back("Guessed boundary for AI(" + ref.definition->code + ")");
            }
        }
        if(node.terminal)
        {
            break;
        }
        pos   = node.next_pos;
        index = node.next_index;
    }
    return path;
}

}  // namespace gs1
