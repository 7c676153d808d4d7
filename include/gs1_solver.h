/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   include/gs1_solver.h
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

#ifndef GS1DECODER_GS1_SOLVER_H_INCLUDED
#define GS1DECODER_GS1_SOLVER_H_INCLUDED

#include "gs1_catalog.h"
#include "gs1_options.h"
#include "gs1_types.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace gs1
{

/**
 * @brief One complete interpretation found by the solver.
 */
struct SolverPath
{
    std::vector<ParsedElement> elements;
    /** Product of the element confidences. */
    double                     confidence = 1.0;
    /** `confidence` plus a bonus for the share of valid elements, clamped to [0,1]. */
    double                     score      = 1.0;
    /** Boundaries that had to be guessed, in input order. */
    std::vector<std::string>   notes;
};

/**
 * @brief Output of the solver.
 */
struct SolverResult
{
    /** Best paths first, at most `max_alternatives + 1`. */
    std::vector<SolverPath> paths;
    /** `true` if the input exceeded `max_solver_positions` and was not attempted. */
    bool                    declined = false;
};

/**
 * @brief Enumerates boundary choices over a position-indexed memo.
 *
 * The memo is filled from the end of the input towards the start, so every position is solved once and no
 * call-stack recursion is involved. Each memo entry keeps at most `2 * max_alternatives` continuations.
 */
class AmbiguitySolver
{
    public:
    AmbiguitySolver(const Catalog &catalog, const ParseOptions &options);

    /**
     * @brief Solves `text` from `start` to its end.
     * @param text Normalized input using the GS character as separator.
     * @param separator_seen `true` if the raw input carried any separator; flips the length order.
     * @param start First offset to solve.
     */
    SolverResult solve(std::string_view text, bool separator_seen, std::size_t start = 0) const;

    private:
    struct ElementRef
    {
        const AiDefinition *definition = nullptr;
        std::size_t         start      = 0;
        std::size_t         data_start = 0;
        std::size_t         end        = 0;
        bool                valid      = true;
    };

    // A continuation: optional element, then entry `next_index` of memo[`next_pos`].
    struct PathNode
    {
        double      confidence  = 1.0;
        std::size_t elements    = 0;
        std::size_t valid       = 0;
        bool        terminal    = true;
        bool        has_element = false;
        bool        guessed     = false;
        ElementRef  element;
        std::size_t next_pos    = 0;
        std::size_t next_index  = 0;

        double score() const;
    };

    const Catalog      &catalog_;
    const ParseOptions &options_;

    bool valueHasPossibleAi(std::string_view value, std::size_t min_length) const;
    SolverPath materialize(std::string_view text, const std::vector<std::vector<PathNode>> &memo,
                           std::size_t pos, std::size_t index) const;
};

}  // namespace gs1

#endif  // GS1DECODER_GS1_SOLVER_H_INCLUDED
