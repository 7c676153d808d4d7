/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   include/gs1_fast_path.h
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

#ifndef GS1DECODER_GS1_FAST_PATH_H_INCLUDED
#define GS1DECODER_GS1_FAST_PATH_H_INCLUDED

#include "gs1_catalog.h"
#include "gs1_options.h"
#include "gs1_types.h"

#include <string_view>
#include <vector>

namespace gs1
{

/**
 * @brief Output of the fast-path scan.
 */
struct FastPathResult
{
    std::vector<ParsedElement> elements;
    /** Structural problems (unknown AI, truncation, separator issues). */
    std::vector<Diagnostic>    diagnostics;
    /** `true` if an unterminated variable field may hide another AI. */
    bool                       needs_solver = false;
};

/**
 * @brief Scans a normalized element string once, matching the longest AI at each position.
 *
 * Never aborts: unknown AIs are skipped up to the next separator and validation failures stay on the element.
 */
class FastPathParser
{
    public:
    FastPathParser(const Catalog &catalog, const ParseOptions &options);

    /**
     * @brief Parses `text`.
     * @param text Normalized input using the GS character as separator.
     * @param separator_seen `true` if the raw input carried any separator.
     */
    FastPathResult parse(std::string_view text, bool separator_seen) const;

    /**
     * @brief Fast-path confidence: 1.0, lowered by 0.05 per structural problem and scaled by the valid ratio.
     */
    static double confidence(const FastPathResult &result);

    private:
    const Catalog      &catalog_;
    const ParseOptions &options_;

    bool hidesAnotherAi(std::string_view remaining, const AiDefinition &definition) const;
};

}  // namespace gs1

#endif  // GS1DECODER_GS1_FAST_PATH_H_INCLUDED
