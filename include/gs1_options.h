/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   include/gs1_options.h
 * Description: Parse options and their XML options file.
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

#ifndef GS1DECODER_GS1_OPTIONS_H_INCLUDED
#define GS1DECODER_GS1_OPTIONS_H_INCLUDED

#include "gs1_scoring.h"
#include "gs1_validators.h"

#include <cstddef>
#include <set>
#include <string>
#include <string_view>

namespace gs1
{

/**
 * @brief Options recognized by the decoder and its engines.
 */
struct ParseOptions
{
    /** Invalid elements rule out a candidate instead of being flagged. */
    bool                  strict_mode          = false;
    std::size_t           max_alternatives     = 5;
    int                   century_pivot        = kDefaultCenturyPivot;
    /** Replace separator stand-ins (`<GS>`, `~`, `|`, `^`) with the GS character. */
    bool                  normalize_separators = true;
    /** Use the solver and the beam parser; otherwise keep the fast-path guess. */
    bool                  allow_ambiguity      = true;
    std::size_t           beam_width           = 200;
    std::size_t           max_beam_iterations  = 20;
    /** Inputs longer than this are not handed to the solver. */
    std::size_t           max_solver_positions = 512;
    std::size_t           max_solver_depth     = 50;
    /** Internal-use AIs exempt from the beam's internal-code penalties. */
    std::set<std::string> vendor_whitelist;
    ScoringWeights        weights;
};

/**
 * @brief Loads options from an XML document held in memory.
 *
 * Root `<gs1decoder>` with optional `<parser>`, `<beam>`, `<solver>`, `<whitelist>` and `<weights>` children.
 * Attributes that are absent keep their current value.
 *
 * @param xml XML text.
 * @param options Options to update. Left untouched on failure.
 * @param error Optional output parameter for a human-readable error message.
 * @return `true` if loading succeeded, `false` otherwise.
 */
bool loadOptionsFromString(std::string_view xml, ParseOptions &options, std::string *error = nullptr);

/**
 * @brief Loads options from an XML file.
 * @param path Path to the options file.
 * @param options Options to update. Left untouched on failure.
 * @param error Optional output parameter for a human-readable error message.
 * @return `true` if loading succeeded, `false` otherwise.
 */
bool loadOptionsFromFile(const std::string &path, ParseOptions &options, std::string *error = nullptr);

}  // namespace gs1

#endif  // GS1DECODER_GS1_OPTIONS_H_INCLUDED
