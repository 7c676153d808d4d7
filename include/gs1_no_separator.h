/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   include/gs1_no_separator.h
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

#ifndef GS1DECODER_GS1_NO_SEPARATOR_H_INCLUDED
#define GS1DECODER_GS1_NO_SEPARATOR_H_INCLUDED

#include "gs1_catalog.h"
#include "gs1_options.h"
#include "gs1_scoring.h"
#include "gs1_types.h"

#include <array>
#include <cstddef>
#include <string_view>
#include <vector>

namespace gs1
{

/**
 * @brief Output of the beam search.
 */
struct NoSeparatorResult
{
    /** Complete candidates, best first. Empty if nothing consumed the whole input. */
    std::vector<Candidate>   candidates;
    /** Derived from the gap between the two best scores. */
    double                   confidence = 0.0;
    /** `true` if the runner-up is closer than the ambiguity gap. */
    bool                     ambiguous  = false;
    /** Up to `max_alternatives` runners-up with confidence relative to the best score. */
    std::vector<Alternative> alternatives;
    /** Rounds actually run. */
    std::size_t              iterations = 0;
    /** `true` if the search stopped at the iteration cap with live candidates left. */
    bool                     capped     = false;

    /** @brief Returns the best candidate, or `nullptr` if there is none. */
    const Candidate *best() const
    {
        return candidates.empty() ? nullptr : &candidates.front();
    }
};

/**
 * @brief Beam search over the core pharmaceutical AIs and the internal-use AIs.
 *
 * Works on the subset 01, 17, 10, 21 and 90 to 99 of the catalog. Every round extends each live candidate by
 * each subset AI matching at its position, scores the extension with the rules of `gs1_scoring.h`, and keeps
 * the best `beam_width` candidates. Width and iteration cap bound the work for any input length.
 */
class NoSeparatorParser
{
    public:
    /** AI codes the beam works with, in extension order. */
    static constexpr std::array<std::string_view, 14> kSubsetCodes{
        "01", "17", "10", "21", "90", "91", "92", "93", "94", "95", "96", "97", "98", "99"};

    NoSeparatorParser(const Catalog &catalog, const ParseOptions &options);

    /**
     * @brief Parses separator-free `input`.
     */
    NoSeparatorResult parse(std::string_view input) const;

    /**
     * @brief `true` if `text` starts with one of the subset codes at `pos`.
     */
    static bool startsWithSubsetCode(std::string_view text, std::size_t pos = 0);

    private:
    const Catalog                    &catalog_;
    const ParseOptions               &options_;
    std::vector<const AiDefinition *> subset_;

    std::vector<Candidate>   extend(std::string_view input, const Candidate &candidate) const;
    std::vector<std::size_t> variableLengths(std::string_view    input,
                                             std::size_t         data_start,
                                             const AiDefinition &definition) const;
    void                     append(std::string_view        input,
                                    const Candidate        &candidate,
                                    const AiDefinition     &definition,
                                    std::size_t             data_start,
                                    std::size_t             data_len,
                                    std::vector<Candidate> &out) const;
};

}  // namespace gs1

#endif  // GS1DECODER_GS1_NO_SEPARATOR_H_INCLUDED
