/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   include/gs1_scoring.h
 * Description: Ordered scoring rules of the no-separator beam parser.
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

#ifndef GS1DECODER_GS1_SCORING_H_INCLUDED
#define GS1DECODER_GS1_SCORING_H_INCLUDED

#include "gs1_catalog.h"
#include "gs1_types.h"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace gs1
{

/**
 * @brief Weights of the beam scoring rules.
 *
 * Defaults reproduce the tuned pharmaceutical-label heuristics. All weights are magnitudes; the rule decides
 * the sign.
 */
struct ScoringWeights
{
    double valid_gtin                     = 1000.0;
    double valid_expiry                   = 250.0;
    /** Subtracted from `valid_expiry` when the expiry day is `00`. */
    double unknown_day_penalty            = 60.0;
    double tail_order                     = 120.0;
    double embedded_expiry                = 90.0;
    double full_order                     = 30.0;
    double standard_start                 = 15.0;
    double batch_length                   = 20.0;
    double serial_length                  = 15.0;
    double absorbable_internal            = 200.0;
    double repeated_batch                 = 150.0;
    double repeated_serial                = 120.0;
    double internal_with_batch_and_serial = 80.0;
    double long_batch                     = 50.0;
    double short_serial                   = 50.0;
    double concise                        = 10.0;
    /** Best-versus-runner-up gap below which a beam result is flagged ambiguous. */
    double ambiguity_gap                  = 40.0;
};

/**
 * @brief A partial or complete parse path of the beam search.
 */
struct Candidate
{
    std::vector<ParsedElement> elements;
    double                     score    = 0.0;
    /** Next unconsumed offset of the input. */
    std::size_t                position = 0;
    /** Rule hits in the order they were applied. */
    std::vector<std::string>   reasoning;
    /** Set by a rule that rules the path out entirely. */
    bool                       eliminated = false;
};

/**
 * @brief Identifies each scoring rule.
 */
enum class RuleTag
{
    kValidGtin,
    kInvalidGtin,
    kValidExpiry,
    kTailOrder,
    kEmbeddedExpiry,
    kStandardStart,
    kFullOrder,
    kBatchLength,
    kSerialLength,
    kAbsorbableInternal,
    kRepeatedBatch,
    kRepeatedSerial,
    kInternalWithBatchAndSerial,
    kLongBatch,
    kShortSerial,
    kConcise
};

std::string_view toString(RuleTag tag);

/**
 * @brief Everything a rule may look at. `elements` already ends with the element being scored.
 */
struct ScoringContext
{
    const std::vector<ParsedElement> &elements;
    /** `true` if the candidate now consumes the whole input. */
    bool                              complete = false;
    const ScoringWeights             &weights;
    /** Internal-use codes exempt from the internal-code penalties. */
    const std::set<std::string>      &vendor_whitelist;
    const Catalog                    &catalog;
    int                               century_pivot = 51;
};

/**
 * @brief Effect of one rule hit.
 */
struct RuleOutcome
{
    double      delta     = 0.0;
    bool        eliminate = false;
    std::string reason;
};

/**
 * @brief A tagged scoring rule.
 */
struct ScoringRule
{
    RuleTag tag;
    /** Returns the outcome if the rule fires for the last element of the context. */
    std::optional<RuleOutcome> (*apply)(const ScoringContext &context);
};

/**
 * @brief Returns the rules in application order.
 */
const std::vector<ScoringRule> &scoringRules();

/**
 * @brief `true` for the internal-use codes `90` to `99`.
 */
bool isInternalAi(std::string_view ai);

/**
 * @brief Applies all rules to `candidate` whose last element was just appended.
 *
 * Adds each delta to the score and each reason to the reasoning trail. Stops at the first eliminating rule.
 *
 * @return `false` if the candidate was eliminated.
 */
bool scoreExtension(Candidate &candidate, const ScoringContext &context);

}  // namespace gs1

#endif  // GS1DECODER_GS1_SCORING_H_INCLUDED
