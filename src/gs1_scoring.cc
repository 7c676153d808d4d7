/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   src/gs1_scoring.cc
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

#include "gs1_scoring.h"

#include "gs1_validators.h"

#include <algorithm>
#include <initializer_list>
#include <limits>
#include <sstream>

namespace gs1
{

namespace
{

    constexpr std::string_view kGtin   = "01";
    constexpr std::string_view kExpiry = "17";
    constexpr std::string_view kBatch  = "10";
    constexpr std::string_view kSerial = "21";

    std::string reason(const double delta, const std::string_view text)
    {
        std::ostringstream out;
        out << std::showpos << delta << ": " << text;
        return out.str();
    }

    RuleOutcome hit(const double delta, const std::string &text)
    {
        return RuleOutcome{delta, false, reason(delta, text)};
    }

    const ParsedElement &last(const ScoringContext &context)
    {
        return context.elements.back();
    }

    std::size_t countAi(const ScoringContext &context, const std::string_view ai)
    {
        return static_cast<std::size_t>(
            std::ranges::count_if(context.elements, [ai](const ParsedElement &element) { return element.ai == ai; }));
    }

    bool tailMatches(const ScoringContext &context, const std::initializer_list<std::string_view> expected)
    {
        if(context.elements.size() < expected.size())
        {
            return false;
        }
        auto element = context.elements.end() - static_cast<std::ptrdiff_t>(expected.size());
        for(const std::string_view ai: expected)
        {
            if(element->ai != ai)
            {
                return false;
            }
            ++element;
        }
        return true;
    }

    bool exemptInternal(const ScoringContext &context)
    {
        return context.vendor_whitelist.contains(last(context).ai);
    }

    // "17" + YYMMDD + "10" somewhere inside the value, with a real calendar date.
    bool containsEmbeddedExpiry(const std::string_view value, const int century_pivot)
    {
        static constexpr std::size_t pattern_length = 10;
        for(std::size_t i = 0; i + pattern_length <= value.size(); ++i)
        {
            if(value.substr(i, 2) != kExpiry || value.substr(i + 8, 2) != kBatch)
            {
                continue;
            }
            const std::string_view date = value.substr(i + 2, 6);
            if(isAllDigits(date) && validateDate(date, DateFormat::kYYMMDD, century_pivot).valid)
            {
                return true;
            }
        }
        return false;
    }

    std::optional<RuleOutcome> validGtin(const ScoringContext &context)
    {
        const ParsedElement &element = last(context);
        if(element.ai != kGtin || !element.valid || !element.metaFlag("check_digit_valid"))
        {
            return std::nullopt;
        }
        return hit(context.weights.valid_gtin, "Valid GTIN with correct check digit");
    }

    std::optional<RuleOutcome> invalidGtin(const ScoringContext &context)
    {
        const ParsedElement &element = last(context);
        if(element.ai != kGtin || element.valid)
        {
            return std::nullopt;
        }
        return RuleOutcome{-std::numeric_limits<double>::infinity(), true, "-inf: Invalid GTIN check digit"};
    }

    std::optional<RuleOutcome> validExpiry(const ScoringContext &context)
    {
        const ParsedElement &element = last(context);
        if(element.ai != kExpiry || !element.valid)
        {
            return std::nullopt;
        }
        if(element.metaFlag("unknown_day"))
        {
            return hit(context.weights.valid_expiry - context.weights.unknown_day_penalty,
                       "Valid expiry date but day 00 (legacy unknown day)");
        }
        return hit(context.weights.valid_expiry, "Valid expiry date");
    }

    std::optional<RuleOutcome> tailOrder(const ScoringContext &context)
    {
        if(tailMatches(context, {kExpiry, kBatch, kSerial}))
        {
            return hit(context.weights.tail_order, "Pattern (17)->(10)->(21) detected");
        }
        if(tailMatches(context, {kSerial, kExpiry, kBatch}))
        {
            return hit(context.weights.tail_order, "Pattern (21)->(17)->(10) detected");
        }
        return std::nullopt;
    }

    std::optional<RuleOutcome> embeddedExpiry(const ScoringContext &context)
    {
        const ParsedElement &element = last(context);
        if(element.ai != kSerial || !containsEmbeddedExpiry(element.raw_value, context.century_pivot))
        {
            return std::nullopt;
        }
        return hit(context.weights.embedded_expiry, "Embedded (17) detected inside (21), a split is plausible");
    }

    std::optional<RuleOutcome> standardStart(const ScoringContext &context)
    {
        if(context.elements.size() != 2 || !tailMatches(context, {kGtin, kExpiry}))
        {
            return std::nullopt;
        }
        return hit(context.weights.standard_start, "Standard start (01)->(17)");
    }

    std::optional<RuleOutcome> fullOrder(const ScoringContext &context)
    {
        if(tailMatches(context, {kGtin, kExpiry, kBatch, kSerial}))
        {
            return hit(context.weights.full_order, "Standard pharma order (01)(17)(10)(21)");
        }
        if(tailMatches(context, {kGtin, kSerial, kExpiry, kBatch}))
        {
            return hit(context.weights.full_order, "Alternative pharma order (01)(21)(17)(10)");
        }
        return std::nullopt;
    }

    std::optional<RuleOutcome> batchLength(const ScoringContext &context)
    {
        const ParsedElement &element = last(context);
        const std::size_t    length  = element.raw_value.size();
        if(element.ai != kBatch || length < 2 || length > 10)
        {
            return std::nullopt;
        }
        return hit(context.weights.batch_length, "Lot length " + std::to_string(length) + " in common range [2-10]");
    }

    std::optional<RuleOutcome> serialLength(const ScoringContext &context)
    {
        const ParsedElement &element = last(context);
        const std::size_t    length  = element.raw_value.size();
        if(element.ai != kSerial || length < 6 || length > 20)
        {
            return std::nullopt;
        }
        return hit(context.weights.serial_length,
                   "Serial length " + std::to_string(length) + " in common range [6-20]");
    }

    std::optional<RuleOutcome> absorbableInternal(const ScoringContext &context)
    {
        const ParsedElement &element = last(context);
        if(!isInternalAi(element.ai) || exemptInternal(context) || context.elements.size() < 2)
        {
            return std::nullopt;
        }
        const ParsedElement &previous = context.elements[context.elements.size() - 2];
        if(previous.ai != kBatch && previous.ai != kSerial)
        {
            return std::nullopt;
        }
        const AiDefinition *definition = context.catalog.lookup(previous.ai);
        if(!definition)
        {
            return std::nullopt;
        }
        const std::size_t combined = previous.raw_value.size() + element.ai.size() + element.raw_value.size();
        if(combined > definition->max_length)
        {
            return std::nullopt;
        }
        return hit(-context.weights.absorbable_internal,
                   "Using internal AI(" + element.ai + ") when could extend AI(" + previous.ai + ")");
    }

    std::optional<RuleOutcome> repeatedBatch(const ScoringContext &context)
    {
        if(last(context).ai != kBatch || countAi(context, kBatch) < 2)
        {
            return std::nullopt;
        }
        return hit(-context.weights.repeated_batch, "Repeated AI(10)");
    }

    std::optional<RuleOutcome> repeatedSerial(const ScoringContext &context)
    {
        if(last(context).ai != kSerial || countAi(context, kSerial) < 2)
        {
            return std::nullopt;
        }
        return hit(-context.weights.repeated_serial, "Repeated AI(21)");
    }

    std::optional<RuleOutcome> internalWithBatchAndSerial(const ScoringContext &context)
    {
        const ParsedElement &element = last(context);
        if(!isInternalAi(element.ai) || exemptInternal(context) || countAi(context, kBatch) == 0
           || countAi(context, kSerial) == 0)
        {
            return std::nullopt;
        }
        return hit(-context.weights.internal_with_batch_and_serial,
                   "Using rare AI(" + element.ai + ") when both (10) and (21) present");
    }

    std::optional<RuleOutcome> longBatch(const ScoringContext &context)
    {
        const ParsedElement &element = last(context);
        if(element.ai != kBatch || element.raw_value.size() <= 12)
        {
            return std::nullopt;
        }
        return hit(-context.weights.long_batch,
                   "Long lot length " + std::to_string(element.raw_value.size()) + " > 12");
    }

    std::optional<RuleOutcome> shortSerial(const ScoringContext &context)
    {
        const ParsedElement &element = last(context);
        if(element.ai != kSerial || element.raw_value.size() >= 4)
        {
            return std::nullopt;
        }
        return hit(-context.weights.short_serial,
                   "Short serial length " + std::to_string(element.raw_value.size()) + " < 4");
    }

    std::optional<RuleOutcome> concise(const ScoringContext &context)
    {
        if(!context.complete || context.elements.size() > 4)
        {
            return std::nullopt;
        }
        return hit(context.weights.concise,
                   "Concise parse with " + std::to_string(context.elements.size()) + " elements");
    }

}  // namespace

std::string_view toString(const RuleTag tag)
{
    switch(tag)
    {
        case RuleTag::kValidGtin:
            return "valid-gtin";
        case RuleTag::kInvalidGtin:
            return "invalid-gtin";
        case RuleTag::kValidExpiry:
            return "valid-expiry";
        case RuleTag::kTailOrder:
            return "tail-order";
        case RuleTag::kEmbeddedExpiry:
            return "embedded-expiry";
        case RuleTag::kStandardStart:
            return "standard-start";
        case RuleTag::kFullOrder:
            return "full-order";
        case RuleTag::kBatchLength:
            return "batch-length";
        case RuleTag::kSerialLength:
            return "serial-length";
        case RuleTag::kAbsorbableInternal:
            return "absorbable-internal";
        case RuleTag::kRepeatedBatch:
            return "repeated-batch";
        case RuleTag::kRepeatedSerial:
            return "repeated-serial";
        case RuleTag::kInternalWithBatchAndSerial:
            return "internal-with-batch-and-serial";
        case RuleTag::kLongBatch:
            return "long-batch";
        case RuleTag::kShortSerial:
            return "short-serial";
        case RuleTag::kConcise:
            return "concise";
    }
    return "unknown";
}

const std::vector<ScoringRule> &scoringRules()
{
    static const std::vector<ScoringRule> rules{
        {RuleTag::kValidGtin, &validGtin},
        {RuleTag::kInvalidGtin, &invalidGtin},
        {RuleTag::kValidExpiry, &validExpiry},
        {RuleTag::kTailOrder, &tailOrder},
        {RuleTag::kEmbeddedExpiry, &embeddedExpiry},
        {RuleTag::kStandardStart, &standardStart},
        {RuleTag::kFullOrder, &fullOrder},
        {RuleTag::kBatchLength, &batchLength},
        {RuleTag::kSerialLength, &serialLength},
        {RuleTag::kAbsorbableInternal, &absorbableInternal},
        {RuleTag::kRepeatedBatch, &repeatedBatch},
        {RuleTag::kRepeatedSerial, &repeatedSerial},
        {RuleTag::kInternalWithBatchAndSerial, &internalWithBatchAndSerial},
        {RuleTag::kLongBatch, &longBatch},
        {RuleTag::kShortSerial, &shortSerial},
        {RuleTag::kConcise, &concise},
    };
    return rules;
}

bool isInternalAi(const std::string_view ai)
{
    return ai.size() == 2 && ai[0] == '9' && ai[1] >= '0' && ai[1] <= '9';
}

bool scoreExtension(Candidate &candidate, const ScoringContext &context)
{
    if(context.elements.empty())
    {
        return true;
    }
    for(const ScoringRule &rule: scoringRules())
    {
        std::optional<RuleOutcome> outcome = rule.apply(context);
        if(!outcome)
        {
            continue;
        }
        candidate.reasoning.push_back(std::move(outcome->reason));
        if(outcome->eliminate)
        {
            candidate.score      = -std::numeric_limits<double>::infinity();
            candidate.eliminated = true;
            return false;
        }
        candidate.score += outcome->delta;
    }
    return true;
}

}  // namespace gs1
