/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   include/gs1_decoder.h
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

#ifndef GS1DECODER_GS1_DECODER_H_INCLUDED
#define GS1DECODER_GS1_DECODER_H_INCLUDED

#include "gs1_catalog.h"
#include "gs1_options.h"
#include "gs1_types.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gs1
{

/**
 * @brief An ISO/IEC 15424 symbology identifier of a GS1 carrier.
 */
struct Symbology
{
    std::string_view identifier;
    std::string_view name;
};

/**
 * @brief Decodes GS1 element strings into a `ParseResult`.
 *
 * Strips a symbology identifier, normalizes separator stand-ins, and runs the beam parser for separator-free
 * input or the fast path (escalating to the solver) otherwise. Every engine's output is normalized into the same
 * result shape. A decoder is immutable after construction and may be shared between threads.
 */
class Decoder
{
    public:
    /** @brief Decoder over the process-wide embedded catalog. */
    explicit Decoder(ParseOptions options = {});

    /**
     * @brief Decoder over a caller-owned catalog.
     * @param catalog Catalog that must outlive the decoder.
     * @param options Parse options.
     */
    Decoder(const Catalog &catalog, ParseOptions options);

    /**
     * @brief Decodes one scanned string.
     * @param raw Input exactly as delivered by the scanner.
     * @return Result; never throws for malformed input.
     */
    ParseResult decode(std::string_view raw) const;

    const ParseOptions &options() const
    {
        return options_;
    }

    const Catalog &catalog() const
    {
        return catalog_;
    }

    /**
     * @brief Recognizes a GS1 symbology identifier at the start of `text`.
     * @return The identifier and its name, or `std::nullopt` if `text` carries none.
     */
    static std::optional<Symbology> detectSymbology(std::string_view text);

    /**
     * @brief `true` if `text` contains the GS character or one of its stand-ins (`<GS>`, `~`, `|`, `^`).
     */
    static bool containsSeparator(std::string_view text);

    /**
     * @brief Replaces every separator stand-in with the GS character.
     */
    static std::string normalizeSeparators(std::string_view text);

    /**
     * @brief Checks the `req`/`ex` companion lists of every element against the others.
     * @return Human-readable violations; empty if the element set is structurally valid.
     */
    static std::vector<std::string> checkCompanions(const std::vector<ParsedElement> &elements,
                                                    const Catalog                    &catalog);

    private:
    const Catalog &catalog_;
    ParseOptions   options_;

    bool decodeWithBeam(ParseResult &result) const;
    void decodeWithFastPath(ParseResult &result) const;
};

/**
 * @brief Decodes `raw` with the embedded catalog.
 */
ParseResult decode(std::string_view raw, const ParseOptions &options = {});

}  // namespace gs1

#endif  // GS1DECODER_GS1_DECODER_H_INCLUDED
