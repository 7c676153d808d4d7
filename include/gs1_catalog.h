/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   include/gs1_catalog.h
 * Description: GS1 application identifier catalog and loading interfaces.
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

#ifndef GS1DECODER_GS1_CATALOG_H_INCLUDED
#define GS1DECODER_GS1_CATALOG_H_INCLUDED

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gs1
{

/**
 * @brief Data type of an AI value.
 */
enum class DataType
{
    /** Digits only. */
    kNumeric,
    /** GS1 character set 82. */
    kAlphanumeric
};

/**
 * @brief Date layout of a date-carrying AI.
 */
enum class DateFormat
{
    kNone,
    kYYMMDD,
    /** Like `kYYMMDD` but day `00` is legal and means "day unspecified". */
    kYYMMD0,
    kYYYYMMDD,
    kYYMMDDHH
};

/**
 * @brief One component of an AI value syntax (`N13`, `X..17`).
 */
struct ValueComponent
{
    DataType    data_type  = DataType::kAlphanumeric;
    std::size_t min_length = 0;
    std::size_t max_length = 0;
};

/**
 * @brief Definition of one application identifier.
 */
struct AiDefinition
{
    /** AI code, 2 to 4 digits. */
    std::string code;
    /** Short title (for example `GTIN`). */
    std::string title;
    DataType data_type = DataType::kAlphanumeric;
    /** Set for predefined-length AIs that never need a separator. */
    std::optional<std::size_t> fixed_length;
    std::size_t                min_length = 0;
    std::size_t                max_length = 0;
    /** `true` if a separator must follow the value unless it ends the string. */
    bool separator_required = true;
    /** `true` if the last digit is a Mod-10 check digit. */
    bool       check_digit = false;
    DateFormat date_format = DateFormat::kNone;
    /** Implied decimal positions of weight/measure/amount families. */
    std::optional<int> decimal_positions;
    /** Leading characters (currency, percentage) that precede the decimal amount. */
    std::size_t decimal_offset = 0;
    /** AIs of which at least one must accompany this AI. Entries ending in `n` denote a family. */
    std::vector<std::string> required_ais;
    /** AIs that must not accompany this AI. Entries ending in `n` denote a family. */
    std::vector<std::string> exclusive_ais;
    /** Value components in order; a single entry for plain values. */
    std::vector<ValueComponent> components;
    /** GS1 Digital Link primary key flag. */
    bool is_dlp_key = false;

    bool isFixedLength() const
    {
        return fixed_length.has_value();
    }
};

/**
 * @brief Result of a longest-prefix match.
 */
struct AiMatch
{
    /** Matched definition, or `nullptr` if no registered code starts at the position. */
    const AiDefinition *definition = nullptr;
    /** Number of characters of the matched code. */
    std::size_t length = 0;

    explicit operator bool() const
    {
        return definition != nullptr;
    }
};

/**
 * @brief Transparent hasher for string-like keys in unordered maps.
 */
struct StringHash
{
    using is_transparent = void;

    [[nodiscard]] std::size_t operator()(const char *txt) const
    {
        return std::hash<std::string_view>{}(txt);
    }

    [[nodiscard]] std::size_t operator()(std::string_view txt) const
    {
        return std::hash<std::string_view>{}(txt);
    }

    [[nodiscard]] std::size_t operator()(const std::string &txt) const
    {
        return std::hash<std::string>{}(txt);
    }
};

/**
 * @brief Registry of AI definitions with trie-backed longest-prefix lookup.
 */
class Catalog
{
    public:
    /** Longest AI code length. */
    static constexpr std::size_t kMaxCodeLength = 4;
    /** Shortest AI code length. */
    static constexpr std::size_t kMinCodeLength = 2;

    /**
     * @brief Returns the process-wide catalog built from the embedded table.
     *
     * Built exactly once on first use; read-only afterwards and safe for concurrent readers.
     */
    static const Catalog &instance();

    /**
     * @brief Builds a fresh catalog from the embedded table.
     * @param error Optional output parameter for a human-readable error message.
     * @return The new catalog. Never touches `instance()`.
     */
    static Catalog buildEmbedded(std::string *error = nullptr);

    /**
     * @brief Returns the embedded XML table.
     */
    static std::string_view embeddedTable();

    /**
     * @brief Loads AI rows from an XML document held in memory.
     * @param xml XML text with a `<gs1>` root and an `<ais>` list.
     * @param error Optional output parameter for a human-readable error message.
     * @return `true` if the document was readable, `false` otherwise. Malformed rows are skipped, not fatal.
     */
    bool loadFromString(std::string_view xml, std::string *error = nullptr);

    /**
     * @brief Loads AI rows from an XML file.
     * @param path Path to the table file.
     * @param error Optional output parameter for a human-readable error message.
     * @return `true` if loading succeeded, `false` otherwise.
     */
    bool loadFromFile(const std::string &path, std::string *error = nullptr);

    /**
     * @brief Registers or replaces one definition.
     */
    void add(AiDefinition definition);

    /**
     * @brief Finds a definition by exact code.
     * @param code AI code.
     * @return Pointer to the definition, or `nullptr` if not found.
     */
    const AiDefinition *lookup(std::string_view code) const;

    /**
     * @brief Finds the longest registered code starting at `pos`.
     * @param text Text to match against.
     * @param pos Start offset in `text`.
     * @return Match with definition and code length; empty match if nothing is registered there.
     */
    AiMatch longestMatch(std::string_view text, std::size_t pos = 0) const;

    /**
     * @brief Returns all registered codes that are prefixes of `text` at `pos`, longest first.
     */
    std::vector<AiMatch> allMatches(std::string_view text, std::size_t pos = 0) const;

    /** @brief Number of registered definitions. */
    std::size_t size() const
    {
        return entries_.size();
    }

    /** @brief Number of table rows skipped as malformed during loading. */
    std::size_t skippedRows() const
    {
        return skipped_rows_;
    }

    /** @brief Table type attribute of the last loaded table (for example `GS1`). */
    const std::string &type() const
    {
        return table_type_;
    }

    /** @brief Table version of the last loaded table (for example `24.0`). */
    const std::string &version() const
    {
        return version_;
    }

    /**
     * @brief Converts a `Y`/`N` attribute value to boolean.
     * @param value XML attribute value pointer.
     * @return `true` when attribute starts with `Y` or `y`, otherwise `false`.
     */
    static bool isYesAttr(const char *value);

    /**
     * @brief Tests whether `code` is named by a companion list entry.
     *
     * Entries ending in `n` match every code sharing the entry's prefix (`320n` matches `3203`).
     */
    static bool companionMatches(std::string_view entry, std::string_view code);

    private:
    struct TrieNode
    {
        std::array<std::int32_t, 10> children{-1, -1, -1, -1, -1, -1, -1, -1, -1, -1};
        std::int32_t                 entry = -1;
    };

    std::vector<AiDefinition>                                               entries_;
    std::unordered_map<std::string, std::size_t, StringHash, std::equal_to<>> index_;
    std::vector<TrieNode>                                                   trie_{TrieNode{}};
    std::size_t                                                             skipped_rows_ = 0;
    std::string                                                             table_type_;
    std::string                                                             version_;

    void insertTrie(const std::string &code, std::size_t entry_index);
};

}  // namespace gs1

#endif  // GS1DECODER_GS1_CATALOG_H_INCLUDED
