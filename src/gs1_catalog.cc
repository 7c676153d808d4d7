/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   src/gs1_catalog.cc
 * Description: GS1 AI table XML parser and trie lookup implementation.
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

#include "gs1_catalog.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>
#include <tinyxml2.h>

namespace gs1
{

namespace
{

    struct SpecComponent
    {
        DataType                 data_type  = DataType::kAlphanumeric;
        std::size_t              min_length = 0;
        std::size_t              max_length = 0;
        std::vector<std::string> linters;
    };

    struct ParsedSpec
    {
        DataType    data_type   = DataType::kNumeric;
        std::size_t min_length  = 0;
        std::size_t max_length  = 0;
        bool        check_digit = false;
        DateFormat  date_format = DateFormat::kNone;
        // Characters of the fixed components in front of the last one ("N3 N..15" -> 3).
        std::size_t leading_fixed = 0;

        std::vector<ValueComponent> components;
    };

    bool isDigits(const std::string_view text)
    {
        return !text.empty()
               && std::ranges::all_of(text, [](const unsigned char c) { return std::isdigit(c) != 0; });
    }

    std::vector<std::string> split(const std::string_view text, const char delimiter)
    {
        std::vector<std::string> parts;
        std::size_t              start = 0;
        while(start <= text.size())
        {
            const std::size_t end       = text.find(delimiter, start);
            const std::size_t token_end = (end == std::string_view::npos) ? text.size() : end;
            if(token_end > start)
            {
                parts.emplace_back(text.substr(start, token_end - start));
            }
            if(end == std::string_view::npos)
            {
                break;
            }
            start = end + 1;
        }
        return parts;
    }

    std::vector<std::string> splitWhitespace(const std::string_view text)
    {
        std::vector<std::string> parts;
        std::istringstream       in{std::string(text)};
        std::string              token;
        while(in >> token)
        {
            parts.push_back(std::move(token));
        }
        return parts;
    }

    std::optional<std::size_t> parseSize(const std::string_view text)
    {
        std::size_t value = 0;
        if(!isDigits(text))
        {
            return std::nullopt;
        }
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if(ec != std::errc{} || ptr != text.data() + text.size())
        {
            return std::nullopt;
        }
        return value;
    }

    // "N14,csum" -> numeric 14..14 + linters; "X..20" -> alphanumeric 1..20.
    std::optional<SpecComponent> parseSpecComponent(const std::string_view token)
    {
        const std::vector<std::string> parts = split(token, ',');
        if(parts.empty() || parts.front().size() < 2)
        {
            return std::nullopt;
        }

        SpecComponent     component;
        const std::string &type_len = parts.front();
        switch(type_len.front())
        {
            case 'N':
                component.data_type = DataType::kNumeric;
                break;
            case 'X':
            case 'Y':
                component.data_type = DataType::kAlphanumeric;
                break;
            default:
                return std::nullopt;
        }

        const std::string_view len_spec = std::string_view(type_len).substr(1);
        if(len_spec.starts_with(".."))
        {
            const auto max_len = parseSize(len_spec.substr(2));
            if(!max_len || *max_len == 0)
            {
                return std::nullopt;
            }
            component.min_length = 1;
            component.max_length = *max_len;
        }
        else
        {
            const auto fixed_len = parseSize(len_spec);
            if(!fixed_len || *fixed_len == 0)
            {
                return std::nullopt;
            }
            component.min_length = *fixed_len;
            component.max_length = *fixed_len;
        }

        component.linters.assign(parts.begin() + 1, parts.end());
        return component;
    }

    std::optional<ParsedSpec> parseSpec(const std::string_view spec)
    {
        const std::vector<std::string> tokens = splitWhitespace(spec);
        if(tokens.empty())
        {
            return std::nullopt;
        }

        ParsedSpec parsed;
        for(std::size_t i = 0; i < tokens.size(); ++i)
        {
            const auto component = parseSpecComponent(tokens[i]);
            if(!component)
            {
                return std::nullopt;
            }
            if(i + 1 < tokens.size() && component->min_length == component->max_length)
            {
                parsed.leading_fixed += component->min_length;
            }
            parsed.min_length += component->min_length;
            parsed.max_length += component->max_length;
            parsed.components.push_back(
                ValueComponent{component->data_type, component->min_length, component->max_length});
            if(component->data_type == DataType::kAlphanumeric)
            {
                parsed.data_type = DataType::kAlphanumeric;
            }

            for(const std::string &linter: component->linters)
            {
                // Check digits and dates are validated over the leading component only.
                if(i != 0)
                {
                    continue;
                }
                if(linter == "csum" && tokens.size() == 1)
                {
                    parsed.check_digit = true;
                }
                else if(linter == "yymmdd")
                {
                    parsed.date_format = DateFormat::kYYMMDD;
                }
                else if(linter == "yymmd0")
                {
                    parsed.date_format = DateFormat::kYYMMD0;
                }
                else if(linter == "yyyymmdd")
                {
                    parsed.date_format = DateFormat::kYYYYMMDD;
                }
                else if(linter == "yymmddhh")
                {
                    parsed.date_format = DateFormat::kYYMMDDHH;
                }
            }
        }
        return parsed;
    }

    std::string attributeOrEmpty(const tinyxml2::XMLElement *element, const char *name)
    {
        const char *value = element->Attribute(name);
        return value ? value : "";
    }

    // Expands "310n" into 3100..3109 and "91-99" into 91..99; plain codes expand to themselves.
    std::vector<std::pair<std::string, std::optional<int>>> expandCode(const std::string &code_spec)
    {
        std::vector<std::pair<std::string, std::optional<int>>> codes;

        if(code_spec.size() > 1 && code_spec.back() == 'n')
        {
            const std::string base = code_spec.substr(0, code_spec.size() - 1);
            if(!isDigits(base))
            {
                return codes;
            }
            for(int n = 0; n < 10; ++n)
            {
                codes.emplace_back(base + std::to_string(n), n);
            }
            return codes;
        }

        const std::size_t dash = code_spec.find('-');
        if(dash != std::string::npos)
        {
            const std::string first = code_spec.substr(0, dash);
            const std::string last  = code_spec.substr(dash + 1);
            const auto        from  = parseSize(first);
            const auto        to    = parseSize(last);
            if(!from || !to || *from > *to || first.size() != last.size())
            {
                return codes;
            }
            for(std::size_t value = *from; value <= *to; ++value)
            {
                std::string code = std::to_string(value);
                code.insert(0, first.size() - code.size(), '0');
                std::optional<int> decimals;
                if(code.size() == 4)
                {
                    decimals = static_cast<int>(value % 10);
                }
                codes.emplace_back(std::move(code), decimals);
            }
            return codes;
        }

        if(isDigits(code_spec))
        {
            codes.emplace_back(code_spec, std::nullopt);
        }
        return codes;
    }

    bool loadDocument(Catalog &catalog, const tinyxml2::XMLDocument &doc, const std::string &source,
                      std::string *error, std::size_t &skipped, std::string &type, std::string &version)
    {
        const tinyxml2::XMLElement *root = doc.FirstChildElement("gs1");
        if(!root)
        {
            if(error)
            {
                *error = "Missing <gs1> root element in " + source;
            }
            return false;
        }

        type    = attributeOrEmpty(root, "type");
        version = attributeOrEmpty(root, "version");

        const tinyxml2::XMLElement *ais = root->FirstChildElement("ais");
        if(!ais)
        {
            if(error)
            {
                *error = "Missing <ais> element in " + source;
            }
            return false;
        }

        for(const tinyxml2::XMLElement *row = ais->FirstChildElement("ai"); row; row = row->NextSiblingElement("ai"))
        {
            const std::string code_spec = attributeOrEmpty(row, "code");
            const auto        spec      = parseSpec(attributeOrEmpty(row, "spec"));
            const auto        codes     = expandCode(code_spec);
            if(!spec || codes.empty())
            {
                ++skipped;
                continue;
            }

            const bool fixed = Catalog::isYesAttr(row->Attribute("fixed"));

            AiDefinition prototype;
            prototype.title              = attributeOrEmpty(row, "title");
            prototype.data_type          = spec->data_type;
            prototype.min_length         = spec->min_length;
            prototype.max_length         = spec->max_length;
            prototype.check_digit        = spec->check_digit;
            prototype.date_format        = spec->date_format;
            prototype.components         = spec->components;
            prototype.separator_required = !fixed;
            prototype.is_dlp_key         = Catalog::isYesAttr(row->Attribute("dlpkey"));
            prototype.required_ais       = split(attributeOrEmpty(row, "req"), ',');
            prototype.exclusive_ais      = split(attributeOrEmpty(row, "ex"), ',');
            if(fixed)
            {
                prototype.fixed_length = spec->max_length;
            }

            for(const auto &[code, decimals]: codes)
            {
                if(code.size() < Catalog::kMinCodeLength || code.size() > Catalog::kMaxCodeLength)
                {
                    ++skipped;
                    continue;
                }
                AiDefinition definition      = prototype;
                definition.code              = code;
                definition.decimal_positions = decimals;
                if(decimals)
                {
                    definition.decimal_offset = spec->leading_fixed;
                }
                catalog.add(std::move(definition));
            }
        }

        return true;
    }

}  // namespace

bool Catalog::isYesAttr(const char *value)
{
    static constexpr char upper_y = 0x59;
    static constexpr char lower_y = 0x79;

    return value && (value[0] == upper_y || value[0] == lower_y);
}

bool Catalog::companionMatches(const std::string_view entry, const std::string_view code)
{
    if(entry.size() > 1 && entry.back() == 'n')
    {
        const std::string_view prefix = entry.substr(0, entry.size() - 1);
        return code.size() == entry.size() && code.starts_with(prefix);
    }
    return entry == code;
}

const Catalog &Catalog::instance()
{
    static const Catalog catalog = buildEmbedded();
    return catalog;
}

Catalog Catalog::buildEmbedded(std::string *error)
{
    Catalog catalog;
    if(!catalog.loadFromString(embeddedTable(), error))
    {
        return Catalog{};
    }
    return catalog;
}

bool Catalog::loadFromString(const std::string_view xml, std::string *error)
{
    tinyxml2::XMLDocument doc;
    const auto            status = doc.Parse(xml.data(), xml.size());
    if(status != tinyxml2::XML_SUCCESS)
    {
        if(error)
        {
            *error = "Failed to parse AI table XML: " + std::string(doc.ErrorStr() ? doc.ErrorStr() : "");
        }
        return false;
    }
    return loadDocument(*this, doc, "<memory>", error, skipped_rows_, table_type_, version_);
}

bool Catalog::loadFromFile(const std::string &path, std::string *error)
{
    tinyxml2::XMLDocument doc;
    const auto            status = doc.LoadFile(path.c_str());
    if(status != tinyxml2::XML_SUCCESS)
    {
        if(error)
        {
            *error = "Failed to load XML: " + path;
        }
        return false;
    }
    return loadDocument(*this, doc, path, error, skipped_rows_, table_type_, version_);
}

void Catalog::add(AiDefinition definition)
{
    const auto it = index_.find(definition.code);
    if(it != index_.end())
    {
        entries_[it->second] = std::move(definition);
        return;
    }

    const std::size_t idx = entries_.size();
    std::string       code = definition.code;
    entries_.push_back(std::move(definition));
    insertTrie(code, idx);
    index_.insert_or_assign(std::move(code), idx);
}

void Catalog::insertTrie(const std::string &code, const std::size_t entry_index)
{
    std::size_t node = 0;
    for(const char ch: code)
    {
        const auto digit = static_cast<std::size_t>(ch - '0');
        if(trie_[node].children[digit] < 0)
        {
            trie_[node].children[digit] = static_cast<std::int32_t>(trie_.size());
            trie_.emplace_back();
        }
        node = static_cast<std::size_t>(trie_[node].children[digit]);
    }
    trie_[node].entry = static_cast<std::int32_t>(entry_index);
}

const AiDefinition *Catalog::lookup(const std::string_view code) const
{
    const auto it = index_.find(code);
    if(it == index_.end())
    {
        return nullptr;
    }
    return &entries_[it->second];
}

std::vector<AiMatch> Catalog::allMatches(const std::string_view text, const std::size_t pos) const
{
    std::vector<AiMatch> matches;
    std::size_t          node = 0;
    for(std::size_t i = 0; i < kMaxCodeLength && pos + i < text.size(); ++i)
    {
        const unsigned char ch = static_cast<unsigned char>(text[pos + i]);
        if(!std::isdigit(ch))
        {
            break;
        }
        const std::int32_t next = trie_[node].children[ch - '0'];
        if(next < 0)
        {
            break;
        }
        node = static_cast<std::size_t>(next);
        if(trie_[node].entry >= 0)
        {
            matches.push_back(AiMatch{&entries_[static_cast<std::size_t>(trie_[node].entry)], i + 1});
        }
    }
    std::ranges::reverse(matches);
    return matches;
}

AiMatch Catalog::longestMatch(const std::string_view text, const std::size_t pos) const
{
    const std::vector<AiMatch> matches = allMatches(text, pos);
    if(matches.empty())
    {
        return AiMatch{};
    }
    return matches.front();
}

}  // namespace gs1
