/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   src/gs1_options.cc
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

#include "gs1_options.h"

#include <tinyxml2.h>
#include <utility>

namespace gs1
{

namespace
{

    void readFlag(const tinyxml2::XMLElement *element, const char *name, bool &target)
    {
        if(const char *value = element->Attribute(name))
        {
            target = Catalog::isYesAttr(value);
        }
    }

    bool readSize(const tinyxml2::XMLElement *element,
                  const char                 *name,
                  const unsigned              min_value,
                  std::size_t                &target,
                  std::string                *error)
    {
        if(!element->Attribute(name))
        {
            return true;
        }
        unsigned value = 0;
        if(element->QueryUnsignedAttribute(name, &value) != tinyxml2::XML_SUCCESS || value < min_value)
        {
            if(error)
            {
                *error = std::string("Invalid value for <") + element->Name() + " " + name
                         + ">: " + element->Attribute(name);
            }
            return false;
        }
        target = value;
        return true;
    }

    bool readWeight(const tinyxml2::XMLElement *element, const char *name, double &target, std::string *error)
    {
        if(!element->Attribute(name))
        {
            return true;
        }
        double value = 0.0;
        if(element->QueryDoubleAttribute(name, &value) != tinyxml2::XML_SUCCESS)
        {
            if(error)
            {
                *error = std::string("Invalid weight ") + name + ": " + element->Attribute(name);
            }
            return false;
        }
        target = value;
        return true;
    }

    bool readParser(const tinyxml2::XMLElement *parser, ParseOptions &options, std::string *error)
    {
        readFlag(parser, "strict", options.strict_mode);
        readFlag(parser, "normalize_separators", options.normalize_separators);
        readFlag(parser, "allow_ambiguity", options.allow_ambiguity);
        if(!readSize(parser, "max_alternatives", 0, options.max_alternatives, error))
        {
            return false;
        }
        if(parser->Attribute("century_pivot"))
        {
            int pivot = 0;
            if(parser->QueryIntAttribute("century_pivot", &pivot) != tinyxml2::XML_SUCCESS || pivot < 0 || pivot > 99)
            {
                if(error)
                {
                    *error = std::string("Invalid century_pivot: ") + parser->Attribute("century_pivot");
                }
                return false;
            }
            options.century_pivot = pivot;
        }
        return true;
    }

    bool readWeights(const tinyxml2::XMLElement *weights, ScoringWeights &target, std::string *error)
    {
        const std::pair<const char *, double *> fields[] = {
            {"valid_gtin", &target.valid_gtin},
            {"valid_expiry", &target.valid_expiry},
            {"unknown_day_penalty", &target.unknown_day_penalty},
            {"tail_order", &target.tail_order},
            {"embedded_expiry", &target.embedded_expiry},
            {"full_order", &target.full_order},
            {"standard_start", &target.standard_start},
            {"batch_length", &target.batch_length},
            {"serial_length", &target.serial_length},
            {"absorbable_internal", &target.absorbable_internal},
            {"repeated_batch", &target.repeated_batch},
            {"repeated_serial", &target.repeated_serial},
            {"internal_with_batch_and_serial", &target.internal_with_batch_and_serial},
            {"long_batch", &target.long_batch},
            {"short_serial", &target.short_serial},
            {"concise", &target.concise},
            {"ambiguity_gap", &target.ambiguity_gap},
        };
        for(const auto &[name, field]: fields)
        {
            if(!readWeight(weights, name, *field, error))
            {
                return false;
            }
        }
        return true;
    }

    bool loadOptionsDocument(const tinyxml2::XMLDocument &doc,
                             const std::string           &source,
                             ParseOptions                &options,
                             std::string                 *error)
    {
        const tinyxml2::XMLElement *root = doc.FirstChildElement("gs1decoder");
        if(!root)
        {
            if(error)
            {
                *error = "Missing <gs1decoder> root element in " + source;
            }
            return false;
        }

        ParseOptions loaded = options;

        if(const tinyxml2::XMLElement *parser = root->FirstChildElement("parser"))
        {
            if(!readParser(parser, loaded, error))
            {
                return false;
            }
        }

        if(const tinyxml2::XMLElement *beam = root->FirstChildElement("beam"))
        {
            if(!readSize(beam, "width", 1, loaded.beam_width, error)
               || !readSize(beam, "max_iterations", 1, loaded.max_beam_iterations, error))
            {
                return false;
            }
        }

        if(const tinyxml2::XMLElement *solver = root->FirstChildElement("solver"))
        {
            if(!readSize(solver, "max_positions", 1, loaded.max_solver_positions, error)
               || !readSize(solver, "max_depth", 1, loaded.max_solver_depth, error))
            {
                return false;
            }
        }

        if(const tinyxml2::XMLElement *whitelist = root->FirstChildElement("whitelist"))
        {
            loaded.vendor_whitelist.clear();
            for(const tinyxml2::XMLElement *ai = whitelist->FirstChildElement("ai"); ai;
                ai = ai->NextSiblingElement("ai"))
            {
                const char *code = ai->Attribute("code");
                if(!code || !isInternalAi(code))
                {
                    if(error)
                    {
                        *error = std::string("Whitelist entry is not an internal-use AI: ") + (code ? code : "");
                    }
                    return false;
                }
                loaded.vendor_whitelist.insert(code);
            }
        }

        if(const tinyxml2::XMLElement *weights = root->FirstChildElement("weights"))
        {
            if(!readWeights(weights, loaded.weights, error))
            {
                return false;
            }
        }

        options = std::move(loaded);
        return true;
    }

}  // namespace

bool loadOptionsFromString(const std::string_view xml, ParseOptions &options, std::string *error)
{
    tinyxml2::XMLDocument doc;
    const auto            status = doc.Parse(xml.data(), xml.size());
    if(status != tinyxml2::XML_SUCCESS)
    {
        if(error)
        {
            *error = "Failed to parse options XML: " + std::string(doc.ErrorStr() ? doc.ErrorStr() : "");
        }
        return false;
    }
    return loadOptionsDocument(doc, "<memory>", options, error);
}

bool loadOptionsFromFile(const std::string &path, ParseOptions &options, std::string *error)
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
    return loadOptionsDocument(doc, path, options, error);
}

}  // namespace gs1
