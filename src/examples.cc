/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   src/examples.cc
 * Description: CLI examples for decoding GS1 element strings.
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

#include "gs1_decoder.h"
#include "gs1_options.h"

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <variant>

namespace
{

void printValue(const gs1::ElementValue &value)
{
    if(const auto as_string = std::get_if<std::string>(&value))
    {
        std::cout << " [typed string: " << *as_string << "]";
    }
    else if(const auto as_double = std::get_if<double>(&value))
    {
        std::cout << " [typed double: " << *as_double << "]";
    }
}

void printElements(const std::vector<gs1::ParsedElement> &elements, std::string_view indent)
{
    for(const auto &element : elements)
    {
        std::cout << indent << "(" << element.ai << ")";
        if(!element.title.empty())
        {
            std::cout << " " << element.title;
        }
        std::cout << " = " << element.raw_value;
        printValue(element.value);
        if(!element.valid)
        {
            std::cout << " INVALID";
        }
        std::cout << "\n";
        for(const auto &error : element.errors)
        {
            std::cout << indent << "    ! " << error << "\n";
        }
    }
}

void printResult(const gs1::ParseResult &result)
{
    if(result.symbology_removed)
    {
        std::cout << "Symbology: " << result.symbology_identifier << " (" << result.symbology_name << ")\n";
    }
    std::cout << "Engine: " << gs1::toString(result.engine) << " Confidence: " << result.confidence << "\n";
    std::cout << "Elements:\n";
    printElements(result.elements, "  ");

    for(const auto &diagnostic : result.diagnostics)
    {
        std::cout << (diagnostic.severity == gs1::Severity::kError ? "Error " : "Warning ")
                  << gs1::toString(diagnostic.code) << ": " << diagnostic.message << "\n";
    }
    for(const auto &violation : result.validation_errors)
    {
        std::cout << "Structure: " << violation << "\n";
    }

    std::size_t rank = 1;
    for(const auto &alternative : result.alternatives)
    {
        std::cout << "Alternative " << rank++ << " (confidence " << alternative.confidence << "):\n";
        printElements(alternative.elements, "    ");
    }
}

void runDecodeExample(const gs1::Decoder &decoder, std::string_view title, const std::string &barcode)
{
    std::cout << "\n=== " << title << " ===\n";
    std::cout << "Input: " << barcode << "\n";
    printResult(decoder.decode(barcode));
}

}  // namespace

int main(int argc, char **argv)
{
    gs1::ParseOptions options;
    std::string       error;

    if(const char *options_file = std::getenv("GS1DECODER_OPTIONS"))
    {
        if(!gs1::loadOptionsFromFile(options_file, options, &error))
        {
            std::cerr << "Options load warning: " << error << "\n";
        }
        else
        {
            std::cout << "Options file: " << options_file << "\n";
        }
    }

    const gs1::Decoder decoder(options);

    if(argc > 1)
    {
        for(int idx = 1; idx < argc; ++idx)
        {
            runDecodeExample(decoder, "Command line input", argv[idx]);
        }
        return 0;
    }

    runDecodeExample(decoder,
                     "Example 1: separator-delimited element string",
                     "0109506000134352" "17201225" "10ABC123" "\x1d" "21SER456");
    runDecodeExample(decoder, "Example 2: symbology identifier and stand-in separators", "]d20109506000134352|3103001250");
    runDecodeExample(decoder, "Example 3: no separators at all", "01062850960028771726033110HN8X2172869453519267");
    runDecodeExample(decoder, "Example 4: companion check", "21SERIAL0001");
    runDecodeExample(decoder, "Example 5: invalid check digit", "0109506000134353");

    return 0;
}
