/*
 * Repository:  https://github.com/kingkybel/Gs1Decoder
 * File Name:   test/unit/gs1_test_utils.h
 * Description: Shared fixtures and file helpers for the Gs1Decoder test suite.
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

#ifndef GS1DECODER_GS1_TEST_UTILS_H_INCLUDED
#define GS1DECODER_GS1_TEST_UTILS_H_INCLUDED

#include "gs1_types.h"

#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>

namespace gs1::test
{

class TempDir
{
    public:
    TempDir()
    {
        const auto        base = std::filesystem::temp_directory_path();
        const std::string name = "gs1decoder_test_" + std::to_string(::getpid()) + "_"
                                 + std::to_string(std::chrono::high_resolution_clock::now().time_since_epoch().count());
        path_ = base / name;
        std::filesystem::create_directories(path_);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir &)            = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const
    {
        return path_;
    }

    private:
    std::filesystem::path path_;
};

inline bool writeFile(const std::filesystem::path &path, const std::string &contents)
{
    std::ofstream out(path);
    if(!out)
    {
        return false;
    }
    out << contents;
    return out.good();
}

inline std::filesystem::path barcodeFile(const std::string &file_name)
{
    return std::filesystem::path(GS1DECODER_SOURCE_DIR) / "test/unit/test_barcodes" / file_name;
}

/**
 * @brief Reads one barcode per line, skipping blank lines and `#` comments.
 */
inline std::vector<std::string> readBarcodeFile(const std::filesystem::path &path)
{
    std::ifstream            in(path);
    std::vector<std::string> barcodes;

    std::string line;
    while(std::getline(in, line))
    {
        if(line.empty() || line[0] == '#')
        {
            continue;
        }
        barcodes.emplace_back(std::move(line));
    }

    return barcodes;
}

/**
 * @brief One line of a ground-truth file: `<barcode> <ai>:<raw value> ...`.
 */
struct GroundTruth
{
    std::string                                      barcode;
    std::vector<std::pair<std::string, std::string>> expected;
};

inline std::vector<GroundTruth> readGroundTruthFile(const std::filesystem::path &path)
{
    std::vector<GroundTruth> cases;
    for(const std::string &line: readBarcodeFile(path))
    {
        std::istringstream in(line);
        GroundTruth        truth;
        in >> truth.barcode;

        std::string token;
        while(in >> token)
        {
            const std::size_t colon = token.find(':');
            if(colon == std::string::npos)
            {
                continue;
            }
            truth.expected.emplace_back(token.substr(0, colon), token.substr(colon + 1));
        }
        cases.push_back(std::move(truth));
    }
    return cases;
}

inline std::string paramName(std::string name)
{
    for(char &ch: name)
    {
        if(!std::isalnum(static_cast<unsigned char>(ch)))
        {
            ch = '_';
        }
    }
    return name;
}

inline std::vector<std::string> rawValues(const std::vector<ParsedElement> &elements)
{
    std::vector<std::string> values;
    for(const auto &element: elements)
    {
        values.push_back(element.raw_value);
    }
    return values;
}

}  // namespace gs1::test

#endif  // GS1DECODER_GS1_TEST_UTILS_H_INCLUDED
