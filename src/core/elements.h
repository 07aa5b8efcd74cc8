/*
 * <Element symbols and system label parsing.>
 * Copyright (C) 2019 - 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

namespace Elements {

static const std::vector<std::string> ElementAbbr_Low = {
    "xXx", // leading index
    "h", "he",
    "li", "be", "b", "c", "n", "o", "f", "ne",
    "na", "mg", "al", "si", "p", "s", "cl", "ar",
    "k", "ca", "sc", "ti", "v", "cr", "mn", "fe", "co", "ni", "cu", "zn",
    "ga", "ge", "as", "se", "br", "kr",
    "rb", "sr", "y", "zr", "nb", "mo", "tc", "ru", "rh", "pd", "ag", "cd",
    "in", "sn", "sb", "te", "i", "xe",
    "cs", "ba", "la", "ce", "pr", "nd", "pm", "sm", "eu", "gd", "tb", "dy",
    "ho", "er", "tm", "yb", "lu", "hf", "ta", "w", "re", "os", "ir", "pt",
    "au", "hg", "tl", "pb", "bi", "po", "at", "rn"
};

/*! \brief Atomic number of an element symbol (case-insensitive), 0 if unknown */
inline int String2Element(std::string string)
{
    std::transform(string.begin(), string.end(), string.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (int i = 1; i < static_cast<int>(ElementAbbr_Low.size()); ++i) {
        if (string == ElementAbbr_Low[i])
            return i;
    }
    return 0;
}

/*! \brief Atomic numbers of a dot-separated system label, "f.h" -> {9, 1}
 *
 * Returns an empty vector if any symbol is unknown.
 */
inline std::vector<int> SystemLabel2Elements(const std::string& label)
{
    std::vector<int> elements;
    std::stringstream stream(label);
    std::string symbol;
    while (std::getline(stream, symbol, '.')) {
        int element = String2Element(symbol);
        if (element == 0)
            return {};
        elements.push_back(element);
    }
    return elements;
}

}
