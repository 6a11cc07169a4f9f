/*
 * Copyright (C) 2013 Emeric Poupon
 *
 * This file is part of Gamus.
 *
 * Gamus is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Gamus is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Gamus.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "core/String.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

#include <Wt/WDateTime.h>

namespace gamus::core::stringUtils
{
    std::vector<std::string_view> splitString(std::string_view str, char separator)
    {
        std::vector<std::string_view> res;

        std::size_t currentPos{};
        for (std::size_t pos{ str.find(separator) }; pos != std::string_view::npos; pos = str.find(separator, currentPos))
        {
            res.push_back(str.substr(currentPos, pos - currentPos));
            currentPos = pos + 1;
        }
        res.push_back(str.substr(currentPos));

        return res;
    }

    std::string joinStrings(std::span<const std::string> strings, std::string_view delimiter)
    {
        std::string res;

        for (std::size_t i{}; i < strings.size(); ++i)
        {
            if (i > 0)
                res += delimiter;
            res += strings[i];
        }

        return res;
    }

    std::string_view stringTrim(std::string_view str, std::string_view whitespaces)
    {
        const std::size_t strBegin{ str.find_first_not_of(whitespaces) };
        if (strBegin == std::string_view::npos)
            return {};

        const std::size_t strEnd{ str.find_last_not_of(whitespaces) };
        return str.substr(strBegin, strEnd - strBegin + 1);
    }

    std::string stringToLower(std::string_view str)
    {
        std::string res;
        res.reserve(str.size());

        std::transform(std::cbegin(str), std::cend(str), std::back_inserter(res), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        return res;
    }

    std::string normalizeForMatching(std::string_view str)
    {
        return stringToLower(stringTrim(str, " \t\r\n"));
    }

    bool stringCaseInsensitiveEqual(std::string_view strA, std::string_view strB)
    {
        return std::equal(std::cbegin(strA), std::cend(strA), std::cbegin(strB), std::cend(strB), [](unsigned char a, unsigned char b) {
            return std::tolower(a) == std::tolower(b);
        });
    }

    std::string toISO8601String(const Wt::WDateTime& dateTime)
    {
        if (!dateTime.isValid())
            return "";

        return dateTime.toString("yyyy-MM-ddThh:mm:ss.zzz", false).toUTF8() + 'Z';
    }
} // namespace gamus::core::stringUtils
