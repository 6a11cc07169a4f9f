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

#pragma once

#include <charconv>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace Wt
{
    class WDateTime;
} // namespace Wt

namespace gamus::core::stringUtils
{
    // empty fields are kept: ";Rock;" gives { "", "Rock", "" }
    [[nodiscard]] std::vector<std::string_view> splitString(std::string_view string, char separator);
    [[nodiscard]] std::string joinStrings(std::span<const std::string> strings, std::string_view delimiter);

    [[nodiscard]] std::string_view stringTrim(std::string_view str, std::string_view whitespaces = " \t\r");
    [[nodiscard]] std::string stringToLower(std::string_view str);

    // Key used to match artist and release names: trimmed (spaces, tabs, newlines) and ASCII lower-cased
    [[nodiscard]] std::string normalizeForMatching(std::string_view str);

    [[nodiscard]] bool stringCaseInsensitiveEqual(std::string_view strA, std::string_view strB);

    // The whole string must be consumed: "3/12" and " 3" are rejected
    template<typename T>
    [[nodiscard]] std::optional<T> readAs(std::string_view str)
    {
        static_assert(std::is_integral_v<T>);

        T res{};
        const auto [ptr, ec]{ std::from_chars(str.data(), str.data() + str.size(), res) };
        if (ec != std::errc{} || ptr != str.data() + str.size())
            return std::nullopt;

        return res;
    }

    // UTC, millisecond precision, used to timestamp log lines
    [[nodiscard]] std::string toISO8601String(const Wt::WDateTime& dateTime);
} // namespace gamus::core::stringUtils
