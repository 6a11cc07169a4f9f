/*
 * Copyright (C) 2023 Emeric Poupon
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

#include <gtest/gtest.h>

#include <Wt/WDate.h>
#include <Wt/WDateTime.h>
#include <Wt/WTime.h>

#include "core/String.hpp"

namespace gamus::core::stringUtils::tests
{
    TEST(StringUtils, splitString)
    {
        struct TestCase
        {
            std::string_view input;
            char delimiter;
            std::vector<std::string_view> expectedOutput;
        };

        TestCase tests[]{
            { "abc", '-', { "abc" } },
            { "", '-', { "" } },
            { "a-b-c", '-', { "a", "b", "c" } },
            { ";b;c", ';', { "", "b", "c" } },
            { "a;b; ", ';', { "a", "b", " " } },
            { ";", ';', { "", "" } },
            { "Rock;Pop", ';', { "Rock", "Pop" } },
        };

        for (const TestCase& test : tests)
        {
            const std::vector<std::string_view> res{ splitString(test.input, test.delimiter) };
            EXPECT_EQ(res, test.expectedOutput) << "Input = '" << test.input << "', delims = '" << test.delimiter << "'";
        }
    }

    TEST(StringUtils, joinStrings)
    {
        const std::vector<std::string> extensions{ "mp3", "", "flac" };
        EXPECT_EQ(joinStrings(extensions, ","), "mp3,,flac");

        const std::vector<std::string> single{ "The Beatles" };
        EXPECT_EQ(joinStrings(single, ", "), "The Beatles");

        EXPECT_EQ(joinStrings(std::vector<std::string>{}, ", "), "");
    }

    TEST(StringUtils, stringTrim)
    {
        EXPECT_EQ(stringTrim(""), "");
        EXPECT_EQ(stringTrim("   "), "");
        EXPECT_EQ(stringTrim(" \tBeatles\r "), "Beatles");
        EXPECT_EQ(stringTrim("The Beatles"), "The Beatles");
        EXPECT_EQ(stringTrim("-- 01 --", " -"), "01");
    }

    TEST(StringUtils, normalizeForMatching)
    {
        EXPECT_EQ(normalizeForMatching(""), "");
        EXPECT_EQ(normalizeForMatching("  The BEATLES \t"), "the beatles");
        EXPECT_EQ(normalizeForMatching("the beatles\n"), "the beatles");
        EXPECT_EQ(normalizeForMatching("AC  DC"), "ac  dc");
    }

    TEST(StringUtils, stringCaseInsensitiveEqual)
    {
        EXPECT_TRUE(stringCaseInsensitiveEqual("FLAC", "flac"));
        EXPECT_TRUE(stringCaseInsensitiveEqual("", ""));
        EXPECT_FALSE(stringCaseInsensitiveEqual("flac", "flac "));
        EXPECT_FALSE(stringCaseInsensitiveEqual("flac", "fla"));
    }

    TEST(StringUtils, readAs)
    {
        EXPECT_EQ(readAs<int>("1024"), 1024);
        EXPECT_EQ(readAs<int>("-1"), -1);
        EXPECT_EQ(readAs<int>("07"), 7);
        EXPECT_EQ(readAs<int>(""), std::nullopt);
        EXPECT_EQ(readAs<int>("a"), std::nullopt);
        EXPECT_EQ(readAs<int>("3/12"), std::nullopt);
        EXPECT_EQ(readAs<int>(" 3"), std::nullopt);
        EXPECT_EQ(readAs<int>("a1024a"), std::nullopt);
        EXPECT_EQ(readAs<unsigned>("4"), 4u);
        EXPECT_EQ(readAs<unsigned char>("256"), std::nullopt);
    }

    TEST(StringUtils, toISO8601String)
    {
        {
            const Wt::WDateTime dateTime{ Wt::WDate{ 2020, 01, 03 }, Wt::WTime{ 9, 8, 11, 75 } };
            EXPECT_EQ(toISO8601String(dateTime), "2020-01-03T09:08:11.075Z");
        }

        {
            const Wt::WDateTime dateTime;
            EXPECT_EQ(toISO8601String(dateTime), "");
        }
    }
} // namespace gamus::core::stringUtils::tests
