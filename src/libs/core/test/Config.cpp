/*
 * Copyright (C) 2025 Emeric Poupon
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

#include <fstream>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"

namespace gamus::core::tests
{
    namespace
    {
        std::filesystem::path writeConfigFile(std::string_view content)
        {
            const std::filesystem::path path{ std::filesystem::temp_directory_path() / "gamus-config-test.conf" };
            std::ofstream ofs{ path };
            ofs << content;
            return path;
        }
    } // namespace

    TEST(Config, values)
    {
        const std::filesystem::path path{ writeConfigFile(R"(
working-dir = "/var/gamus";
scanner-thread-count = 4;
db-connection-count = 4L;
db-show-queries = true;
)") };

        auto config{ createConfig(path) };
        EXPECT_EQ(config->getString("working-dir", ""), "/var/gamus");
        EXPECT_EQ(config->getPath("working-dir", ""), std::filesystem::path{ "/var/gamus" });
        EXPECT_EQ(config->getULong("scanner-thread-count", 1), 4);
        EXPECT_EQ(config->getULong("db-connection-count", 10), 4);
        EXPECT_TRUE(config->getBool("db-show-queries", false));

        std::filesystem::remove(path);
    }

    TEST(Config, defaults)
    {
        const std::filesystem::path path{ writeConfigFile("") };

        auto config{ createConfig(path) };
        EXPECT_EQ(config->getString("log-file", "none"), "none");
        EXPECT_EQ(config->getULong("db-connection-count", 10), 10);
        EXPECT_FALSE(config->getBool("db-show-queries", false));
        EXPECT_EQ(config->getPath("db-path", "/var/gamus/gamus.db"), std::filesystem::path{ "/var/gamus/gamus.db" });

        std::filesystem::remove(path);
    }

    TEST(Config, errors)
    {
        EXPECT_THROW(createConfig("/nonexistent/gamus.conf"), GamusException);

        const std::filesystem::path path{ writeConfigFile("working-dir = ") };
        EXPECT_THROW(createConfig(path), GamusException);
        std::filesystem::remove(path);
    }

    TEST(Config, wrongTypes)
    {
        const std::filesystem::path path{ writeConfigFile(R"(
db-path = 12;
db-show-queries = "yes";
scanner-thread-count = -2;
)") };

        auto config{ createConfig(path) };
        EXPECT_THROW(config->getPath("db-path", ""), GamusException);
        EXPECT_THROW(config->getBool("db-show-queries", false), GamusException);
        EXPECT_THROW(config->getULong("scanner-thread-count", 1), GamusException);

        std::filesystem::remove(path);
    }
} // namespace gamus::core::tests
