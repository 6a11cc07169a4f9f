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

#include <set>

#include <gtest/gtest.h>

#include "core/UUID.hpp"

namespace gamus::core::tests
{
    TEST(UUID, caseInsensitive)
    {
        const std::optional<UUID> uuid1{ UUID::fromString("3f51c839-bee2-4e9d-a7b7-0693e45178fc") };
        const std::optional<UUID> uuid2{ UUID::fromString("3f51C839-bEE2-4e9d-a7B7-0693e45178fC") };

        ASSERT_TRUE(uuid1);
        EXPECT_EQ(uuid1, uuid2);
        EXPECT_EQ(uuid2->getAsString(), "3f51c839-bee2-4e9d-a7b7-0693e45178fc");
    }

    TEST(UUID, invalid)
    {
        EXPECT_FALSE(UUID::fromString(""));
        EXPECT_FALSE(UUID::fromString("3f51c839bee24e9da7b70693e45178fc"));
        EXPECT_FALSE(UUID::fromString("3f51c839-bee2-4e9d-a7b7-0693e45178fg"));
    }

    TEST(UUID, generate)
    {
        std::set<UUID> uuids;
        for (std::size_t i{}; i < 100; ++i)
        {
            const UUID uuid{ UUID::generate() };
            ASSERT_EQ(uuid.getAsString().size(), 36);
            EXPECT_EQ(uuid.getAsString()[14], '4');
            EXPECT_TRUE(UUID::fromString(uuid.getAsString()));
            uuids.insert(uuid);
        }
        EXPECT_EQ(uuids.size(), 100);
    }
} // namespace gamus::core::tests
