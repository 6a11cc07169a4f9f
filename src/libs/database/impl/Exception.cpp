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

#include "database/Exception.hpp"

#include <array>
#include <string_view>

#include <Wt/Dbo/Exception.h>

namespace gamus::db
{
    namespace
    {
        // sqlite3 messages denoting a store that cannot be used anymore
        constexpr std::array<std::string_view, 6> unavailableMessages{
            "unable to open database file",
            "disk I/O error",
            "database disk image is malformed",
            "file is not a database",
            "database or disk is full",
            "getConnection(): timeout",
        };
    } // namespace

    bool isCatalogUnavailableError(const std::exception& e)
    {
        if (dynamic_cast<const CatalogUnavailableException*>(&e))
            return true;

        if (!dynamic_cast<const Wt::Dbo::Exception*>(&e))
            return false;

        const std::string_view message{ e.what() };
        for (const std::string_view unavailableMessage : unavailableMessages)
        {
            if (message.find(unavailableMessage) != std::string_view::npos)
                return true;
        }

        return false;
    }
} // namespace gamus::db
