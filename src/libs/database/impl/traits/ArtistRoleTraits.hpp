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

#pragma once

#include <string>

#include <Wt/Dbo/StdSqlTraits.h>

#include "database/Types.hpp"

namespace Wt::Dbo
{
    // Roles are stored by name
    template<>
    struct sql_value_traits<gamus::db::ArtistRole>
    {
        static const bool specialized = true;

        static std::string type(SqlConnection* conn, int size)
        {
            return sql_value_traits<std::string>::type(conn, size);
        }

        static void bind(gamus::db::ArtistRole role, SqlStatement* statement, int column, int size)
        {
            sql_value_traits<std::string>::bind(std::string{ gamus::db::toString(role) }, statement, column, size);
        }

        static bool read(gamus::db::ArtistRole& role, SqlStatement* statement, int column, int size)
        {
            std::string value;
            if (!sql_value_traits<std::string>::read(value, statement, column, size))
                return false;

            const std::optional<gamus::db::ArtistRole> parsedRole{ gamus::db::parseArtistRole(value) };
            if (!parsedRole)
                return false;

            role = *parsedRole;
            return true;
        }
    };
} // namespace Wt::Dbo
