/*
 * Copyright (C) 2019 Emeric Poupon
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

#include <optional>
#include <string>
#include <string_view>

namespace gamus::db
{
    // Role of an artist on a given release track, stored as text
    enum class ArtistRole
    {
        Performer,
        Featured,
        Composer,
        Producer,
        Remixer,
    };

    std::string_view toString(ArtistRole role);
    std::optional<ArtistRole> parseArtistRole(std::string_view str);

    // Release classification, parsing never fails: unknown values are kept as custom text
    class ReleaseType
    {
    public:
        enum class Kind
        {
            Album,
            EP,
            Single,
            Compilation,
            Mix,
            Custom,
        };

        ReleaseType(Kind kind = Kind::Album);
        static ReleaseType parse(std::string_view str);

        Kind getKind() const { return _kind; }
        std::string toString() const;

        bool operator==(const ReleaseType& other) const = default;

    private:
        ReleaseType(Kind kind, std::string_view customValue);

        Kind _kind;
        std::string _customValue;
    };
} // namespace gamus::db
