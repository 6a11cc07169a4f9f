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

#include "database/Types.hpp"

#include <array>
#include <utility>

#include "core/String.hpp"

namespace gamus::db
{
    namespace
    {
        constexpr std::array<std::pair<ArtistRole, std::string_view>, 5> artistRoleNames{ {
            { ArtistRole::Performer, "Performer" },
            { ArtistRole::Featured, "Featured" },
            { ArtistRole::Composer, "Composer" },
            { ArtistRole::Producer, "Producer" },
            { ArtistRole::Remixer, "Remixer" },
        } };

        constexpr std::array<std::pair<std::string_view, ReleaseType::Kind>, 11> releaseTypeAliases{ {
            { "album", ReleaseType::Kind::Album },
            { "cd", ReleaseType::Kind::Album },
            { "lp", ReleaseType::Kind::Album },
            { "vinyl", ReleaseType::Kind::Album },
            { "album/cd", ReleaseType::Kind::Album },
            { "ep", ReleaseType::Kind::EP },
            { "single", ReleaseType::Kind::Single },
            { "compilation", ReleaseType::Kind::Compilation },
            { "mix", ReleaseType::Kind::Mix },
            { "dj-mix", ReleaseType::Kind::Mix },
            { "mixtape", ReleaseType::Kind::Mix },
        } };
    } // namespace

    std::string_view toString(ArtistRole role)
    {
        for (const auto& [value, name] : artistRoleNames)
        {
            if (value == role)
                return name;
        }

        return "";
    }

    std::optional<ArtistRole> parseArtistRole(std::string_view str)
    {
        for (const auto& [value, name] : artistRoleNames)
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(name, str))
                return value;
        }

        return std::nullopt;
    }

    ReleaseType::ReleaseType(Kind kind)
        : _kind{ kind }
    {
    }

    ReleaseType::ReleaseType(Kind kind, std::string_view customValue)
        : _kind{ kind }
        , _customValue{ customValue }
    {
    }

    ReleaseType ReleaseType::parse(std::string_view str)
    {
        const std::string normalized{ core::stringUtils::stringToLower(core::stringUtils::stringTrim(str)) };

        for (const auto& [alias, kind] : releaseTypeAliases)
        {
            if (alias == normalized)
                return ReleaseType{ kind };
        }

        return ReleaseType{ Kind::Custom, str };
    }

    std::string ReleaseType::toString() const
    {
        switch (_kind)
        {
        case Kind::Album:
            return "Album";
        case Kind::EP:
            return "EP";
        case Kind::Single:
            return "Single";
        case Kind::Compilation:
            return "Compilation";
        case Kind::Mix:
            return "Mix";
        case Kind::Custom:
            break;
        }

        return _customValue;
    }
} // namespace gamus::db
