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

#include <Wt/Dbo/ptr.h>

#include "database/objects/ArtistId.hpp"
#include "database/objects/ArtworkId.hpp"
#include "database/objects/LibraryFileId.hpp"
#include "database/objects/ReleaseId.hpp"
#include "database/objects/ReleaseTrackId.hpp"
#include "database/objects/SongId.hpp"

// All catalog objects are keyed by a natural string id: no surrogate id, no version field
#define GAMUS_DECLARE_DBO_TRAITS(className, idTypeName)                  \
    namespace gamus::db                                                  \
    {                                                                    \
        class className;                                                 \
    }                                                                    \
    namespace Wt::Dbo                                                    \
    {                                                                    \
        template<>                                                       \
        struct dbo_traits<gamus::db::className> : public dbo_default_traits \
        {                                                                \
            using IdType = gamus::db::idTypeName;                        \
            static IdType invalidId() { return IdType{}; }               \
            static const char* surrogateIdField() { return nullptr; }    \
            static const char* versionField() { return nullptr; }        \
        };                                                               \
    }

GAMUS_DECLARE_DBO_TRAITS(Artist, ArtistId)
GAMUS_DECLARE_DBO_TRAITS(ArtistVariation, ArtistVariationId)
GAMUS_DECLARE_DBO_TRAITS(ArtistSite, ArtistSiteId)
GAMUS_DECLARE_DBO_TRAITS(Artwork, ArtworkId)
GAMUS_DECLARE_DBO_TRAITS(LibraryFile, LibraryFileId)
GAMUS_DECLARE_DBO_TRAITS(Release, ReleaseId)
GAMUS_DECLARE_DBO_TRAITS(ReleaseMainArtist, ReleaseMainArtistId)
GAMUS_DECLARE_DBO_TRAITS(ReleaseTypeLink, ReleaseTypeLinkId)
GAMUS_DECLARE_DBO_TRAITS(ReleaseGenre, ReleaseGenreId)
GAMUS_DECLARE_DBO_TRAITS(ReleaseStyle, ReleaseStyleId)
GAMUS_DECLARE_DBO_TRAITS(ReleaseTrack, ReleaseTrackId)
GAMUS_DECLARE_DBO_TRAITS(ReleaseTrackArtist, ReleaseTrackArtistId)
GAMUS_DECLARE_DBO_TRAITS(Song, SongId)
