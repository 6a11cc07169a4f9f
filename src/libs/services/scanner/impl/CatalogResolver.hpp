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

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "database/objects/Artist.hpp"
#include "database/objects/Release.hpp"
#include "database/objects/ReleaseTrack.hpp"

namespace gamus::audio
{
    struct FileMetadata;
}

namespace gamus::db
{
    class Session;
}

namespace gamus::scanner
{
    inline constexpr std::string_view unknownValue{ "Unknown" };

    // Catalog values for a file: embedded tag > file name token > "Unknown"
    struct TrackHints
    {
        std::string title;
        std::string artist;
        std::string album;
        std::string albumArtist;
        std::optional<std::string> date;
        std::optional<std::string> genre;
        int trackNumber{ 1 };
        int discNumber{ db::ReleaseTrack::defaultDiscNumber };
    };

    TrackHints computeTrackHints(const audio::FileMetadata& metadata);

    struct GenreSplit
    {
        std::vector<std::string> genres; // top level genres, canonical spelling
        std::vector<std::string> styles; // anything else, as tagged
    };

    // Values are separated by ';'
    GenreSplit splitGenreTag(std::string_view genreTag);

    // All the functions below need a write transaction

    // Matches the trimmed, case-folded name against names and variations, creates the artist if needed
    db::Artist::pointer resolveArtist(db::Session& session, std::string_view rawName);

    // Matches the normalized title for the same main artist, creates the release if needed
    db::Release::pointer resolveRelease(db::Session& session, const TrackHints& hints);

    // Returns the track at the (release, disc, track) coordinate, created if needed
    db::ReleaseTrack::pointer resolveReleaseTrack(db::Session& session, const TrackHints& hints);

    // Records the cover/folder/front image found in directory, if any
    void associateReleaseArtwork(db::Session& session, db::Release::pointer release, const std::filesystem::path& directory);
} // namespace gamus::scanner
