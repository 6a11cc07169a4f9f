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
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "database/objects/ArtistId.hpp"
#include "database/objects/ReleaseId.hpp"
#include "database/objects/SongId.hpp"
#include "services/scanner/IScannerService.hpp"

namespace gamus::db
{
    class IDb;
}

namespace gamus::library
{
    struct ArtistEntry
    {
        db::ArtistId id;
        std::string name;
        std::optional<std::string> bio;
    };

    struct NewArtist
    {
        std::string name;
        std::optional<std::string> bio;
    };

    struct SongEntry
    {
        db::SongId id;
        std::string title;
        std::optional<std::string> acoustId;
    };

    struct NewSong
    {
        std::string title;
        std::optional<std::string> acoustId;
    };

    struct ReleaseEntry
    {
        db::ReleaseId id;
        std::string title;
        std::optional<std::string> releaseDate;
        std::vector<std::string> mainArtists;
        std::size_t trackCount{};
    };

    // Request/response surface used by the user interface
    class ILibraryCommands
    {
    public:
        virtual ~ILibraryCommands() = default;

        // Starts a full import using the saved scanner config, returns once accepted
        // Throws scanner::ScanAlreadyInProgressException or scanner::InvalidScannerConfigException
        virtual void importFull(std::shared_ptr<scanner::IProgressObserver> observer) = 0;

        // Classifies the configured roots, nothing is extracted
        virtual scanner::ScanSummary scanLibrary() = 0;

        virtual scanner::ScannerConfig getScannerConfig() const = 0;
        virtual void saveScannerConfig(const scanner::ScannerConfig& config) = 0;

        // Ordered by name/title
        virtual std::vector<ArtistEntry> listArtists() = 0;
        virtual std::vector<SongEntry> listSongs() = 0;
        virtual std::vector<ReleaseEntry> listReleases() = 0;

        // Throws InvalidArgumentException if the name is empty once trimmed
        // Throws DuplicateArtistException if an artist already has this name (case insensitive)
        virtual ArtistEntry createArtist(const NewArtist& artist) = 0;

        // Throws InvalidArgumentException if the title is empty once trimmed
        virtual SongEntry createSong(const NewSong& song) = 0;
    };

    std::unique_ptr<ILibraryCommands> createLibraryCommands(db::IDb& db, scanner::IScannerService& scanner, const std::filesystem::path& scannerConfigPath);
} // namespace gamus::library
