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

#include "services/library/ILibraryCommands.hpp"

namespace gamus::library
{
    class LibraryCommands : public ILibraryCommands
    {
    public:
        LibraryCommands(db::IDb& db, scanner::IScannerService& scanner, const std::filesystem::path& scannerConfigPath);
        ~LibraryCommands() override = default;
        LibraryCommands(const LibraryCommands&) = delete;
        LibraryCommands& operator=(const LibraryCommands&) = delete;

    private:
        void importFull(std::shared_ptr<scanner::IProgressObserver> observer) override;
        scanner::ScanSummary scanLibrary() override;

        scanner::ScannerConfig getScannerConfig() const override;
        void saveScannerConfig(const scanner::ScannerConfig& config) override;

        std::vector<ArtistEntry> listArtists() override;
        std::vector<SongEntry> listSongs() override;
        std::vector<ReleaseEntry> listReleases() override;

        ArtistEntry createArtist(const NewArtist& artist) override;
        SongEntry createSong(const NewSong& song) override;

        db::IDb& _db;
        scanner::IScannerService& _scanner;
        const std::filesystem::path _scannerConfigPath;
    };
} // namespace gamus::library
