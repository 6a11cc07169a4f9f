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

#include "LibraryCommands.hpp"

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Artist.hpp"
#include "database/objects/Release.hpp"
#include "database/objects/Song.hpp"
#include "services/library/Exception.hpp"
#include "services/scanner/ScannerConfig.hpp"

namespace gamus::library
{
    namespace
    {
        constexpr std::string_view whitespaces{ " \t\r\n" };

        std::optional<std::string> trimOptional(const std::optional<std::string>& str)
        {
            if (!str)
                return std::nullopt;

            const std::string_view trimmed{ core::stringUtils::stringTrim(*str, whitespaces) };
            if (trimmed.empty())
                return std::nullopt;

            return std::string{ trimmed };
        }

        ArtistEntry toEntry(const db::Artist::pointer& artist)
        {
            return ArtistEntry{ .id = artist->getId(), .name = artist->getName(), .bio = artist->getBio() };
        }

        SongEntry toEntry(const db::Song::pointer& song)
        {
            return SongEntry{ .id = song->getId(), .title = song->getTitle(), .acoustId = song->getAcoustId() };
        }
    } // namespace

    std::unique_ptr<ILibraryCommands> createLibraryCommands(db::IDb& db, scanner::IScannerService& scanner, const std::filesystem::path& scannerConfigPath)
    {
        return std::make_unique<LibraryCommands>(db, scanner, scannerConfigPath);
    }

    LibraryCommands::LibraryCommands(db::IDb& db, scanner::IScannerService& scanner, const std::filesystem::path& scannerConfigPath)
        : _db{ db }
        , _scanner{ scanner }
        , _scannerConfigPath{ scannerConfigPath }
    {
    }

    void LibraryCommands::importFull(std::shared_ptr<scanner::IProgressObserver> observer)
    {
        const scanner::ScannerConfig config{ getScannerConfig() };

        GAMUS_LOG(SERVICE, INFO, "Full import requested on " << config.roots.size() << " root(s)");
        _scanner.requestImport(config, std::move(observer));
    }

    scanner::ScanSummary LibraryCommands::scanLibrary()
    {
        return _scanner.classify(getScannerConfig());
    }

    scanner::ScannerConfig LibraryCommands::getScannerConfig() const
    {
        return scanner::readScannerConfig(_scannerConfigPath);
    }

    void LibraryCommands::saveScannerConfig(const scanner::ScannerConfig& config)
    {
        scanner::writeScannerConfig(_scannerConfigPath, config);
    }

    std::vector<ArtistEntry> LibraryCommands::listArtists()
    {
        std::vector<ArtistEntry> res;

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        db::Artist::find(session, [&](const db::Artist::pointer& artist) {
            res.push_back(toEntry(artist));
        });

        return res;
    }

    std::vector<SongEntry> LibraryCommands::listSongs()
    {
        std::vector<SongEntry> res;

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        db::Song::find(session, [&](const db::Song::pointer& song) {
            res.push_back(toEntry(song));
        });

        return res;
    }

    std::vector<ReleaseEntry> LibraryCommands::listReleases()
    {
        std::vector<ReleaseEntry> res;

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        db::Release::find(session, [&](const db::Release::pointer& release) {
            ReleaseEntry& entry{ res.emplace_back() };
            entry.id = release->getId();
            entry.title = release->getTitle();
            entry.releaseDate = release->getReleaseDate();
            entry.trackCount = release->getTrackCount();

            for (const db::ArtistId artistId : release->getMainArtistIds())
            {
                if (const db::Artist::pointer artist{ db::Artist::find(session, artistId) })
                    entry.mainArtists.push_back(artist->getName());
            }
        });

        return res;
    }

    ArtistEntry LibraryCommands::createArtist(const NewArtist& newArtist)
    {
        const std::string_view name{ core::stringUtils::stringTrim(newArtist.name, whitespaces) };
        if (name.empty())
            throw InvalidArgumentException{ "Artist name must not be empty" };

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        if (db::Artist::findByNormalizedName(session, core::stringUtils::normalizeForMatching(name)))
            throw DuplicateArtistException{ name };

        const db::Artist::pointer artist{ session.create<db::Artist>(name, trimOptional(newArtist.bio)) };
        GAMUS_LOG(SERVICE, DEBUG, "Created artist '" << artist->getName() << "'");

        return toEntry(artist);
    }

    SongEntry LibraryCommands::createSong(const NewSong& newSong)
    {
        const std::string_view title{ core::stringUtils::stringTrim(newSong.title, whitespaces) };
        if (title.empty())
            throw InvalidArgumentException{ "Song title must not be empty" };

        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createWriteTransaction() };

        const db::Song::pointer song{ session.create<db::Song>(title, trimOptional(newSong.acoustId)) };
        GAMUS_LOG(SERVICE, DEBUG, "Created song '" << song->getTitle() << "'");

        return toEntry(song);
    }
} // namespace gamus::library
