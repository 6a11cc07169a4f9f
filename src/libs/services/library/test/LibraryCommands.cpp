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

#include <gtest/gtest.h>

#include "core/UUID.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Artist.hpp"
#include "database/objects/Release.hpp"
#include "database/objects/ReleaseTrack.hpp"
#include "database/objects/Song.hpp"
#include "services/library/Exception.hpp"
#include "services/library/ILibraryCommands.hpp"
#include "services/scanner/Exception.hpp"

namespace gamus::library::tests
{
    namespace
    {
        std::filesystem::path generateTmpPath(std::string_view suffix)
        {
            return std::filesystem::temp_directory_path() / ("gamus-library-test-" + std::string{ core::UUID::generate().getAsString() } + std::string{ suffix });
        }

        class FakeScannerService : public scanner::IScannerService
        {
        public:
            std::vector<scanner::ScannerConfig> importRequests;
            std::vector<scanner::ScannerConfig> classifyRequests;
            bool scanning{};

        private:
            void requestImport(const scanner::ScannerConfig& config, std::shared_ptr<scanner::IProgressObserver>) override
            {
                if (scanning)
                    throw scanner::ScanAlreadyInProgressException{};

                importRequests.push_back(config);
                scanning = true;
            }

            void requestStop() override {}
            Status getStatus() const override { return Status{}; }
            void waitForCompletion() override {}

            scanner::ScanSummary classify(const scanner::ScannerConfig& config) override
            {
                classifyRequests.push_back(config);

                scanner::ScanSummary summary;
                summary.devices.push_back(scanner::DeviceSummary{ .deviceId = "8:1", .roots = config.roots, .bandwidthMBps = 120, .workerCount = 2, .candidateCount = 42 });
                summary.totalCandidates = 42;
                return summary;
            }
        };

        class LibraryCommandsTest : public ::testing::Test
        {
        public:
            LibraryCommandsTest()
                : _dbPath{ generateTmpPath(".db") }
                , _db{ db::createDb(_dbPath) }
            {
                db::Session session{ *_db };
                session.prepareTablesIfNeeded();
                session.createIndexesIfNeeded();

                commands = createLibraryCommands(*_db, scanner, configDir / "scanner.conf");
            }

            ~LibraryCommandsTest() override
            {
                commands.reset();
                _db.reset();

                std::error_code ec;
                std::filesystem::remove(_dbPath, ec);
                std::filesystem::remove(_dbPath.string() + "-wal", ec);
                std::filesystem::remove(_dbPath.string() + "-shm", ec);
                std::filesystem::remove_all(configDir, ec);
            }

            db::IDb& getDb() { return *_db; }

        private:
            const std::filesystem::path _dbPath;
            std::unique_ptr<db::IDb> _db;

        public:
            const std::filesystem::path configDir{ generateTmpPath("") };
            FakeScannerService scanner;
            std::unique_ptr<ILibraryCommands> commands;
        };
    } // namespace

    TEST_F(LibraryCommandsTest, scannerConfig)
    {
        // defaults until saved
        EXPECT_EQ(commands->getScannerConfig(), scanner::ScannerConfig{});

        scanner::ScannerConfig config;
        config.roots = { "/music" };
        config.audioExtensions = { ".FLAC", "mp3" };
        config.maxDepth = 4;
        commands->saveScannerConfig(config);

        const scanner::ScannerConfig savedConfig{ commands->getScannerConfig() };
        EXPECT_EQ(savedConfig.roots, std::vector<std::filesystem::path>{ "/music" });
        EXPECT_EQ(savedConfig.audioExtensions, (std::vector<std::string>{ "flac", "mp3" }));
        EXPECT_EQ(savedConfig.maxDepth, 4u);

        EXPECT_THROW(commands->saveScannerConfig(scanner::ScannerConfig{}), scanner::InvalidScannerConfigException);
        EXPECT_EQ(commands->getScannerConfig(), savedConfig);
    }

    TEST_F(LibraryCommandsTest, importFull)
    {
        scanner::ScannerConfig config;
        config.roots = { "/music", "/other" };
        commands->saveScannerConfig(config);

        commands->importFull(nullptr);
        ASSERT_EQ(scanner.importRequests.size(), 1);
        EXPECT_EQ(scanner.importRequests.front().roots, config.roots);

        EXPECT_THROW(commands->importFull(nullptr), scanner::ScanAlreadyInProgressException);
    }

    TEST_F(LibraryCommandsTest, scanLibrary)
    {
        scanner::ScannerConfig config;
        config.roots = { "/music" };
        commands->saveScannerConfig(config);

        const scanner::ScanSummary summary{ commands->scanLibrary() };
        EXPECT_EQ(summary.totalCandidates, 42);
        ASSERT_EQ(summary.devices.size(), 1);
        EXPECT_EQ(summary.devices.front().roots, config.roots);
        EXPECT_TRUE(scanner.importRequests.empty());
        EXPECT_EQ(scanner.classifyRequests.size(), 1);
    }

    TEST_F(LibraryCommandsTest, createArtist)
    {
        EXPECT_TRUE(commands->listArtists().empty());

        const ArtistEntry artist{ commands->createArtist(NewArtist{ .name = "  Björk ", .bio = " Singer " }) };
        EXPECT_EQ(artist.name, "Björk");
        EXPECT_EQ(artist.bio, "Singer");

        commands->createArtist(NewArtist{ .name = "Air", .bio = "  " });

        const std::vector<ArtistEntry> artists{ commands->listArtists() };
        ASSERT_EQ(artists.size(), 2);
        EXPECT_EQ(artists[0].name, "Air");
        EXPECT_FALSE(artists[0].bio);
        EXPECT_EQ(artists[1].name, "Björk");
        EXPECT_EQ(artists[1].id, artist.id);
    }

    TEST_F(LibraryCommandsTest, createArtistErrors)
    {
        commands->createArtist(NewArtist{ .name = "Air" });

        EXPECT_THROW(commands->createArtist(NewArtist{ .name = "Air" }), DuplicateArtistException);
        EXPECT_THROW(commands->createArtist(NewArtist{ .name = " AIR " }), DuplicateArtistException);
        EXPECT_THROW(commands->createArtist(NewArtist{ .name = "" }), InvalidArgumentException);
        EXPECT_THROW(commands->createArtist(NewArtist{ .name = " \t " }), InvalidArgumentException);

        EXPECT_EQ(commands->listArtists().size(), 1);
    }

    TEST_F(LibraryCommandsTest, createSong)
    {
        EXPECT_TRUE(commands->listSongs().empty());

        const SongEntry song{ commands->createSong(NewSong{ .title = " Teardrop ", .acoustId = "a1b2" }) };
        EXPECT_EQ(song.title, "Teardrop");
        EXPECT_EQ(song.acoustId, "a1b2");

        // same titles are allowed
        commands->createSong(NewSong{ .title = "Teardrop" });
        commands->createSong(NewSong{ .title = "Angel" });

        const std::vector<SongEntry> songs{ commands->listSongs() };
        ASSERT_EQ(songs.size(), 3);
        EXPECT_EQ(songs[0].title, "Angel");
        EXPECT_EQ(songs[1].title, "Teardrop");
        EXPECT_EQ(songs[2].title, "Teardrop");

        EXPECT_THROW(commands->createSong(NewSong{ .title = "  " }), InvalidArgumentException);
    }

    TEST_F(LibraryCommandsTest, listReleases)
    {
        {
            db::Session& session{ getDb().getTLSSession() };
            auto transaction{ session.createWriteTransaction() };

            const db::Artist::pointer artist{ session.create<db::Artist>("Massive Attack") };
            const db::Release::pointer release{ session.create<db::Release>("Mezzanine") };
            session.create<db::ReleaseMainArtist>(release, artist);
            release.modify()->setReleaseDate("1998-04-20");

            const db::Song::pointer song{ session.create<db::Song>("Angel") };
            session.create<db::ReleaseTrack>(release, song, 1, 1);
        }

        const std::vector<ReleaseEntry> releases{ commands->listReleases() };
        ASSERT_EQ(releases.size(), 1);
        EXPECT_EQ(releases[0].title, "Mezzanine");
        EXPECT_EQ(releases[0].releaseDate, "1998-04-20");
        EXPECT_EQ(releases[0].mainArtists, std::vector<std::string>{ "Massive Attack" });
        EXPECT_EQ(releases[0].trackCount, 1);
    }
} // namespace gamus::library::tests
