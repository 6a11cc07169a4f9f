/*
 * Copyright (C) 2023 Emeric Poupon
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

#include "Common.hpp"

#include "core/UUID.hpp"

namespace gamus::db::tests
{
    namespace
    {
        std::filesystem::path generateTmpFilePath()
        {
            return std::filesystem::temp_directory_path() / ("gamus-test-" + std::string{ core::UUID::generate().getAsString() } + ".db");
        }
    } // namespace

    TmpDatabase::TmpDatabase()
        : _tmpFile{ generateTmpFilePath() }
        , _fileDeleter{ _tmpFile }
        , _db{ createDb(_tmpFile) }
    {
    }

    IDb& TmpDatabase::getDb()
    {
        return *_db;
    }

    DatabaseFixture::~DatabaseFixture()
    {
        testDatabaseEmpty();
    }

    void DatabaseFixture::SetUpTestCase()
    {
        _tmpDb = std::make_unique<TmpDatabase>();
        {
            db::Session s{ _tmpDb->getDb() };
            s.prepareTablesIfNeeded();
            s.createIndexesIfNeeded();
        }
    }

    void DatabaseFixture::TearDownTestCase()
    {
        _tmpDb.reset();
    }

    void DatabaseFixture::testDatabaseEmpty()
    {
        auto transaction{ session.createReadTransaction() };

        EXPECT_EQ(Artist::getCount(session), 0);
        EXPECT_EQ(ArtistSite::getCount(session), 0);
        EXPECT_EQ(ArtistVariation::getCount(session), 0);
        EXPECT_EQ(Artwork::getCount(session), 0);
        EXPECT_EQ(LibraryFile::getCount(session), 0);
        EXPECT_EQ(Release::getCount(session), 0);
        EXPECT_EQ(ReleaseGenre::getCount(session), 0);
        EXPECT_EQ(ReleaseMainArtist::getCount(session), 0);
        EXPECT_EQ(ReleaseStyle::getCount(session), 0);
        EXPECT_EQ(ReleaseTrack::getCount(session), 0);
        EXPECT_EQ(ReleaseTrackArtist::getCount(session), 0);
        EXPECT_EQ(ReleaseTypeLink::getCount(session), 0);
        EXPECT_EQ(Song::getCount(session), 0);
    }
} // namespace gamus::db::tests
