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

#include "database/Session.hpp"

#include <Wt/Dbo/Exception.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "core/ILogger.hpp"

#include "database/objects/Artist.hpp"
#include "database/objects/Artwork.hpp"
#include "database/objects/LibraryFile.hpp"
#include "database/objects/Release.hpp"
#include "database/objects/ReleaseTrack.hpp"
#include "database/objects/Song.hpp"

#include "Db.hpp"
#include "TransactionChecker.hpp"
#include "Utils.hpp"
#include "traits/ArtistRoleTraits.hpp"
#include "traits/IdTypeTraits.hpp"

namespace gamus::db
{
    Session::Session(IDb& db)
        : _db{ db }
    {
        _session.setConnectionPool(static_cast<Db&>(_db).getConnectionPool());

        _session.mapClass<Artist>("artists");
        _session.mapClass<ArtistSite>("artist_sites");
        _session.mapClass<ArtistVariation>("artist_variations");
        _session.mapClass<Artwork>("artworks");
        _session.mapClass<LibraryFile>("library_files");
        _session.mapClass<Release>("releases");
        _session.mapClass<ReleaseGenre>("release_genres");
        _session.mapClass<ReleaseMainArtist>("release_main_artists");
        _session.mapClass<ReleaseStyle>("release_styles");
        _session.mapClass<ReleaseTrack>("release_tracks");
        _session.mapClass<ReleaseTrackArtist>("release_track_artists");
        _session.mapClass<ReleaseTypeLink>("release_types");
        _session.mapClass<Song>("songs");
    }

    WriteTransaction Session::createWriteTransaction()
    {
        return WriteTransaction{ static_cast<Db&>(_db).getMutex(), _session };
    }

    ReadTransaction Session::createReadTransaction()
    {
        return ReadTransaction{ _session };
    }

    void Session::checkWriteTransaction() const
    {
#if GAMUS_CHECK_TRANSACTION_ACCESSES
        TransactionChecker::checkWriteTransaction(_session);
#endif
    }
    void Session::checkReadTransaction() const
    {
#if GAMUS_CHECK_TRANSACTION_ACCESSES
        TransactionChecker::checkReadTransaction(_session);
#endif
    }

    void Session::execute(std::string_view statement)
    {
        utils::executeCommand(_session, std::string{ statement });
    }

    void Session::prepareTablesIfNeeded()
    {
        GAMUS_LOG(DB, INFO, "Preparing tables...");

        // Initial creation case
        try
        {
            auto transaction{ createWriteTransaction() };
            _session.createTables();
            GAMUS_LOG(DB, INFO, "Tables created");
        }
        catch (const Wt::Dbo::Exception& e)
        {
            GAMUS_LOG(DB, DEBUG, "Cannot create tables: " << e.what());
            if (std::string_view{ e.what() }.find("already exists") == std::string_view::npos)
            {
                GAMUS_LOG(DB, ERROR, "Cannot create tables: " << e.what());
                throw;
            }
        }
    }

    void Session::createIndexesIfNeeded()
    {
        GAMUS_LOG(DB, INFO, "Creating indexes...");

        {
            auto transaction{ createWriteTransaction() };
            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS ux_artists_name ON artists(name)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS artists_name_nocase_idx ON artists(name COLLATE NOCASE)");

            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS ux_artist_variations_artist_variation ON artist_variations(artist_id, variation)");
            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS ux_artist_sites_artist_url ON artist_sites(artist_id, url)");

            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS songs_title_nocase_idx ON songs(title COLLATE NOCASE)");

            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS releases_title_nocase_idx ON releases(title COLLATE NOCASE)");
            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS ux_release_main_artists_release_artist ON release_main_artists(release_id, artist_id)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS release_main_artists_artist_idx ON release_main_artists(artist_id)");
            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS ux_release_types_release_kind ON release_types(release_id, kind)");
            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS ux_release_genres_release_genre ON release_genres(release_id, genre)");
            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS ux_release_styles_release_style ON release_styles(release_id, style)");

            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS ux_artworks_release_path ON artworks(release_id, path)");

            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS ux_release_tracks_release_disc_track ON release_tracks(release_id, disc_number, track_number)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS release_tracks_song_idx ON release_tracks(song_id)");

            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS ux_release_track_artists_track_artist_role ON release_track_artists(release_track_id, artist_id, role)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS release_track_artists_artist_idx ON release_track_artists(artist_id)");

            utils::executeCommand(_session, "CREATE UNIQUE INDEX IF NOT EXISTS ux_library_files_path ON library_files(path)");
            utils::executeCommand(_session, "CREATE INDEX IF NOT EXISTS library_files_release_track_updated_idx ON library_files(release_track_id, updated_at)");
        }

        GAMUS_LOG(DB, INFO, "Indexes created!");
    }

    void Session::fullAnalyze()
    {
        GAMUS_LOG(DB, INFO, "Performing database analyze...");

        // one entry at a time so that imports are not locked out for the whole analyze
        for (const std::string& entry : retrieveEntriesToAnalyze())
            analyzeEntry(entry);

        GAMUS_LOG(DB, INFO, "Analyze complete!");
    }

    CatalogStats Session::getCatalogStats()
    {
        checkReadTransaction();

        CatalogStats stats{};

        stats.artistCount = Artist::getCount(*this);
        stats.songCount = Song::getCount(*this);
        stats.releaseCount = Release::getCount(*this);
        stats.releaseTrackCount = ReleaseTrack::getCount(*this);
        stats.libraryFileCount = LibraryFile::getCount(*this);

        return stats;
    }

    std::vector<std::string> Session::retrieveEntriesToAnalyze()
    {
        auto transaction{ createReadTransaction() };
        return utils::fetchQueryResults(_session.query<std::string>("SELECT name FROM sqlite_master WHERE type='table' OR type ='index'"));
    }

    void Session::analyzeEntry(const std::string& entry)
    {
        GAMUS_LOG(DB, DEBUG, "Analyzing " << entry);
        {
            auto transaction{ createWriteTransaction() };
            utils::executeCommand(_session, "ANALYZE " + entry);
        }
        GAMUS_LOG(DB, DEBUG, "Analyzing " << entry << ": done!");
    }
} // namespace gamus::db
