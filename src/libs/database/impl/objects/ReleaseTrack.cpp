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

#include "database/objects/ReleaseTrack.hpp"

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/StdSqlTraits.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"
#include "database/objects/Artist.hpp"
#include "database/objects/LibraryFile.hpp"
#include "database/objects/Release.hpp"
#include "database/objects/Song.hpp"

#include "Utils.hpp"
#include "traits/ArtistRoleTraits.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(gamus::db::ReleaseTrack)
DBO_INSTANTIATE_TEMPLATES(gamus::db::ReleaseTrackArtist)

namespace gamus::db
{
    ReleaseTrack::ReleaseTrack(ObjectPtr<Release> release, ObjectPtr<Song> song, int discNumber, int trackNumber)
        : Object{ ReleaseTrackId::generate() }
        , _discNumber{ discNumber }
        , _trackNumber{ trackNumber }
        , _createdAt{ utils::now() }
        , _updatedAt{ _createdAt }
        , _release{ getDboPtr(release) }
        , _song{ getDboPtr(song) }
    {
    }

    ReleaseTrack::pointer ReleaseTrack::create(Session& session, ObjectPtr<Release> release, ObjectPtr<Song> song, int discNumber, int trackNumber)
    {
        return session.getDboSession()->add(std::unique_ptr<ReleaseTrack>{ new ReleaseTrack{ release, song, discNumber, trackNumber } });
    }

    std::size_t ReleaseTrack::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM release_tracks"));
    }

    ReleaseTrack::pointer ReleaseTrack::find(Session& session, const ReleaseTrackId& id)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<ReleaseTrack>>("SELECT r_t FROM release_tracks r_t").where("r_t.id = ?").bind(id));
    }

    ReleaseTrack::pointer ReleaseTrack::find(Session& session, const ReleaseId& releaseId, int discNumber, int trackNumber)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<ReleaseTrack>>("SELECT r_t FROM release_tracks r_t") };
        query.where("r_t.release_id = ?").bind(releaseId);
        query.where("r_t.disc_number = ?").bind(discNumber);
        query.where("r_t.track_number = ?").bind(trackNumber);

        return utils::fetchQuerySingleResult(query);
    }

    void ReleaseTrack::find(Session& session, const ReleaseId& releaseId, const std::function<void(const ReleaseTrack::pointer&)>& func)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<ReleaseTrack>>("SELECT r_t FROM release_tracks r_t").where("r_t.release_id = ?").bind(releaseId).orderBy("r_t.disc_number, r_t.track_number") };
        utils::forEachQueryResult(query, [&](const Wt::Dbo::ptr<ReleaseTrack>& track) {
            func(track);
        });
    }

    ObjectPtr<Release> ReleaseTrack::getRelease() const
    {
        return _release;
    }

    ObjectPtr<Song> ReleaseTrack::getSong() const
    {
        return _song;
    }

    void ReleaseTrack::touch()
    {
        _updatedAt = utils::now();
    }

    ReleaseTrackArtist::ReleaseTrackArtist(ObjectPtr<ReleaseTrack> releaseTrack, ObjectPtr<Artist> artist, ArtistRole role, std::optional<int> position)
        : Object{ ReleaseTrackArtistId::generate() }
        , _role{ role }
        , _position{ position }
        , _releaseTrack{ getDboPtr(releaseTrack) }
        , _artist{ getDboPtr(artist) }
    {
    }

    ReleaseTrackArtist::pointer ReleaseTrackArtist::create(Session& session, ObjectPtr<ReleaseTrack> releaseTrack, ObjectPtr<Artist> artist, ArtistRole role, std::optional<int> position)
    {
        return session.getDboSession()->add(std::unique_ptr<ReleaseTrackArtist>{ new ReleaseTrackArtist{ releaseTrack, artist, role, position } });
    }

    std::size_t ReleaseTrackArtist::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM release_track_artists"));
    }

    ReleaseTrackArtist::pointer ReleaseTrackArtist::find(Session& session, const ReleaseTrackId& releaseTrackId, const ArtistId& artistId, ArtistRole role)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<ReleaseTrackArtist>>("SELECT r_t_a FROM release_track_artists r_t_a") };
        query.where("r_t_a.release_track_id = ?").bind(releaseTrackId);
        query.where("r_t_a.artist_id = ?").bind(artistId);
        query.where("r_t_a.role = ?").bind(role);

        return utils::fetchQuerySingleResult(query);
    }

    std::vector<ReleaseTrackArtist::pointer> ReleaseTrackArtist::findByReleaseTrack(Session& session, const ReleaseTrackId& releaseTrackId)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<ReleaseTrackArtist>>("SELECT r_t_a FROM release_track_artists r_t_a").where("r_t_a.release_track_id = ?").bind(releaseTrackId).orderBy("r_t_a.position, r_t_a.rowid") };
        return utils::fetchQueryResults<ReleaseTrackArtist::pointer>(query);
    }
} // namespace gamus::db
