/*
 * Copyright (C) 2013 Emeric Poupon
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

#include "database/objects/Release.hpp"

#include <algorithm>
#include <cassert>

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/StdSqlTraits.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "core/String.hpp"
#include "database/Session.hpp"
#include "database/objects/Artist.hpp"
#include "database/objects/Artwork.hpp"
#include "database/objects/ReleaseTrack.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(gamus::db::Release)
DBO_INSTANTIATE_TEMPLATES(gamus::db::ReleaseMainArtist)
DBO_INSTANTIATE_TEMPLATES(gamus::db::ReleaseTypeLink)
DBO_INSTANTIATE_TEMPLATES(gamus::db::ReleaseGenre)
DBO_INSTANTIATE_TEMPLATES(gamus::db::ReleaseStyle)

namespace gamus::db
{
    namespace
    {
        std::string_view truncateTitle(std::string_view title)
        {
            if (title.size() > Release::maxTitleLength)
                title = title.substr(0, Release::maxTitleLength);
            return title;
        }
    } // namespace

    Release::Release(std::string_view title)
        : Object{ ReleaseId::generate() }
        , _title{ truncateTitle(core::stringUtils::stringTrim(title)) }
        , _createdAt{ utils::now() }
        , _updatedAt{ _createdAt }
    {
    }

    Release::pointer Release::create(Session& session, std::string_view title)
    {
        return session.getDboSession()->add(std::unique_ptr<Release>{ new Release{ title } });
    }

    std::size_t Release::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM releases"));
    }

    Release::pointer Release::find(Session& session, const ReleaseId& id)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Release>>("SELECT r FROM releases r").where("r.id = ?").bind(id));
    }

    Release::pointer Release::findByNormalizedTitle(Session& session, std::string_view normalizedTitle, const ArtistId& mainArtistId)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<Release>>("SELECT r FROM releases r") };
        query.join("release_main_artists r_m_a ON r_m_a.release_id = r.id")
            .where("r_m_a.artist_id = ?")
            .bind(mainArtistId)
            .where("LOWER(r.title) = ?")
            .bind(std::string{ truncateTitle(normalizedTitle) })
            .orderBy("r.created_at, r.id")
            .limit(1);

        return utils::fetchQuerySingleResult(query);
    }

    void Release::find(Session& session, const std::function<void(const Release::pointer&)>& func)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<Release>>("SELECT r FROM releases r").orderBy("r.title COLLATE NOCASE, r.id") };
        utils::forEachQueryResult(query, [&](const Wt::Dbo::ptr<Release>& release) {
            func(release);
        });
    }

    std::vector<ArtistId> Release::getMainArtistIds() const
    {
        assert(session());

        auto query{ session()->query<ArtistId>("SELECT r_m_a.artist_id FROM release_main_artists r_m_a").where("r_m_a.release_id = ?").bind(getId()).orderBy("r_m_a.rowid") };
        return utils::fetchQueryResults(query);
    }

    std::vector<ReleaseType> Release::getTypes() const
    {
        assert(session());

        auto query{ session()->query<std::string>("SELECT r_t.kind FROM release_types r_t").where("r_t.release_id = ?").bind(getId()).orderBy("r_t.rowid") };

        std::vector<ReleaseType> res;
        utils::forEachQueryResult(query, [&](const std::string& kind) {
            res.push_back(ReleaseType::parse(kind));
        });
        return res;
    }

    std::vector<std::string> Release::getGenres() const
    {
        assert(session());

        auto query{ session()->query<std::string>("SELECT r_g.genre FROM release_genres r_g").where("r_g.release_id = ?").bind(getId()).orderBy("r_g.genre") };
        return utils::fetchQueryResults(query);
    }

    std::vector<std::string> Release::getStyles() const
    {
        assert(session());

        auto query{ session()->query<std::string>("SELECT r_s.style FROM release_styles r_s").where("r_s.release_id = ?").bind(getId()).orderBy("r_s.style") };
        return utils::fetchQueryResults(query);
    }

    std::size_t Release::getTrackCount() const
    {
        assert(session());

        return utils::fetchQuerySingleResult(session()->query<int>("SELECT COUNT(*) FROM release_tracks r_t").where("r_t.release_id = ?").bind(getId()));
    }

    void Release::touch()
    {
        _updatedAt = utils::now();
    }

    ReleaseMainArtist::ReleaseMainArtist(ObjectPtr<Release> release, ObjectPtr<Artist> artist)
        : Object{ ReleaseMainArtistId::generate() }
        , _release{ getDboPtr(release) }
        , _artist{ getDboPtr(artist) }
    {
    }

    ReleaseMainArtist::pointer ReleaseMainArtist::create(Session& session, ObjectPtr<Release> release, ObjectPtr<Artist> artist)
    {
        return session.getDboSession()->add(std::unique_ptr<ReleaseMainArtist>{ new ReleaseMainArtist{ release, artist } });
    }

    std::size_t ReleaseMainArtist::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM release_main_artists"));
    }

    ReleaseMainArtist::pointer ReleaseMainArtist::find(Session& session, const ReleaseId& releaseId, const ArtistId& artistId)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<ReleaseMainArtist>>("SELECT r_m_a FROM release_main_artists r_m_a").where("r_m_a.release_id = ?").bind(releaseId).where("r_m_a.artist_id = ?").bind(artistId));
    }

    ReleaseTypeLink::ReleaseTypeLink(ObjectPtr<Release> release, const ReleaseType& type)
        : Object{ ReleaseTypeLinkId::generate() }
        , _kind{ type.toString() }
        , _release{ getDboPtr(release) }
    {
    }

    ReleaseTypeLink::pointer ReleaseTypeLink::create(Session& session, ObjectPtr<Release> release, const ReleaseType& type)
    {
        return session.getDboSession()->add(std::unique_ptr<ReleaseTypeLink>{ new ReleaseTypeLink{ release, type } });
    }

    std::size_t ReleaseTypeLink::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM release_types"));
    }

    ReleaseTypeLink::pointer ReleaseTypeLink::find(Session& session, const ReleaseId& releaseId, const ReleaseType& type)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<ReleaseTypeLink>>("SELECT r_t FROM release_types r_t").where("r_t.release_id = ?").bind(releaseId).where("r_t.kind = ?").bind(type.toString()));
    }

    ReleaseGenre::ReleaseGenre(ObjectPtr<Release> release, std::string_view genre)
        : Object{ ReleaseGenreId::generate() }
        , _genre{ genre }
        , _release{ getDboPtr(release) }
    {
    }

    ReleaseGenre::pointer ReleaseGenre::create(Session& session, ObjectPtr<Release> release, std::string_view genre)
    {
        return session.getDboSession()->add(std::unique_ptr<ReleaseGenre>{ new ReleaseGenre{ release, genre } });
    }

    std::size_t ReleaseGenre::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM release_genres"));
    }

    ReleaseGenre::pointer ReleaseGenre::find(Session& session, const ReleaseId& releaseId, std::string_view genre)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<ReleaseGenre>>("SELECT r_g FROM release_genres r_g").where("r_g.release_id = ?").bind(releaseId).where("r_g.genre = ?").bind(std::string{ genre }));
    }

    ReleaseStyle::ReleaseStyle(ObjectPtr<Release> release, std::string_view style)
        : Object{ ReleaseStyleId::generate() }
        , _style{ style }
        , _release{ getDboPtr(release) }
    {
    }

    ReleaseStyle::pointer ReleaseStyle::create(Session& session, ObjectPtr<Release> release, std::string_view style)
    {
        return session.getDboSession()->add(std::unique_ptr<ReleaseStyle>{ new ReleaseStyle{ release, style } });
    }

    std::size_t ReleaseStyle::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM release_styles"));
    }

    ReleaseStyle::pointer ReleaseStyle::find(Session& session, const ReleaseId& releaseId, std::string_view style)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<ReleaseStyle>>("SELECT r_s FROM release_styles r_s").where("r_s.release_id = ?").bind(releaseId).where("r_s.style = ?").bind(std::string{ style }));
    }
} // namespace gamus::db
