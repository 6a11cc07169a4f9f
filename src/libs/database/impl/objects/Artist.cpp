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

#include "database/objects/Artist.hpp"

#include <cassert>

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/StdSqlTraits.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "core/String.hpp"
#include "database/Session.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(gamus::db::Artist)
DBO_INSTANTIATE_TEMPLATES(gamus::db::ArtistVariation)
DBO_INSTANTIATE_TEMPLATES(gamus::db::ArtistSite)

namespace gamus::db
{
    namespace
    {
        std::string_view truncateName(std::string_view name)
        {
            if (name.size() > Artist::maxNameLength)
                name = name.substr(0, Artist::maxNameLength);
            return name;
        }
    } // namespace

    Artist::Artist(std::string_view name, std::optional<std::string> bio)
        : Object{ ArtistId::generate() }
        , _name{ truncateName(core::stringUtils::stringTrim(name)) }
        , _bio{ std::move(bio) }
        , _createdAt{ utils::now() }
        , _updatedAt{ _createdAt }
    {
    }

    Artist::pointer Artist::create(Session& session, std::string_view name, std::optional<std::string> bio)
    {
        return session.getDboSession()->add(std::unique_ptr<Artist>{ new Artist{ name, std::move(bio) } });
    }

    std::size_t Artist::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM artists"));
    }

    Artist::pointer Artist::find(Session& session, const ArtistId& id)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Artist>>("SELECT a FROM artists a").where("a.id = ?").bind(id));
    }

    Artist::pointer Artist::findByName(Session& session, std::string_view name)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Artist>>("SELECT a FROM artists a").where("a.name = ?").bind(std::string{ truncateName(name) }));
    }

    Artist::pointer Artist::findByNormalizedName(Session& session, std::string_view normalizedName)
    {
        session.checkReadTransaction();

        const std::string name{ truncateName(normalizedName) };

        // canonical names are stored trimmed, variations are stored raw
        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<Artist>>("SELECT a FROM artists a") };
        query.where("LOWER(a.name) = ? OR EXISTS (SELECT 1 FROM artist_variations a_v WHERE a_v.artist_id = a.id AND LOWER(TRIM(a_v.variation, ' ' || char(9) || char(10) || char(13))) = ?)")
            .bind(name)
            .bind(name)
            .orderBy("a.created_at, a.id")
            .limit(1);

        return utils::fetchQuerySingleResult(query);
    }

    void Artist::find(Session& session, const std::function<void(const Artist::pointer&)>& func)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<Artist>>("SELECT a FROM artists a").orderBy("a.name COLLATE NOCASE, a.id") };
        utils::forEachQueryResult(query, [&](const Wt::Dbo::ptr<Artist>& artist) {
            func(artist);
        });
    }

    std::vector<std::string> Artist::getVariations() const
    {
        assert(session());

        auto query{ session()->query<std::string>("SELECT a_v.variation FROM artist_variations a_v").where("a_v.artist_id = ?").bind(getId()).orderBy("a_v.variation") };
        return utils::fetchQueryResults(query);
    }

    std::vector<std::string> Artist::getSites() const
    {
        assert(session());

        auto query{ session()->query<std::string>("SELECT a_s.url FROM artist_sites a_s").where("a_s.artist_id = ?").bind(getId()).orderBy("a_s.url") };
        return utils::fetchQueryResults(query);
    }

    void Artist::touch()
    {
        _updatedAt = utils::now();
    }

    ArtistVariation::ArtistVariation(ObjectPtr<Artist> artist, std::string_view variation)
        : Object{ ArtistVariationId::generate() }
        , _variation{ variation }
        , _artist{ getDboPtr(artist) }
    {
    }

    ArtistVariation::pointer ArtistVariation::create(Session& session, ObjectPtr<Artist> artist, std::string_view variation)
    {
        return session.getDboSession()->add(std::unique_ptr<ArtistVariation>{ new ArtistVariation{ artist, variation } });
    }

    std::size_t ArtistVariation::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM artist_variations"));
    }

    ArtistVariation::pointer ArtistVariation::find(Session& session, const ArtistId& artistId, std::string_view variation)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<ArtistVariation>>("SELECT a_v FROM artist_variations a_v").where("a_v.artist_id = ?").bind(artistId).where("a_v.variation = ?").bind(std::string{ variation }));
    }

    ArtistSite::ArtistSite(ObjectPtr<Artist> artist, std::string_view url)
        : Object{ ArtistSiteId::generate() }
        , _url{ url }
        , _artist{ getDboPtr(artist) }
    {
    }

    ArtistSite::pointer ArtistSite::create(Session& session, ObjectPtr<Artist> artist, std::string_view url)
    {
        return session.getDboSession()->add(std::unique_ptr<ArtistSite>{ new ArtistSite{ artist, url } });
    }

    std::size_t ArtistSite::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM artist_sites"));
    }

    ArtistSite::pointer ArtistSite::find(Session& session, const ArtistId& artistId, std::string_view url)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<ArtistSite>>("SELECT a_s FROM artist_sites a_s").where("a_s.artist_id = ?").bind(artistId).where("a_s.url = ?").bind(std::string{ url }));
    }
} // namespace gamus::db
