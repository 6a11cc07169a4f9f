/*
 * Copyright (C) 2024 Emeric Poupon
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

#include "database/objects/Artwork.hpp"

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/StdSqlTraits.h>

#include "database/Session.hpp"
#include "database/objects/Release.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(gamus::db::Artwork)

namespace gamus::db
{
    Artwork::Artwork(ObjectPtr<Release> release, const std::filesystem::path& path, std::string_view mimeType)
        : Object{ ArtworkId::generate() }
        , _path{ path.string() }
        , _mimeType{ mimeType }
        , _release{ getDboPtr(release) }
    {
    }

    Artwork::pointer Artwork::create(Session& session, ObjectPtr<Release> release, const std::filesystem::path& path, std::string_view mimeType)
    {
        return session.getDboSession()->add(std::unique_ptr<Artwork>{ new Artwork{ release, path, mimeType } });
    }

    std::size_t Artwork::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM artworks"));
    }

    Artwork::pointer Artwork::find(Session& session, const ArtworkId& id)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Artwork>>("SELECT a FROM artworks a").where("a.id = ?").bind(id));
    }

    Artwork::pointer Artwork::find(Session& session, const ReleaseId& releaseId, const std::filesystem::path& path)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Artwork>>("SELECT a FROM artworks a").where("a.release_id = ?").bind(releaseId).where("a.path = ?").bind(path.string()));
    }

    std::vector<Artwork::pointer> Artwork::findByRelease(Session& session, const ReleaseId& releaseId)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<Artwork>>("SELECT a FROM artworks a").where("a.release_id = ?").bind(releaseId).orderBy("a.path") };
        return utils::fetchQueryResults<Artwork::pointer>(query);
    }
} // namespace gamus::db
