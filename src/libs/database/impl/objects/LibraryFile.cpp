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

#include "database/objects/LibraryFile.hpp"

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/StdSqlTraits.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"
#include "database/objects/ReleaseTrack.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(gamus::db::LibraryFile)

namespace gamus::db
{
    LibraryFile::LibraryFile(const std::filesystem::path& path, ObjectPtr<ReleaseTrack> releaseTrack)
        : Object{ LibraryFileId::generate() }
        , _path{ path.string() }
        , _addedAt{ utils::now() }
        , _updatedAt{ _addedAt }
        , _releaseTrack{ getDboPtr(releaseTrack) }
    {
    }

    LibraryFile::pointer LibraryFile::create(Session& session, const std::filesystem::path& path, ObjectPtr<ReleaseTrack> releaseTrack)
    {
        return session.getDboSession()->add(std::unique_ptr<LibraryFile>{ new LibraryFile{ path, releaseTrack } });
    }

    std::size_t LibraryFile::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM library_files"));
    }

    LibraryFile::pointer LibraryFile::find(Session& session, const LibraryFileId& id)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<LibraryFile>>("SELECT l_f FROM library_files l_f").where("l_f.id = ?").bind(id));
    }

    LibraryFile::pointer LibraryFile::findByPath(Session& session, const std::filesystem::path& path)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<LibraryFile>>("SELECT l_f FROM library_files l_f").where("l_f.path = ?").bind(path.string()));
    }

    LibraryFile::pointer LibraryFile::findByReleaseTrack(Session& session, const ReleaseTrackId& releaseTrackId)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<LibraryFile>>("SELECT l_f FROM library_files l_f") };
        query.where("l_f.release_track_id = ?")
            .bind(releaseTrackId)
            .orderBy("l_f.updated_at DESC, l_f.rowid DESC")
            .limit(1);

        return utils::fetchQuerySingleResult(query);
    }

    void LibraryFile::find(Session& session, const std::function<void(const LibraryFile::pointer&)>& func)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<LibraryFile>>("SELECT l_f FROM library_files l_f").orderBy("l_f.path") };
        utils::forEachQueryResult(query, [&](const Wt::Dbo::ptr<LibraryFile>& file) {
            func(file);
        });
    }

    void LibraryFile::setReleaseTrack(ObjectPtr<ReleaseTrack> releaseTrack)
    {
        _releaseTrack = getDboPtr(releaseTrack);
    }

    void LibraryFile::touch()
    {
        _updatedAt = utils::now();
    }
} // namespace gamus::db
