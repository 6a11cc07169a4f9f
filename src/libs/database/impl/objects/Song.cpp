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

#include "database/objects/Song.hpp"

#include <Wt/Dbo/Impl.h>
#include <Wt/Dbo/StdSqlTraits.h>
#include <Wt/Dbo/WtSqlTraits.h>

#include "database/Session.hpp"

#include "Utils.hpp"
#include "traits/IdTypeTraits.hpp"

DBO_INSTANTIATE_TEMPLATES(gamus::db::Song)

namespace gamus::db
{
    Song::Song(std::string_view title, std::optional<std::string> acoustId)
        : Object{ SongId::generate() }
        , _title{ title }
        , _acoustId{ std::move(acoustId) }
        , _createdAt{ utils::now() }
        , _updatedAt{ _createdAt }
    {
    }

    Song::pointer Song::create(Session& session, std::string_view title, std::optional<std::string> acoustId)
    {
        return session.getDboSession()->add(std::unique_ptr<Song>{ new Song{ title, std::move(acoustId) } });
    }

    std::size_t Song::getCount(Session& session)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<int>("SELECT COUNT(*) FROM songs"));
    }

    Song::pointer Song::find(Session& session, const SongId& id)
    {
        session.checkReadTransaction();

        return utils::fetchQuerySingleResult(session.getDboSession()->query<Wt::Dbo::ptr<Song>>("SELECT s FROM songs s").where("s.id = ?").bind(id));
    }

    void Song::find(Session& session, const std::function<void(const Song::pointer&)>& func)
    {
        session.checkReadTransaction();

        auto query{ session.getDboSession()->query<Wt::Dbo::ptr<Song>>("SELECT s FROM songs s").orderBy("s.title COLLATE NOCASE, s.id") };
        utils::forEachQueryResult(query, [&](const Wt::Dbo::ptr<Song>& song) {
            func(song);
        });
    }

    void Song::touch()
    {
        _updatedAt = utils::now();
    }
} // namespace gamus::db
