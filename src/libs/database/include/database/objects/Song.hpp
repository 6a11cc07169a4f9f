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

#pragma once

#include "database/objects/ObjectTraits.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <Wt/Dbo/Field.h>
#include <Wt/WDateTime.h>

#include "database/Object.hpp"
#include "database/objects/SongId.hpp"

namespace gamus::db
{
    class Session;

    // A recording, independent of the releases it appears on
    // Several songs may share the same title
    class Song final : public Object<Song, SongId>
    {
    public:
        Song() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, const SongId& id);
        static void find(Session& session, const std::function<void(const Song::pointer&)>& func); // ordered by title

        const std::string& getTitle() const { return _title; }
        const std::optional<std::string>& getAcoustId() const { return _acoustId; }
        const Wt::WDateTime& getCreatedAt() const { return _createdAt; }
        const Wt::WDateTime& getUpdatedAt() const { return _updatedAt; }

        void setAcoustId(std::optional<std::string> acoustId) { _acoustId = std::move(acoustId); }
        void touch();

        template<class Action>
        void persist(Action& a)
        {
            persistId(a);
            Wt::Dbo::field(a, _title, "title");
            Wt::Dbo::field(a, _acoustId, "acoustid");
            Wt::Dbo::field(a, _createdAt, "created_at");
            Wt::Dbo::field(a, _updatedAt, "updated_at");
        }

    private:
        friend class Session;
        Song(std::string_view title, std::optional<std::string> acoustId);
        static pointer create(Session& session, std::string_view title, std::optional<std::string> acoustId = std::nullopt);

        std::string _title;
        std::optional<std::string> _acoustId;
        Wt::WDateTime _createdAt;
        Wt::WDateTime _updatedAt;
    };
} // namespace gamus::db
