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

#pragma once

#include "database/objects/ObjectTraits.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Wt/Dbo/Field.h>

#include "database/Object.hpp"
#include "database/objects/ArtworkId.hpp"
#include "database/objects/ReleaseId.hpp"

namespace gamus::db
{
    class Release;
    class Session;

    // Image attached to a release (front cover, inserts, ...)
    class Artwork final : public Object<Artwork, ArtworkId>
    {
    public:
        Artwork() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, const ArtworkId& id);
        static pointer find(Session& session, const ReleaseId& releaseId, const std::filesystem::path& path);
        static std::vector<pointer> findByRelease(Session& session, const ReleaseId& releaseId); // ordered by path

        std::filesystem::path getPath() const { return _path; }
        const std::string& getMimeType() const { return _mimeType; }
        const std::optional<std::string>& getDescription() const { return _description; }
        const std::optional<std::string>& getHash() const { return _hash; }
        const std::optional<std::string>& getCredits() const { return _credits; }
        ReleaseId getReleaseId() const { return _release.id(); }

        void setMimeType(std::string_view mimeType) { _mimeType = mimeType; }
        void setDescription(std::optional<std::string> description) { _description = std::move(description); }
        void setHash(std::optional<std::string> hash) { _hash = std::move(hash); }
        void setCredits(std::optional<std::string> credits) { _credits = std::move(credits); }

        template<class Action>
        void persist(Action& a)
        {
            persistId(a);
            Wt::Dbo::field(a, _path, "path");
            Wt::Dbo::field(a, _mimeType, "mime_type");
            Wt::Dbo::field(a, _description, "description");
            Wt::Dbo::field(a, _hash, "hash");
            Wt::Dbo::field(a, _credits, "credits");

            Wt::Dbo::belongsTo(a, _release, "release", Wt::Dbo::OnDeleteCascade | Wt::Dbo::NotNull);
        }

    private:
        friend class Session;
        Artwork(ObjectPtr<Release> release, const std::filesystem::path& path, std::string_view mimeType);
        static pointer create(Session& session, ObjectPtr<Release> release, const std::filesystem::path& path, std::string_view mimeType);

        std::string _path;
        std::string _mimeType;
        std::optional<std::string> _description;
        std::optional<std::string> _hash;
        std::optional<std::string> _credits;

        Wt::Dbo::ptr<Release> _release;
    };
} // namespace gamus::db
