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

#pragma once

#include "database/objects/ObjectTraits.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Wt/Dbo/Field.h>
#include <Wt/Dbo/collection.h>
#include <Wt/WDateTime.h>

#include "database/Object.hpp"
#include "database/objects/ArtistId.hpp"

namespace gamus::db
{
    class ArtistSite;
    class ArtistVariation;
    class Session;

    class Artist final : public Object<Artist, ArtistId>
    {
    public:
        static constexpr std::size_t maxNameLength{ 512 };

        Artist() = default;

        // Accessors
        static std::size_t getCount(Session& session);
        static pointer find(Session& session, const ArtistId& id);
        static pointer findByName(Session& session, std::string_view name); // exact match on name field
        // match on the trimmed, case-folded name or on any recorded variation
        static pointer findByNormalizedName(Session& session, std::string_view normalizedName);
        static void find(Session& session, const std::function<void(const Artist::pointer&)>& func); // ordered by name

        const std::string& getName() const { return _name; }
        const std::optional<std::string>& getBio() const { return _bio; }
        const Wt::WDateTime& getCreatedAt() const { return _createdAt; }
        const Wt::WDateTime& getUpdatedAt() const { return _updatedAt; }
        std::vector<std::string> getVariations() const;
        std::vector<std::string> getSites() const;

        // Modifiers
        void setBio(std::optional<std::string> bio) { _bio = std::move(bio); }
        void touch();

        template<class Action>
        void persist(Action& a)
        {
            persistId(a);
            Wt::Dbo::field(a, _name, "name");
            Wt::Dbo::field(a, _bio, "bio");
            Wt::Dbo::field(a, _createdAt, "created_at");
            Wt::Dbo::field(a, _updatedAt, "updated_at");

            Wt::Dbo::hasMany(a, _variations, Wt::Dbo::ManyToOne, "artist");
            Wt::Dbo::hasMany(a, _sites, Wt::Dbo::ManyToOne, "artist");
        }

    private:
        friend class Session;
        // Create
        Artist(std::string_view name, std::optional<std::string> bio);
        static pointer create(Session& session, std::string_view name, std::optional<std::string> bio = std::nullopt);

        std::string _name;
        std::optional<std::string> _bio;
        Wt::WDateTime _createdAt;
        Wt::WDateTime _updatedAt;

        Wt::Dbo::collection<Wt::Dbo::ptr<ArtistVariation>> _variations;
        Wt::Dbo::collection<Wt::Dbo::ptr<ArtistSite>> _sites;
    };

    // Alternative spelling of an artist name, as found in tags
    class ArtistVariation final : public Object<ArtistVariation, ArtistVariationId>
    {
    public:
        ArtistVariation() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, const ArtistId& artistId, std::string_view variation);

        const std::string& getVariation() const { return _variation; }
        ArtistId getArtistId() const { return _artist.id(); }

        template<class Action>
        void persist(Action& a)
        {
            persistId(a);
            Wt::Dbo::field(a, _variation, "variation");

            Wt::Dbo::belongsTo(a, _artist, "artist", Wt::Dbo::OnDeleteCascade | Wt::Dbo::NotNull);
        }

    private:
        friend class Session;
        ArtistVariation(ObjectPtr<Artist> artist, std::string_view variation);
        static pointer create(Session& session, ObjectPtr<Artist> artist, std::string_view variation);

        std::string _variation;
        Wt::Dbo::ptr<Artist> _artist;
    };

    class ArtistSite final : public Object<ArtistSite, ArtistSiteId>
    {
    public:
        ArtistSite() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, const ArtistId& artistId, std::string_view url);

        const std::string& getUrl() const { return _url; }
        ArtistId getArtistId() const { return _artist.id(); }

        template<class Action>
        void persist(Action& a)
        {
            persistId(a);
            Wt::Dbo::field(a, _url, "url");

            Wt::Dbo::belongsTo(a, _artist, "artist", Wt::Dbo::OnDeleteCascade | Wt::Dbo::NotNull);
        }

    private:
        friend class Session;
        ArtistSite(ObjectPtr<Artist> artist, std::string_view url);
        static pointer create(Session& session, ObjectPtr<Artist> artist, std::string_view url);

        std::string _url;
        Wt::Dbo::ptr<Artist> _artist;
    };
} // namespace gamus::db
