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
#include "database/Types.hpp"
#include "database/objects/ArtistId.hpp"
#include "database/objects/ReleaseId.hpp"

namespace gamus::db
{
    class Artist;
    class Artwork;
    class ReleaseGenre;
    class ReleaseMainArtist;
    class ReleaseStyle;
    class ReleaseTrack;
    class ReleaseTypeLink;
    class Session;

    class Release final : public Object<Release, ReleaseId>
    {
    public:
        static constexpr std::size_t maxTitleLength{ 512 };

        Release() = default;

        // Accessors
        static std::size_t getCount(Session& session);
        static pointer find(Session& session, const ReleaseId& id);
        // title compared trimmed and case-folded, artist must be one of the main artists
        static pointer findByNormalizedTitle(Session& session, std::string_view normalizedTitle, const ArtistId& mainArtistId);
        static void find(Session& session, const std::function<void(const Release::pointer&)>& func); // ordered by title

        const std::string& getTitle() const { return _title; }
        const std::optional<std::string>& getReleaseDate() const { return _releaseDate; }
        const std::optional<std::string>& getCountry() const { return _country; }
        const std::optional<std::string>& getNotes() const { return _notes; }
        const Wt::WDateTime& getCreatedAt() const { return _createdAt; }
        const Wt::WDateTime& getUpdatedAt() const { return _updatedAt; }

        std::vector<ArtistId> getMainArtistIds() const;
        std::vector<ReleaseType> getTypes() const;
        std::vector<std::string> getGenres() const;
        std::vector<std::string> getStyles() const;
        std::size_t getTrackCount() const;

        // Modifiers
        void setReleaseDate(std::optional<std::string> releaseDate) { _releaseDate = std::move(releaseDate); }
        void setCountry(std::optional<std::string> country) { _country = std::move(country); }
        void setNotes(std::optional<std::string> notes) { _notes = std::move(notes); }
        void touch();

        template<class Action>
        void persist(Action& a)
        {
            persistId(a);
            Wt::Dbo::field(a, _title, "title");
            Wt::Dbo::field(a, _releaseDate, "release_date");
            Wt::Dbo::field(a, _country, "country");
            Wt::Dbo::field(a, _notes, "notes");
            Wt::Dbo::field(a, _createdAt, "created_at");
            Wt::Dbo::field(a, _updatedAt, "updated_at");

            Wt::Dbo::hasMany(a, _mainArtists, Wt::Dbo::ManyToOne, "release");
            Wt::Dbo::hasMany(a, _types, Wt::Dbo::ManyToOne, "release");
            Wt::Dbo::hasMany(a, _genres, Wt::Dbo::ManyToOne, "release");
            Wt::Dbo::hasMany(a, _styles, Wt::Dbo::ManyToOne, "release");
            Wt::Dbo::hasMany(a, _artworks, Wt::Dbo::ManyToOne, "release");
            Wt::Dbo::hasMany(a, _tracks, Wt::Dbo::ManyToOne, "release");
        }

    private:
        friend class Session;
        Release(std::string_view title);
        static pointer create(Session& session, std::string_view title);

        std::string _title;
        std::optional<std::string> _releaseDate;
        std::optional<std::string> _country;
        std::optional<std::string> _notes;
        Wt::WDateTime _createdAt;
        Wt::WDateTime _updatedAt;

        Wt::Dbo::collection<Wt::Dbo::ptr<ReleaseMainArtist>> _mainArtists;
        Wt::Dbo::collection<Wt::Dbo::ptr<ReleaseTypeLink>> _types;
        Wt::Dbo::collection<Wt::Dbo::ptr<ReleaseGenre>> _genres;
        Wt::Dbo::collection<Wt::Dbo::ptr<ReleaseStyle>> _styles;
        Wt::Dbo::collection<Wt::Dbo::ptr<Artwork>> _artworks;
        Wt::Dbo::collection<Wt::Dbo::ptr<ReleaseTrack>> _tracks;
    };

    class ReleaseMainArtist final : public Object<ReleaseMainArtist, ReleaseMainArtistId>
    {
    public:
        ReleaseMainArtist() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, const ReleaseId& releaseId, const ArtistId& artistId);

        ReleaseId getReleaseId() const { return _release.id(); }
        ArtistId getArtistId() const { return _artist.id(); }

        template<class Action>
        void persist(Action& a)
        {
            persistId(a);
            Wt::Dbo::belongsTo(a, _release, "release", Wt::Dbo::OnDeleteCascade | Wt::Dbo::NotNull);
            Wt::Dbo::belongsTo(a, _artist, "artist", Wt::Dbo::OnDeleteCascade | Wt::Dbo::NotNull);
        }

    private:
        friend class Session;
        ReleaseMainArtist(ObjectPtr<Release> release, ObjectPtr<Artist> artist);
        static pointer create(Session& session, ObjectPtr<Release> release, ObjectPtr<Artist> artist);

        Wt::Dbo::ptr<Release> _release;
        Wt::Dbo::ptr<Artist> _artist;
    };

    // Release type, as a (release, kind) link
    class ReleaseTypeLink final : public Object<ReleaseTypeLink, ReleaseTypeLinkId>
    {
    public:
        ReleaseTypeLink() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, const ReleaseId& releaseId, const ReleaseType& type);

        ReleaseType getType() const { return ReleaseType::parse(_kind); }
        ReleaseId getReleaseId() const { return _release.id(); }

        template<class Action>
        void persist(Action& a)
        {
            persistId(a);
            Wt::Dbo::field(a, _kind, "kind");
            Wt::Dbo::belongsTo(a, _release, "release", Wt::Dbo::OnDeleteCascade | Wt::Dbo::NotNull);
        }

    private:
        friend class Session;
        ReleaseTypeLink(ObjectPtr<Release> release, const ReleaseType& type);
        static pointer create(Session& session, ObjectPtr<Release> release, const ReleaseType& type);

        std::string _kind;
        Wt::Dbo::ptr<Release> _release;
    };

    class ReleaseGenre final : public Object<ReleaseGenre, ReleaseGenreId>
    {
    public:
        ReleaseGenre() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, const ReleaseId& releaseId, std::string_view genre);

        const std::string& getGenre() const { return _genre; }
        ReleaseId getReleaseId() const { return _release.id(); }

        template<class Action>
        void persist(Action& a)
        {
            persistId(a);
            Wt::Dbo::field(a, _genre, "genre");
            Wt::Dbo::belongsTo(a, _release, "release", Wt::Dbo::OnDeleteCascade | Wt::Dbo::NotNull);
        }

    private:
        friend class Session;
        ReleaseGenre(ObjectPtr<Release> release, std::string_view genre);
        static pointer create(Session& session, ObjectPtr<Release> release, std::string_view genre);

        std::string _genre;
        Wt::Dbo::ptr<Release> _release;
    };

    class ReleaseStyle final : public Object<ReleaseStyle, ReleaseStyleId>
    {
    public:
        ReleaseStyle() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, const ReleaseId& releaseId, std::string_view style);

        const std::string& getStyle() const { return _style; }
        ReleaseId getReleaseId() const { return _release.id(); }

        template<class Action>
        void persist(Action& a)
        {
            persistId(a);
            Wt::Dbo::field(a, _style, "style");
            Wt::Dbo::belongsTo(a, _release, "release", Wt::Dbo::OnDeleteCascade | Wt::Dbo::NotNull);
        }

    private:
        friend class Session;
        ReleaseStyle(ObjectPtr<Release> release, std::string_view style);
        static pointer create(Session& session, ObjectPtr<Release> release, std::string_view style);

        std::string _style;
        Wt::Dbo::ptr<Release> _release;
    };
} // namespace gamus::db
