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
#include <vector>

#include <Wt/Dbo/Field.h>
#include <Wt/Dbo/collection.h>
#include <Wt/WDateTime.h>

#include "database/Object.hpp"
#include "database/Types.hpp"
#include "database/objects/ArtistId.hpp"
#include "database/objects/ReleaseId.hpp"
#include "database/objects/ReleaseTrackId.hpp"
#include "database/objects/SongId.hpp"

namespace gamus::db
{
    class Artist;
    class LibraryFile;
    class Release;
    class ReleaseTrackArtist;
    class Session;
    class Song;

    // A song placed at a (disc, track) coordinate of a release
    class ReleaseTrack final : public Object<ReleaseTrack, ReleaseTrackId>
    {
    public:
        static constexpr int defaultDiscNumber{ 1 };

        ReleaseTrack() = default;

        // Accessors
        static std::size_t getCount(Session& session);
        static pointer find(Session& session, const ReleaseTrackId& id);
        static pointer find(Session& session, const ReleaseId& releaseId, int discNumber, int trackNumber);
        static void find(Session& session, const ReleaseId& releaseId, const std::function<void(const ReleaseTrack::pointer&)>& func); // ordered by disc then track

        int getDiscNumber() const { return _discNumber; }
        int getTrackNumber() const { return _trackNumber; }
        const std::optional<std::string>& getTitleOverride() const { return _titleOverride; }
        const Wt::WDateTime& getCreatedAt() const { return _createdAt; }
        const Wt::WDateTime& getUpdatedAt() const { return _updatedAt; }

        ReleaseId getReleaseId() const { return _release.id(); }
        SongId getSongId() const { return _song.id(); }
        ObjectPtr<Release> getRelease() const;
        ObjectPtr<Song> getSong() const;

        // Modifiers
        void setTitleOverride(std::optional<std::string> titleOverride) { _titleOverride = std::move(titleOverride); }
        void touch();

        template<class Action>
        void persist(Action& a)
        {
            persistId(a);
            Wt::Dbo::field(a, _discNumber, "disc_number");
            Wt::Dbo::field(a, _trackNumber, "track_number");
            Wt::Dbo::field(a, _titleOverride, "title_override");
            Wt::Dbo::field(a, _createdAt, "created_at");
            Wt::Dbo::field(a, _updatedAt, "updated_at");

            Wt::Dbo::belongsTo(a, _release, "release", Wt::Dbo::OnDeleteCascade | Wt::Dbo::NotNull);
            Wt::Dbo::belongsTo(a, _song, "song", Wt::Dbo::OnDeleteCascade | Wt::Dbo::NotNull);

            Wt::Dbo::hasMany(a, _artists, Wt::Dbo::ManyToOne, "release_track");
            Wt::Dbo::hasMany(a, _files, Wt::Dbo::ManyToOne, "release_track");
        }

    private:
        friend class Session;
        ReleaseTrack(ObjectPtr<Release> release, ObjectPtr<Song> song, int discNumber, int trackNumber);
        static pointer create(Session& session, ObjectPtr<Release> release, ObjectPtr<Song> song, int discNumber, int trackNumber);

        int _discNumber{ defaultDiscNumber };
        int _trackNumber{};
        std::optional<std::string> _titleOverride;
        Wt::WDateTime _createdAt;
        Wt::WDateTime _updatedAt;

        Wt::Dbo::ptr<Release> _release;
        Wt::Dbo::ptr<Song> _song;
        Wt::Dbo::collection<Wt::Dbo::ptr<ReleaseTrackArtist>> _artists;
        Wt::Dbo::collection<Wt::Dbo::ptr<LibraryFile>> _files;
    };

    // Artist credited on a release track, for a given role
    class ReleaseTrackArtist final : public Object<ReleaseTrackArtist, ReleaseTrackArtistId>
    {
    public:
        ReleaseTrackArtist() = default;

        static std::size_t getCount(Session& session);
        static pointer find(Session& session, const ReleaseTrackId& releaseTrackId, const ArtistId& artistId, ArtistRole role);
        static std::vector<pointer> findByReleaseTrack(Session& session, const ReleaseTrackId& releaseTrackId); // ordered by position

        ArtistRole getRole() const { return _role; }
        std::optional<int> getPosition() const { return _position; }
        ReleaseTrackId getReleaseTrackId() const { return _releaseTrack.id(); }
        ArtistId getArtistId() const { return _artist.id(); }

        void setPosition(std::optional<int> position) { _position = position; }

        template<class Action>
        void persist(Action& a)
        {
            persistId(a);
            Wt::Dbo::field(a, _role, "role");
            Wt::Dbo::field(a, _position, "position");

            Wt::Dbo::belongsTo(a, _releaseTrack, "release_track", Wt::Dbo::OnDeleteCascade | Wt::Dbo::NotNull);
            Wt::Dbo::belongsTo(a, _artist, "artist", Wt::Dbo::OnDeleteCascade | Wt::Dbo::NotNull);
        }

    private:
        friend class Session;
        ReleaseTrackArtist(ObjectPtr<ReleaseTrack> releaseTrack, ObjectPtr<Artist> artist, ArtistRole role, std::optional<int> position);
        static pointer create(Session& session, ObjectPtr<ReleaseTrack> releaseTrack, ObjectPtr<Artist> artist, ArtistRole role, std::optional<int> position = std::nullopt);

        ArtistRole _role{ ArtistRole::Performer };
        std::optional<int> _position;

        Wt::Dbo::ptr<ReleaseTrack> _releaseTrack;
        Wt::Dbo::ptr<Artist> _artist;
    };
} // namespace gamus::db
