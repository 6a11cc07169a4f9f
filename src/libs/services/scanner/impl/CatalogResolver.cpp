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

#include "CatalogResolver.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <span>
#include <sstream>

#include "audio/FileMetadata.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "core/XxHash3.hpp"
#include "database/Session.hpp"
#include "database/Types.hpp"
#include "database/objects/Artwork.hpp"
#include "database/objects/Song.hpp"

namespace gamus::scanner
{
    namespace
    {
        constexpr std::string_view whitespaces{ " \t\r\n" };

        struct FileNameTokens
        {
            std::optional<int> trackNumber;
            std::optional<std::string> artist;
            std::optional<std::string> title;
        };

        // "01 - Artist - Title", "01. Title", "Artist - Title", "Title"
        FileNameTokens parseFileName(const std::filesystem::path& path)
        {
            FileNameTokens res;

            const std::string stem{ path.stem().string() };
            std::string_view remaining{ core::stringUtils::stringTrim(stem, whitespaces) };

            std::size_t digitCount{};
            while (digitCount < remaining.size() && std::isdigit(static_cast<unsigned char>(remaining[digitCount])))
                digitCount++;

            if (digitCount > 0 && digitCount < remaining.size())
            {
                const std::string_view rest{ core::stringUtils::stringTrim(remaining.substr(digitCount), " \t.-_") };
                if (!rest.empty())
                {
                    const std::optional<int> trackNumber{ core::stringUtils::readAs<int>(remaining.substr(0, digitCount)) };
                    if (trackNumber && *trackNumber > 0)
                        res.trackNumber = trackNumber;
                    remaining = rest;
                }
            }

            constexpr std::string_view separator{ " - " };
            if (const std::size_t pos{ remaining.find(separator) }; pos != std::string_view::npos)
            {
                const std::string_view artist{ core::stringUtils::stringTrim(remaining.substr(0, pos), whitespaces) };
                const std::string_view title{ core::stringUtils::stringTrim(remaining.substr(pos + separator.size()), whitespaces) };
                if (!artist.empty() && !title.empty())
                {
                    res.artist = std::string{ artist };
                    res.title = std::string{ title };
                    return res;
                }
            }

            if (!remaining.empty())
                res.title = std::string{ remaining };

            return res;
        }

        struct TopLevelGenre
        {
            std::string_view key; // lower case, without separators
            std::string_view name;
        };

        constexpr std::array topLevelGenres{
            TopLevelGenre{ "rock", "Rock" },
            TopLevelGenre{ "electronic", "Electronic" },
            TopLevelGenre{ "pop", "Pop" },
            TopLevelGenre{ "folkworldandcountry", "Folk, World, & Country" },
            TopLevelGenre{ "folkworldcountry", "Folk, World, & Country" },
            TopLevelGenre{ "jazz", "Jazz" },
            TopLevelGenre{ "funksoul", "Funk / Soul" },
            TopLevelGenre{ "classical", "Classical" },
            TopLevelGenre{ "hiphop", "Hip Hop" },
            TopLevelGenre{ "latin", "Latin" },
            TopLevelGenre{ "stageandscreen", "Stage & Screen" },
            TopLevelGenre{ "stagescreen", "Stage & Screen" },
            TopLevelGenre{ "reggae", "Reggae" },
            TopLevelGenre{ "blues", "Blues" },
            TopLevelGenre{ "nonmusic", "Non-Music" },
            TopLevelGenre{ "childrens", "Children's" },
            TopLevelGenre{ "children", "Children's" },
            TopLevelGenre{ "brassandmilitary", "Brass & Military" },
            TopLevelGenre{ "brassmilitary", "Brass & Military" },
        };

        std::optional<std::string_view> findTopLevelGenre(std::string_view value)
        {
            std::string key;
            for (char c : value)
            {
                if (c == ' ' || c == '-' || c == ',' || c == '&' || c == '/' || c == '\'')
                    continue;
                key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            }

            for (const TopLevelGenre& genre : topLevelGenres)
            {
                if (genre.key == key)
                    return genre.name;
            }

            return std::nullopt;
        }

        std::string_view getImageMimeType(const std::filesystem::path& file)
        {
            const std::string extension{ core::stringUtils::stringToLower(file.extension().string()) };
            if (extension == ".png")
                return "image/png";

            return "image/jpeg";
        }

        std::optional<std::string> computeFileHash(const std::filesystem::path& file)
        {
            std::ifstream ifs{ file, std::ios::binary };
            if (!ifs)
                return std::nullopt;

            core::XxHash3Hasher hasher;
            std::array<char, 64 * 1024> buffer;
            while (ifs)
            {
                ifs.read(buffer.data(), buffer.size());
                const std::streamsize readCount{ ifs.gcount() };
                if (readCount > 0)
                    hasher.update(std::as_bytes(std::span{ buffer.data(), static_cast<std::size_t>(readCount) }));
            }

            if (ifs.bad())
                return std::nullopt;

            std::ostringstream oss;
            oss << std::hex << std::setw(16) << std::setfill('0') << hasher.digest();
            return oss.str();
        }

        void addGenres(db::Session& session, db::Release::pointer release, std::string_view genreTag)
        {
            const GenreSplit split{ splitGenreTag(genreTag) };

            for (const std::string& genre : split.genres)
            {
                if (!db::ReleaseGenre::find(session, release->getId(), genre))
                    session.create<db::ReleaseGenre>(release, genre);
            }

            for (const std::string& style : split.styles)
            {
                if (!db::ReleaseStyle::find(session, release->getId(), style))
                    session.create<db::ReleaseStyle>(release, style);
            }
        }
    } // namespace

    TrackHints computeTrackHints(const audio::FileMetadata& metadata)
    {
        TrackHints hints;

        const audio::Tags& tags{ metadata.tags };
        const FileNameTokens tokens{ parseFileName(metadata.path) };

        hints.title = tags.title.value_or(tokens.title.value_or(std::string{ unknownValue }));
        hints.artist = tags.artist.value_or(tokens.artist.value_or(std::string{ unknownValue }));

        if (tags.album)
            hints.album = *tags.album;
        else
        {
            const std::string parentName{ metadata.path.parent_path().filename().string() };
            const std::string_view trimmedParentName{ core::stringUtils::stringTrim(parentName, whitespaces) };
            hints.album = !trimmedParentName.empty() ? std::string{ trimmedParentName } : std::string{ unknownValue };
        }

        hints.albumArtist = tags.albumArtist.value_or(hints.artist);
        hints.date = tags.date;
        hints.genre = tags.genre;
        hints.trackNumber = tags.trackNumber.value_or(tokens.trackNumber.value_or(1));
        hints.discNumber = tags.discNumber.value_or(db::ReleaseTrack::defaultDiscNumber);

        return hints;
    }

    GenreSplit splitGenreTag(std::string_view genreTag)
    {
        GenreSplit res;

        for (std::string_view value : core::stringUtils::splitString(genreTag, ';'))
        {
            value = core::stringUtils::stringTrim(value, whitespaces);
            if (value.empty())
                continue;

            if (const std::optional<std::string_view> genre{ findTopLevelGenre(value) })
            {
                if (std::find(std::cbegin(res.genres), std::cend(res.genres), *genre) == std::cend(res.genres))
                    res.genres.emplace_back(*genre);
            }
            else if (std::find(std::cbegin(res.styles), std::cend(res.styles), value) == std::cend(res.styles))
                res.styles.emplace_back(value);
        }

        return res;
    }

    db::Artist::pointer resolveArtist(db::Session& session, std::string_view rawName)
    {
        session.checkWriteTransaction();

        std::string_view name{ core::stringUtils::stringTrim(rawName, whitespaces) };
        const bool hasName{ !name.empty() };
        if (!hasName)
            name = unknownValue;

        db::Artist::pointer artist{ db::Artist::findByNormalizedName(session, core::stringUtils::normalizeForMatching(name)) };
        if (!artist)
        {
            artist = session.create<db::Artist>(name);
            GAMUS_LOG(SCANNER, DEBUG, "Created artist '" << artist->getName() << "'");

            if (hasName && rawName != artist->getName())
                session.create<db::ArtistVariation>(artist, rawName);

            return artist;
        }

        // keep track of the other spellings of this artist
        if (name != artist->getName() && !db::ArtistVariation::find(session, artist->getId(), name))
            session.create<db::ArtistVariation>(artist, name);

        artist.modify()->touch();
        return artist;
    }

    db::Release::pointer resolveRelease(db::Session& session, const TrackHints& hints)
    {
        session.checkWriteTransaction();

        const db::Artist::pointer mainArtist{ resolveArtist(session, hints.albumArtist) };

        db::Release::pointer release{ db::Release::findByNormalizedTitle(session, core::stringUtils::normalizeForMatching(hints.album), mainArtist->getId()) };
        if (release)
        {
            release.modify()->touch();
            return release;
        }

        release = session.create<db::Release>(hints.album);
        session.create<db::ReleaseMainArtist>(release, mainArtist);
        session.create<db::ReleaseTypeLink>(release, db::ReleaseType{ db::ReleaseType::Kind::Album });
        release.modify()->setReleaseDate(hints.date);
        if (hints.genre)
            addGenres(session, release, *hints.genre);

        GAMUS_LOG(SCANNER, DEBUG, "Created release '" << release->getTitle() << "' by '" << mainArtist->getName() << "'");

        return release;
    }

    db::ReleaseTrack::pointer resolveReleaseTrack(db::Session& session, const TrackHints& hints)
    {
        session.checkWriteTransaction();

        const db::Release::pointer release{ resolveRelease(session, hints) };

        db::ReleaseTrack::pointer track{ db::ReleaseTrack::find(session, release->getId(), hints.discNumber, hints.trackNumber) };
        if (!track)
        {
            const db::Song::pointer song{ session.create<db::Song>(hints.title) };
            track = session.create<db::ReleaseTrack>(release, song, hints.discNumber, hints.trackNumber);
        }
        else
        {
            db::Song::pointer song{ track->getSong() };
            song.modify()->touch();
            track.modify()->touch();
        }

        const db::Artist::pointer artist{ resolveArtist(session, hints.artist) };
        if (!db::ReleaseTrackArtist::find(session, track->getId(), artist->getId(), db::ArtistRole::Performer))
            session.create<db::ReleaseTrackArtist>(track, artist, db::ArtistRole::Performer, 0);

        return track;
    }

    void associateReleaseArtwork(db::Session& session, db::Release::pointer release, const std::filesystem::path& directory)
    {
        session.checkWriteTransaction();

        constexpr std::array<std::string_view, 3> coverNames{ "cover", "folder", "front" };
        constexpr std::array<std::string_view, 3> imageExtensions{ ".jpg", ".jpeg", ".png" };

        std::error_code ec;
        const std::filesystem::directory_iterator itEnd{};
        for (std::filesystem::directory_iterator itPath{ directory, ec }; !ec && itPath != itEnd; itPath.increment(ec))
        {
            const std::filesystem::directory_entry& entry{ *itPath };
            const std::filesystem::path& path{ entry.path() };
            const std::string stem{ core::stringUtils::stringToLower(path.stem().string()) };
            const std::string extension{ core::stringUtils::stringToLower(path.extension().string()) };

            if (std::find(std::cbegin(coverNames), std::cend(coverNames), stem) == std::cend(coverNames)
                || std::find(std::cbegin(imageExtensions), std::cend(imageExtensions), extension) == std::cend(imageExtensions))
                continue;

            std::error_code statusEc;
            if (!entry.is_regular_file(statusEc) || db::Artwork::find(session, release->getId(), path))
                continue;

            db::Artwork::pointer artwork{ session.create<db::Artwork>(release, path, getImageMimeType(path)) };
            artwork.modify()->setHash(computeFileHash(path));
            GAMUS_LOG(SCANNER, DEBUG, "Added artwork " << path << " to release '" << release->getTitle() << "'");
        }

        // artwork is optional, the track import goes on
        if (ec)
            GAMUS_LOG(SCANNER, WARNING, "Cannot list artwork candidates in " << directory << ": " << ec.message());
    }
} // namespace gamus::scanner
