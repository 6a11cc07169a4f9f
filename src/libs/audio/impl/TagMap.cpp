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

#include "TagMap.hpp"

#include <string_view>
#include <vector>

#include "core/String.hpp"

namespace gamus::audio
{
    namespace
    {
        enum class TagType
        {
            Title,
            Album,
            Artist,
            AlbumArtist,
            Date,
            Genre,
            TrackNumber,
            DiscNumber,
        };

        // TagLib unified names, ID3v2 frames, RIFF INFO chunks and MP4 atoms
        const std::unordered_map<TagType, std::vector<std::string_view>> tagAliases{
            { TagType::Title, { "title", "tit2", "inam", "©nam", "name" } },
            { TagType::Album, { "album", "talb", "iprd", "©alb" } },
            { TagType::Artist, { "artist", "tpe1", "iart", "©art", "auth" } },
            { TagType::AlbumArtist, { "album_artist", "album artist", "albumartist", "tpe2", "aart" } },
            { TagType::Date, { "date", "year", "original_year", "originalyear", "originaldate", "releasedate", "tdrc", "tyer", "tdor", "©day", "icrd" } },
            { TagType::Genre, { "genre", "tcon", "ignr", "©gen" } },
            { TagType::TrackNumber, { "track", "tracknumber", "trck", "iprt", "itrk", "trkn" } },
            { TagType::DiscNumber, { "disc", "discnumber", "tpos", "disk" } },
        };

        std::optional<std::string> getTagValue(const TagMap& tagMap, TagType type)
        {
            for (std::string_view alias : tagAliases.at(type))
            {
                auto it{ tagMap.find(std::string{ alias }) };
                if (it == std::cend(tagMap))
                    continue;

                std::string_view value{ core::stringUtils::stringTrim(it->second, " \t\r\n") };
                if (!value.empty())
                    return std::string{ value };
            }

            return std::nullopt;
        }
    } // namespace

    void mergeTagMaps(TagMap& dst, const TagMap& src)
    {
        for (const auto& [key, value] : src)
            dst.try_emplace(key, value);
    }

    std::optional<int> parsePosition(std::string_view str)
    {
        str = core::stringUtils::stringTrim(str);
        if (const std::size_t slash{ str.find('/') }; slash != std::string_view::npos)
            str = core::stringUtils::stringTrim(str.substr(0, slash));

        const std::optional<int> value{ core::stringUtils::readAs<int>(str) };
        if (!value || *value <= 0)
            return std::nullopt;

        return value;
    }

    Tags resolveTags(const TagMap& tagMap)
    {
        Tags tags;

        tags.title = getTagValue(tagMap, TagType::Title);
        tags.album = getTagValue(tagMap, TagType::Album);
        tags.artist = getTagValue(tagMap, TagType::Artist);
        tags.albumArtist = getTagValue(tagMap, TagType::AlbumArtist);
        tags.date = getTagValue(tagMap, TagType::Date);
        tags.genre = getTagValue(tagMap, TagType::Genre);
        if (const auto track{ getTagValue(tagMap, TagType::TrackNumber) })
            tags.trackNumber = parsePosition(*track);
        if (const auto disc{ getTagValue(tagMap, TagType::DiscNumber) })
            tags.discNumber = parsePosition(*disc);

        return tags;
    }
} // namespace gamus::audio
