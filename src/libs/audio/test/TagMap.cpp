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

#include <gtest/gtest.h>

#include "TagMap.hpp"

namespace gamus::audio::tests
{
    TEST(TagMap, aliases)
    {
        const TagMap tagMap{
            { "tit2", "MyTitle" },
            { "talb", "MyAlbum" },
            { "iart", "MyArtist" },
            { "albumartist", "MyAlbumArtist" },
            { "tyer", "1999" },
            { "tcon", "Rock" },
            { "trck", "3/12" },
            { "tpos", "2" },
        };

        const Tags tags{ resolveTags(tagMap) };
        EXPECT_EQ(tags.title, "MyTitle");
        EXPECT_EQ(tags.album, "MyAlbum");
        EXPECT_EQ(tags.artist, "MyArtist");
        EXPECT_EQ(tags.albumArtist, "MyAlbumArtist");
        EXPECT_EQ(tags.date, "1999");
        EXPECT_EQ(tags.genre, "Rock");
        EXPECT_EQ(tags.trackNumber, 3);
        EXPECT_EQ(tags.discNumber, 2);
    }

    TEST(TagMap, precedence)
    {
        const TagMap tagMap{
            { "title", "  " },
            { "tit2", " Second " },
            { "name", "Third" },
            { "date", "2001-02-03" },
            { "year", "2001" },
        };

        const Tags tags{ resolveTags(tagMap) };
        EXPECT_EQ(tags.title, "Second");
        EXPECT_EQ(tags.date, "2001-02-03");
        EXPECT_FALSE(tags.artist);
        EXPECT_FALSE(tags.trackNumber);
        EXPECT_FALSE(tags.discNumber);
    }

    TEST(TagMap, merge)
    {
        TagMap dst{ { "title", "fromTagLib" } };
        mergeTagMaps(dst, TagMap{ { "title", "fromFFmpeg" }, { "artist", "fromFFmpeg" } });

        EXPECT_EQ(dst.size(), 2u);
        EXPECT_EQ(dst["title"], "fromTagLib");
        EXPECT_EQ(dst["artist"], "fromFFmpeg");
    }

    TEST(TagMap, parsePosition)
    {
        EXPECT_EQ(parsePosition("7"), 7);
        EXPECT_EQ(parsePosition(" 7 / 10"), 7);
        EXPECT_EQ(parsePosition("01/02"), 1);
        EXPECT_EQ(parsePosition(""), std::nullopt);
        EXPECT_EQ(parsePosition("0"), std::nullopt);
        EXPECT_EQ(parsePosition("-1"), std::nullopt);
        EXPECT_EQ(parsePosition("A1"), std::nullopt);
        EXPECT_EQ(parsePosition("1a"), std::nullopt);
    }
} // namespace gamus::audio::tests
