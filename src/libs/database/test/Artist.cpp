/*
 * Copyright (C) 2023 Emeric Poupon
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

#include <algorithm>

#include "Common.hpp"

namespace gamus::db::tests
{
    TEST_F(DatabaseFixture, Artist)
    {
        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(Artist::getCount(session), 0);
        }

        ScopedArtist artist{ session, "MyArtist" };

        {
            auto transaction{ session.createReadTransaction() };

            EXPECT_EQ(Artist::getCount(session), 1);
            EXPECT_TRUE(artist->getId().isValid());
            EXPECT_EQ(artist->getName(), "MyArtist");
            EXPECT_FALSE(artist->getBio().has_value());
            EXPECT_EQ(artist->getCreatedAt(), artist->getUpdatedAt());

            auto found{ Artist::find(session, artist.getId()) };
            ASSERT_TRUE(found);
            EXPECT_EQ(found->getId(), artist.getId());

            EXPECT_FALSE(Artist::find(session, ArtistId{ "not-an-id" }));
        }
    }

    TEST_F(DatabaseFixture, Artist_nameIsTrimmed)
    {
        ScopedArtist artist{ session, "  MyArtist\t" };

        auto transaction{ session.createReadTransaction() };
        EXPECT_EQ(artist->getName(), "MyArtist");
    }

    TEST_F(DatabaseFixture, Artist_findByName)
    {
        ScopedArtist artist{ session, "MyArtist" };

        auto transaction{ session.createReadTransaction() };

        EXPECT_TRUE(Artist::findByName(session, "MyArtist"));
        EXPECT_FALSE(Artist::findByName(session, "myartist"));
        EXPECT_FALSE(Artist::findByName(session, "Other"));
    }

    TEST_F(DatabaseFixture, Artist_uniqueName)
    {
        ScopedArtist artist{ session, "MyArtist" };

        EXPECT_ANY_THROW({
            auto transaction{ session.createWriteTransaction() };
            session.execute("INSERT INTO artists(id, name, created_at, updated_at) VALUES ('other-id', 'MyArtist', '', '')");
        });

        auto transaction{ session.createReadTransaction() };
        EXPECT_EQ(Artist::getCount(session), 1);
    }

    TEST_F(DatabaseFixture, Artist_findByNormalizedName)
    {
        ScopedArtist artist{ session, "The Artist" };

        {
            auto transaction{ session.createReadTransaction() };

            auto found{ Artist::findByNormalizedName(session, "the artist") };
            ASSERT_TRUE(found);
            EXPECT_EQ(found->getId(), artist.getId());

            EXPECT_FALSE(Artist::findByNormalizedName(session, "artist, the"));
        }

        {
            auto transaction{ session.createWriteTransaction() };
            session.create<ArtistVariation>(artist.get(), "  Artist, THE ");
        }

        {
            auto transaction{ session.createReadTransaction() };

            auto found{ Artist::findByNormalizedName(session, "artist, the") };
            ASSERT_TRUE(found);
            EXPECT_EQ(found->getId(), artist.getId());
            EXPECT_EQ(ArtistVariation::getCount(session), 1);
        }
    }

    TEST_F(DatabaseFixture, Artist_variations)
    {
        ScopedArtist artist{ session, "MyArtist" };

        {
            auto transaction{ session.createWriteTransaction() };
            session.create<ArtistVariation>(artist.get(), "My Artist");
            session.create<ArtistVariation>(artist.get(), "MY ARTIST");
        }

        {
            auto transaction{ session.createReadTransaction() };

            const std::vector<std::string> variations{ artist->getVariations() };
            ASSERT_EQ(variations.size(), 2);
            EXPECT_EQ(variations[0], "MY ARTIST");
            EXPECT_EQ(variations[1], "My Artist");

            EXPECT_TRUE(ArtistVariation::find(session, artist.getId(), "My Artist"));
            EXPECT_FALSE(ArtistVariation::find(session, artist.getId(), "my artist"));
        }

        // (artist, variation) is unique
        EXPECT_ANY_THROW({
            auto transaction{ session.createWriteTransaction() };
            session.execute("INSERT INTO artist_variations(id, artist_id, variation) VALUES ('other-id', '" + artist.getId().toString() + "', 'My Artist')");
        });

        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(ArtistVariation::getCount(session), 2);
        }
    }

    TEST_F(DatabaseFixture, Artist_sites)
    {
        ScopedArtist artist{ session, "MyArtist" };

        {
            auto transaction{ session.createWriteTransaction() };
            session.create<ArtistSite>(artist.get(), "https://example.org/myartist");
        }

        {
            auto transaction{ session.createReadTransaction() };
            ASSERT_EQ(artist->getSites().size(), 1);
            EXPECT_EQ(artist->getSites().front(), "https://example.org/myartist");
            EXPECT_TRUE(ArtistSite::find(session, artist.getId(), "https://example.org/myartist"));
        }

        EXPECT_ANY_THROW({
            auto transaction{ session.createWriteTransaction() };
            session.execute("INSERT INTO artist_sites(id, artist_id, url) VALUES ('other-id', '" + artist.getId().toString() + "', 'https://example.org/myartist')");
        });
    }

    TEST_F(DatabaseFixture, Artist_bioAndTouch)
    {
        ScopedArtist artist{ session, "MyArtist", std::optional<std::string>{ "A bio" } };

        {
            auto transaction{ session.createReadTransaction() };
            ASSERT_TRUE(artist->getBio().has_value());
            EXPECT_EQ(*artist->getBio(), "A bio");
        }

        Wt::WDateTime createdAt;
        {
            auto transaction{ session.createWriteTransaction() };
            createdAt = artist->getCreatedAt();
            artist.get().modify()->setBio(std::nullopt);
            artist.get().modify()->touch();
        }

        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_FALSE(artist->getBio().has_value());
            EXPECT_EQ(artist->getCreatedAt(), createdAt);
            EXPECT_GE(artist->getUpdatedAt(), createdAt);
        }
    }

    TEST_F(DatabaseFixture, Artist_findAllOrderedByName)
    {
        ScopedArtist artist1{ session, "b" };
        ScopedArtist artist2{ session, "A" };
        ScopedArtist artist3{ session, "c" };

        auto transaction{ session.createReadTransaction() };

        std::vector<std::string> names;
        Artist::find(session, [&](const Artist::pointer& artist) {
            names.push_back(artist->getName());
        });

        ASSERT_EQ(names.size(), 3);
        EXPECT_EQ(names[0], "A");
        EXPECT_EQ(names[1], "b");
        EXPECT_EQ(names[2], "c");
    }
} // namespace gamus::db::tests
