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

#include "Common.hpp"

namespace gamus::db::tests
{
    TEST_F(DatabaseFixture, Release)
    {
        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(Release::getCount(session), 0);
        }

        ScopedRelease release{ session, " MyRelease " };

        {
            auto transaction{ session.createReadTransaction() };

            EXPECT_EQ(Release::getCount(session), 1);
            EXPECT_EQ(release->getTitle(), "MyRelease");
            EXPECT_FALSE(release->getReleaseDate().has_value());
            EXPECT_TRUE(release->getMainArtistIds().empty());
            EXPECT_TRUE(release->getTypes().empty());
            EXPECT_EQ(release->getTrackCount(), 0);
        }

        {
            auto transaction{ session.createWriteTransaction() };
            release.get().modify()->setReleaseDate("1994-03-01");
            release.get().modify()->setCountry("FR");
            release.get().modify()->setNotes("Remastered");
        }

        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(release->getReleaseDate(), "1994-03-01");
            EXPECT_EQ(release->getCountry(), "FR");
            EXPECT_EQ(release->getNotes(), "Remastered");
        }
    }

    TEST_F(DatabaseFixture, Release_findByNormalizedTitle)
    {
        ScopedArtist artist1{ session, "Artist1" };
        ScopedArtist artist2{ session, "Artist2" };
        ScopedRelease release{ session, "Greatest Hits" };

        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_FALSE(Release::findByNormalizedTitle(session, "greatest hits", artist1.getId()));
        }

        {
            auto transaction{ session.createWriteTransaction() };
            session.create<ReleaseMainArtist>(release.get(), artist1.get());
        }

        {
            auto transaction{ session.createReadTransaction() };

            auto found{ Release::findByNormalizedTitle(session, "greatest hits", artist1.getId()) };
            ASSERT_TRUE(found);
            EXPECT_EQ(found->getId(), release.getId());

            // same title, other main artist
            EXPECT_FALSE(Release::findByNormalizedTitle(session, "greatest hits", artist2.getId()));

            const std::vector<ArtistId> mainArtists{ release->getMainArtistIds() };
            ASSERT_EQ(mainArtists.size(), 1);
            EXPECT_EQ(mainArtists.front(), artist1.getId());
            EXPECT_TRUE(ReleaseMainArtist::find(session, release.getId(), artist1.getId()));
        }

        EXPECT_ANY_THROW({
            auto transaction{ session.createWriteTransaction() };
            session.execute("INSERT INTO release_main_artists(id, release_id, artist_id) VALUES ('other-id', '" + release.getId().toString() + "', '" + artist1.getId().toString() + "')");
        });
    }

    TEST_F(DatabaseFixture, Release_typesGenresStyles)
    {
        ScopedRelease release{ session, "MyRelease" };

        {
            auto transaction{ session.createWriteTransaction() };
            session.create<ReleaseTypeLink>(release.get(), ReleaseType{ ReleaseType::Kind::Album });
            session.create<ReleaseTypeLink>(release.get(), ReleaseType::parse("Live Recording"));
            session.create<ReleaseGenre>(release.get(), "Rock");
            session.create<ReleaseGenre>(release.get(), "Jazz");
            session.create<ReleaseStyle>(release.get(), "Fusion");
        }

        {
            auto transaction{ session.createReadTransaction() };

            const std::vector<ReleaseType> types{ release->getTypes() };
            ASSERT_EQ(types.size(), 2);
            EXPECT_EQ(types[0].getKind(), ReleaseType::Kind::Album);
            EXPECT_EQ(types[1].getKind(), ReleaseType::Kind::Custom);
            EXPECT_EQ(types[1].toString(), "Live Recording");

            EXPECT_TRUE(ReleaseTypeLink::find(session, release.getId(), ReleaseType{ ReleaseType::Kind::Album }));
            EXPECT_FALSE(ReleaseTypeLink::find(session, release.getId(), ReleaseType{ ReleaseType::Kind::EP }));

            const std::vector<std::string> genres{ release->getGenres() };
            ASSERT_EQ(genres.size(), 2);
            EXPECT_EQ(genres[0], "Jazz");
            EXPECT_EQ(genres[1], "Rock");
            EXPECT_TRUE(ReleaseGenre::find(session, release.getId(), "Rock"));

            const std::vector<std::string> styles{ release->getStyles() };
            ASSERT_EQ(styles.size(), 1);
            EXPECT_EQ(styles.front(), "Fusion");
            EXPECT_TRUE(ReleaseStyle::find(session, release.getId(), "Fusion"));
        }

        EXPECT_ANY_THROW({
            auto transaction{ session.createWriteTransaction() };
            session.execute("INSERT INTO release_genres(id, release_id, genre) VALUES ('other-id', '" + release.getId().toString() + "', 'Rock')");
        });
    }

    TEST_F(DatabaseFixture, Release_artworks)
    {
        ScopedRelease release{ session, "MyRelease" };
        ScopedArtwork artwork{ session, release.lockAndGet(), "/music/MyRelease/cover.jpg", "image/jpeg" };

        {
            auto transaction{ session.createReadTransaction() };

            EXPECT_EQ(Artwork::getCount(session), 1);
            EXPECT_EQ(artwork->getPath(), "/music/MyRelease/cover.jpg");
            EXPECT_EQ(artwork->getMimeType(), "image/jpeg");
            EXPECT_EQ(artwork->getReleaseId(), release.getId());

            EXPECT_TRUE(Artwork::find(session, release.getId(), "/music/MyRelease/cover.jpg"));
            EXPECT_FALSE(Artwork::find(session, release.getId(), "/music/MyRelease/back.jpg"));
            EXPECT_EQ(Artwork::findByRelease(session, release.getId()).size(), 1);
        }

        EXPECT_ANY_THROW({
            auto transaction{ session.createWriteTransaction() };
            session.execute("INSERT INTO artworks(id, release_id, path, mime_type) VALUES ('other-id', '" + release.getId().toString() + "', '/music/MyRelease/cover.jpg', 'image/jpeg')");
        });
    }
} // namespace gamus::db::tests
