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

#include "Persister.hpp"

#include "audio/FileMetadata.hpp"
#include "core/ILogger.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/LibraryFile.hpp"

#include "CatalogResolver.hpp"

namespace gamus::scanner
{
    Persister::Persister(db::IDb& db)
        : _db{ db }
    {
    }

    bool Persister::isUpToDate(const std::filesystem::path& path, std::uint64_t sizeBytes, std::int64_t modifiedUnix)
    {
        db::Session& session{ _db.getTLSSession() };
        auto transaction{ session.createReadTransaction() };

        const db::LibraryFile::pointer file{ db::LibraryFile::findByPath(session, path) };
        if (!file)
            return false;

        return file->getSizeBytes() == static_cast<long long>(sizeBytes) && file->getModifiedUnix() == modifiedUnix;
    }

    Persister::Outcome Persister::persist(const audio::FileMetadata& metadata)
    {
        Outcome outcome{ Outcome::Updated };

        db::Session& session{ _db.getTLSSession() };
        {
            // committed at the end of the scope, rolled back if anything throws
            auto transaction{ session.createWriteTransaction() };

            const TrackHints hints{ computeTrackHints(metadata) };
            const db::ReleaseTrack::pointer track{ resolveReleaseTrack(session, hints) };

            const db::LibraryFile::pointer previousFile{ db::LibraryFile::findByReleaseTrack(session, track->getId()) };
            if (previousFile && previousFile->getPath() != metadata.path)
                GAMUS_LOG(SCANNER, INFO, "Track collision: " << metadata.path << " replaces " << previousFile->getPath() << " on release '" << hints.album << "', disc " << hints.discNumber << ", track " << hints.trackNumber);

            db::LibraryFile::pointer file{ db::LibraryFile::findByPath(session, metadata.path) };
            if (!file)
            {
                file = session.create<db::LibraryFile>(metadata.path, track);
                outcome = Outcome::Added;
            }
            else if (file->getReleaseTrackId() != track->getId())
            {
                file.modify()->setReleaseTrack(track);
            }

            auto modifiedFile{ file.modify() };
            modifiedFile->setSizeBytes(static_cast<long long>(metadata.sizeBytes));
            modifiedFile->setModifiedUnix(metadata.modifiedUnix);
            modifiedFile->setDuration(metadata.duration);
            modifiedFile->setBitrateKbps(metadata.bitrateKbps);
            modifiedFile->setSampleRateHz(metadata.sampleRateHz);
            modifiedFile->setChannelCount(metadata.channelCount);
            modifiedFile->setFingerprint(metadata.fingerprint);
            modifiedFile->setBpm(metadata.bpm);
            modifiedFile->setQualityScore(metadata.qualityScore);
            modifiedFile->setQualityAssessment(metadata.qualityAssessment);
            modifiedFile->setFeatures(metadata.features);
            modifiedFile->touch();

            associateReleaseArtwork(session, track->getRelease(), metadata.path.parent_path());
        }

        return outcome;
    }
} // namespace gamus::scanner
