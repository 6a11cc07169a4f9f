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

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <Wt/Dbo/Field.h>
#include <Wt/WDateTime.h>

#include "database/Object.hpp"
#include "database/objects/LibraryFileId.hpp"
#include "database/objects/ReleaseTrackId.hpp"

namespace gamus::db
{
    class ReleaseTrack;
    class Session;

    // Physical audio file, keyed by its absolute path
    class LibraryFile final : public Object<LibraryFile, LibraryFileId>
    {
    public:
        LibraryFile() = default;

        // Accessors
        static std::size_t getCount(Session& session);
        static pointer find(Session& session, const LibraryFileId& id);
        static pointer findByPath(Session& session, const std::filesystem::path& path);
        // most recently updated file linked to the track
        static pointer findByReleaseTrack(Session& session, const ReleaseTrackId& releaseTrackId);
        static void find(Session& session, const std::function<void(const LibraryFile::pointer&)>& func); // ordered by path

        std::filesystem::path getPath() const { return _path; }
        long long getSizeBytes() const { return _sizeBytes; }
        long long getModifiedUnix() const { return _modifiedUnix; }
        std::chrono::milliseconds getDuration() const { return std::chrono::milliseconds{ _durationMs }; }
        std::optional<int> getBitrateKbps() const { return _bitrateKbps; }
        std::optional<int> getSampleRateHz() const { return _sampleRateHz; }
        std::optional<int> getChannelCount() const { return _channels; }
        const std::optional<std::string>& getFingerprint() const { return _fingerprint; }
        std::optional<double> getBpm() const { return _bpm; }
        std::optional<double> getQualityScore() const { return _qualityScore; }
        const std::optional<std::string>& getQualityAssessment() const { return _qualityAssessment; }
        const std::vector<unsigned char>& getFeatures() const { return _features; }
        const Wt::WDateTime& getAddedAt() const { return _addedAt; }
        const Wt::WDateTime& getUpdatedAt() const { return _updatedAt; }
        ReleaseTrackId getReleaseTrackId() const { return _releaseTrack.id(); }

        // Modifiers
        void setReleaseTrack(ObjectPtr<ReleaseTrack> releaseTrack);
        void setSizeBytes(long long sizeBytes) { _sizeBytes = sizeBytes; }
        void setModifiedUnix(long long modifiedUnix) { _modifiedUnix = modifiedUnix; }
        void setDuration(std::chrono::milliseconds duration) { _durationMs = duration.count(); }
        void setBitrateKbps(std::optional<int> bitrateKbps) { _bitrateKbps = bitrateKbps; }
        void setSampleRateHz(std::optional<int> sampleRateHz) { _sampleRateHz = sampleRateHz; }
        void setChannelCount(std::optional<int> channels) { _channels = channels; }
        void setFingerprint(std::optional<std::string> fingerprint) { _fingerprint = std::move(fingerprint); }
        void setBpm(std::optional<double> bpm) { _bpm = bpm; }
        void setQualityScore(std::optional<double> qualityScore) { _qualityScore = qualityScore; }
        void setQualityAssessment(std::optional<std::string> qualityAssessment) { _qualityAssessment = std::move(qualityAssessment); }
        void setFeatures(std::vector<unsigned char> features) { _features = std::move(features); }
        void touch();

        template<class Action>
        void persist(Action& a)
        {
            persistId(a);
            Wt::Dbo::field(a, _path, "path");
            Wt::Dbo::field(a, _sizeBytes, "size_bytes");
            Wt::Dbo::field(a, _modifiedUnix, "modified_unix");
            Wt::Dbo::field(a, _durationMs, "duration_ms");
            Wt::Dbo::field(a, _bitrateKbps, "bitrate_kbps");
            Wt::Dbo::field(a, _sampleRateHz, "sample_rate_hz");
            Wt::Dbo::field(a, _channels, "channels");
            Wt::Dbo::field(a, _fingerprint, "fingerprint");
            Wt::Dbo::field(a, _bpm, "bpm");
            Wt::Dbo::field(a, _qualityScore, "quality_score");
            Wt::Dbo::field(a, _qualityAssessment, "quality_assessment");
            Wt::Dbo::field(a, _features, "features");
            Wt::Dbo::field(a, _addedAt, "added_at");
            Wt::Dbo::field(a, _updatedAt, "updated_at");

            Wt::Dbo::belongsTo(a, _releaseTrack, "release_track", Wt::Dbo::OnDeleteCascade | Wt::Dbo::NotNull);
        }

    private:
        friend class Session;
        LibraryFile(const std::filesystem::path& path, ObjectPtr<ReleaseTrack> releaseTrack);
        static pointer create(Session& session, const std::filesystem::path& path, ObjectPtr<ReleaseTrack> releaseTrack);

        std::string _path;
        long long _sizeBytes{};
        long long _modifiedUnix{};
        long long _durationMs{};
        std::optional<int> _bitrateKbps;
        std::optional<int> _sampleRateHz;
        std::optional<int> _channels;
        std::optional<std::string> _fingerprint;
        std::optional<double> _bpm;
        std::optional<double> _qualityScore;
        std::optional<std::string> _qualityAssessment;
        std::vector<unsigned char> _features;
        Wt::WDateTime _addedAt;
        Wt::WDateTime _updatedAt;

        Wt::Dbo::ptr<ReleaseTrack> _releaseTrack;
    };
} // namespace gamus::db
