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

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gamus::audio
{
    // Embedded tag values, trimmed, empty values are absent
    struct Tags
    {
        std::optional<std::string> title;
        std::optional<std::string> album;
        std::optional<std::string> artist;
        std::optional<std::string> albumArtist;
        std::optional<std::string> date;
        std::optional<std::string> genre;
        std::optional<int> trackNumber;
        std::optional<int> discNumber;
    };

    struct FileMetadata
    {
        std::filesystem::path path;
        std::uint64_t sizeBytes{};
        std::int64_t modifiedUnix{};

        std::chrono::milliseconds duration{};
        std::optional<int> bitrateKbps;
        std::optional<int> sampleRateHz;
        std::optional<int> channelCount;

        std::optional<std::string> fingerprint; // 16 hex digits, computed on decoded samples
        std::optional<double> bpm;
        std::optional<double> qualityScore; // in [0, 1]
        std::optional<std::string> qualityAssessment;
        std::vector<unsigned char> features;

        Tags tags;
    };
} // namespace gamus::audio
