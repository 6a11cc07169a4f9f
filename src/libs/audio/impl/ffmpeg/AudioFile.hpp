/*
 * Copyright (C) 2020 Emeric Poupon
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
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

extern "C"
{
    struct AVFormatContext;
}

namespace gamus::audio::ffmpeg
{
    struct ContainerInfo
    {
        std::string containerName;

        std::size_t bitrate{}; // bps, 0 if unknown
        std::chrono::milliseconds duration{};
    };

    struct StreamInfo
    {
        std::size_t index{};
        std::string codecName;

        std::optional<std::size_t> bitrate;
        std::optional<std::size_t> bitsPerSample;
        std::optional<std::size_t> channelCount;
        std::optional<std::size_t> sampleRate;
    };

    std::string averrorToString(int error);

    class AudioFile
    {
    public:
        // Throws UnreadableException, UnsupportedFormatException or CorruptStreamException
        AudioFile(const std::filesystem::path& p);
        ~AudioFile();
        AudioFile(const AudioFile&) = delete;
        AudioFile& operator=(const AudioFile&) = delete;

        // keys are lower case
        using MetadataMap = std::unordered_map<std::string, std::string>;

        const std::filesystem::path& getPath() const;
        ContainerInfo getContainerInfo() const;
        MetadataMap getMetaData() const;
        std::vector<StreamInfo> getStreamInfo() const;
        std::optional<StreamInfo> getBestStreamInfo() const;
        std::optional<std::size_t> getBestStreamIndex() const;

        AVFormatContext* getFormatContext() const { return _context; }

    private:
        std::optional<StreamInfo> getStreamInfo(std::size_t streamIndex) const;

        const std::filesystem::path _p;
        AVFormatContext* _context{};
    };
} // namespace gamus::audio::ffmpeg
