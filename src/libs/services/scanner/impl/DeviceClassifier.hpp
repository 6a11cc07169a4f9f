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

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace gamus::scanner
{
    // Candidate files found under one configured root
    struct RootCandidates
    {
        std::filesystem::path root;
        std::vector<std::filesystem::path> files;
    };

    // Roots sharing the same storage device, scanned under one concurrency budget
    struct DeviceGroup
    {
        std::string deviceId;
        std::vector<std::filesystem::path> roots;
        std::vector<std::filesystem::path> files;
        std::optional<double> bandwidthMBps; // not set if unknown
        std::size_t workerCount{ 1 };
    };

    // "major:minor" of the device holding path
    std::optional<std::string> getDeviceId(const std::filesystem::path& path, std::error_code& ec);

    // Reads at most maxBytes from the start of the file, in MB/s
    // Not set if nothing could be read or if the read was too fast to be timed
    std::optional<double> measureReadThroughput(const std::filesystem::path& file, std::size_t maxBytes);

    class DeviceClassifier
    {
    public:
        struct Settings
        {
            std::size_t maxWorkerCount{ 1 }; // per device
            double mbPerWorker{ 50 };
            std::size_t sampleBytes{ 20 * 1024 * 1024 };
        };

        DeviceClassifier(const Settings& settings);
        ~DeviceClassifier() = default;
        DeviceClassifier(const DeviceClassifier&) = delete;
        DeviceClassifier& operator=(const DeviceClassifier&) = delete;

        // Groups are ordered by first appearance of their device in roots
        // A root whose device cannot be resolved gets its own single worker group
        std::vector<DeviceGroup> classify(std::span<const RootCandidates> roots);

        static std::size_t computeWorkerCount(std::optional<double> bandwidthMBps, double mbPerWorker, std::size_t maxWorkerCount);

    private:
        // measured once per device for the lifetime of the classifier
        std::optional<double> getBandwidth(const std::string& deviceId, const std::filesystem::path& sampleFile);

        const Settings _settings;

        std::mutex _mutex;
        std::unordered_map<std::string, double> _bandwidthCache;
    };
} // namespace gamus::scanner
