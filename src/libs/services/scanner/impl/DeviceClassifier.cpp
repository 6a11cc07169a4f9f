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

#include "DeviceClassifier.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <fstream>
#include <sys/stat.h>
#include <sys/sysmacros.h>
#include <sys/types.h>

#include "core/ILogger.hpp"

namespace gamus::scanner
{
    namespace
    {
        constexpr std::size_t readChunkSize{ 1024 * 1024 };
    } // namespace

    std::optional<std::string> getDeviceId(const std::filesystem::path& path, std::error_code& ec)
    {
        struct stat sb{};
        if (::stat(path.c_str(), &sb) == -1)
        {
            ec = std::error_code{ errno, std::generic_category() };
            return std::nullopt;
        }

        ec.clear();
        return std::to_string(major(sb.st_dev)) + ":" + std::to_string(minor(sb.st_dev));
    }

    std::optional<double> measureReadThroughput(const std::filesystem::path& file, std::size_t maxBytes)
    {
        const auto start{ std::chrono::steady_clock::now() };

        std::ifstream ifs{ file, std::ios::binary };
        if (!ifs)
            return std::nullopt;

        std::vector<char> buffer(std::min(readChunkSize, maxBytes));
        std::size_t readBytes{};
        while (readBytes < maxBytes && ifs)
        {
            const std::size_t toRead{ std::min(buffer.size(), maxBytes - readBytes) };
            ifs.read(buffer.data(), static_cast<std::streamsize>(toRead));
            readBytes += static_cast<std::size_t>(ifs.gcount());
        }

        const std::chrono::duration<double> elapsed{ std::chrono::steady_clock::now() - start };
        if (readBytes == 0 || elapsed.count() <= 0)
            return std::nullopt;

        return static_cast<double>(readBytes) / (1024 * 1024) / elapsed.count();
    }

    DeviceClassifier::DeviceClassifier(const Settings& settings)
        : _settings{ settings }
    {
    }

    std::size_t DeviceClassifier::computeWorkerCount(std::optional<double> bandwidthMBps, double mbPerWorker, std::size_t maxWorkerCount)
    {
        maxWorkerCount = std::max<std::size_t>(maxWorkerCount, 1);

        if (!bandwidthMBps || mbPerWorker <= 0)
            return 1;

        const double workerCount{ std::round(*bandwidthMBps / mbPerWorker) };
        if (workerCount <= 1)
            return 1;

        return std::min(static_cast<std::size_t>(workerCount), maxWorkerCount);
    }

    std::vector<DeviceGroup> DeviceClassifier::classify(std::span<const RootCandidates> roots)
    {
        std::vector<DeviceGroup> groups;

        for (const RootCandidates& root : roots)
        {
            std::error_code ec;
            const std::optional<std::string> deviceId{ getDeviceId(root.root, ec) };
            if (!deviceId)
            {
                GAMUS_LOG(SCANNER, WARNING, "Cannot resolve device of " << root.root << ": " << ec.message() << ", using a single worker");

                DeviceGroup& group{ groups.emplace_back() };
                group.deviceId = "unknown:" + root.root.string();
                group.roots.push_back(root.root);
                group.files = root.files;
                continue;
            }

            auto itGroup{ std::find_if(std::begin(groups), std::end(groups), [&](const DeviceGroup& group) { return group.deviceId == *deviceId; }) };
            if (itGroup == std::end(groups))
            {
                itGroup = groups.emplace(std::end(groups));
                itGroup->deviceId = *deviceId;
            }

            itGroup->roots.push_back(root.root);
            itGroup->files.insert(std::end(itGroup->files), std::cbegin(root.files), std::cend(root.files));
        }

        for (DeviceGroup& group : groups)
        {
            if (!group.files.empty() && !group.deviceId.starts_with("unknown:"))
                group.bandwidthMBps = getBandwidth(group.deviceId, group.files.front());

            group.workerCount = computeWorkerCount(group.bandwidthMBps, _settings.mbPerWorker, _settings.maxWorkerCount);

            if (group.bandwidthMBps)
                GAMUS_LOG(SCANNER, INFO, "Device " << group.deviceId << ": " << group.files.size() << " file(s), " << static_cast<long>(*group.bandwidthMBps) << " MB/s, using " << group.workerCount << " worker(s)");
            else
                GAMUS_LOG(SCANNER, INFO, "Device " << group.deviceId << ": " << group.files.size() << " file(s), unknown bandwidth, using " << group.workerCount << " worker(s)");
        }

        return groups;
    }

    std::optional<double> DeviceClassifier::getBandwidth(const std::string& deviceId, const std::filesystem::path& sampleFile)
    {
        {
            std::scoped_lock lock{ _mutex };
            if (auto it{ _bandwidthCache.find(deviceId) }; it != std::cend(_bandwidthCache))
                return it->second;
        }

        const std::optional<double> bandwidth{ measureReadThroughput(sampleFile, _settings.sampleBytes) };
        if (!bandwidth)
        {
            GAMUS_LOG(SCANNER, DEBUG, "Cannot measure bandwidth of device " << deviceId << " using " << sampleFile);
            return std::nullopt;
        }

        std::scoped_lock lock{ _mutex };
        _bandwidthCache.emplace(deviceId, *bandwidth);

        return bandwidth;
    }
} // namespace gamus::scanner
