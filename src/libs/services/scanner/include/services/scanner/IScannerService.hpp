/*
 * Copyright (C) 2019 Emeric Poupon
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

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "services/scanner/ProgressEvents.hpp"
#include "services/scanner/ScannerConfig.hpp"
#include "services/scanner/ScannerStats.hpp"

namespace gamus::db
{
    class IDb;
}

namespace gamus::audio
{
    class IMetadataExtractor;
}

namespace gamus::scanner
{
    struct DeviceSummary
    {
        std::string deviceId;
        std::vector<std::filesystem::path> roots;
        std::optional<double> bandwidthMBps; // not set if unknown
        std::size_t workerCount{};
        std::size_t candidateCount{};
    };

    struct ScanSummary
    {
        std::vector<DeviceSummary> devices;
        std::size_t totalCandidates{};
    };

    class IScannerService
    {
    public:
        virtual ~IScannerService() = default;

        // Async request, returns once accepted
        // Throws ScanAlreadyInProgressException if a scan is in progress
        virtual void requestImport(const ScannerConfig& config, std::shared_ptr<IProgressObserver> observer) = 0;

        // Cooperative: stops admitting new files, in flight files are completed
        virtual void requestStop() = 0;

        enum class State
        {
            Idle,
            Scanning,
            Succeeded,
            Failed,
        };

        struct Status
        {
            State currentState{ State::Idle };
            std::optional<ScanStats> currentScanStats;  // set while scanning
            std::optional<ScanStats> lastScanStats;     // last terminated scan
            std::optional<std::string> lastFatalError; // set if the last scan failed
        };

        virtual Status getStatus() const = 0;

        // Blocks until the current scan, if any, is terminated
        virtual void waitForCompletion() = 0;

        // Dry run: walks and classifies roots, no extraction
        virtual ScanSummary classify(const ScannerConfig& config) = 0;
    };

    std::unique_ptr<IScannerService> createScannerService(db::IDb& db, std::unique_ptr<audio::IMetadataExtractor> extractor);
} // namespace gamus::scanner
