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

#include <atomic>
#include <condition_variable>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <vector>

#include <Wt/WIOService.h>

#include "audio/IMetadataExtractor.hpp"
#include "services/scanner/IScannerService.hpp"
#include "services/scanner/ScanErrors.hpp"

#include "DeviceClassifier.hpp"
#include "Persister.hpp"

namespace gamus::core
{
    class IJob;
}

namespace gamus::db
{
    class IDb;
}

namespace gamus::scanner
{
    class ProgressReporter;

    // Keep the scanner stable:
    // - single walk per scan, files are counted before being imported
    // - successive scans have no effect if there is no change in the files
    class ScannerService : public IScannerService
    {
    public:
        ScannerService(db::IDb& db, std::unique_ptr<audio::IMetadataExtractor> extractor);
        ~ScannerService() override;
        ScannerService(const ScannerService&) = delete;
        ScannerService& operator=(const ScannerService&) = delete;

    private:
        void requestImport(const ScannerConfig& config, std::shared_ptr<IProgressObserver> observer) override;
        void requestStop() override;
        Status getStatus() const override;
        void waitForCompletion() override;
        ScanSummary classify(const ScannerConfig& config) override;

        void scan(const ScannerConfig& config, std::shared_ptr<IProgressObserver> observer);
        void importFiles(const ScannerConfig& config, ProgressReporter& reporter);
        void importDeviceGroups(std::span<const DeviceGroup> groups, ProgressReporter& reporter);
        void importDeviceGroup(const DeviceGroup& group, ProgressReporter& reporter);
        void processImportJobsDone(std::span<std::unique_ptr<core::IJob>> jobsDone, ProgressReporter& reporter);

        // abortable: the walk stops if a scan abort is requested
        std::vector<RootCandidates> collectCandidates(const ScannerConfig& config, std::vector<std::shared_ptr<ScanError>>& walkErrors, bool abortable);

        void onFatalError(std::string_view error);

        db::IDb& _db;
        const std::unique_ptr<audio::IMetadataExtractor> _extractor;
        Persister _persister;
        DeviceClassifier _deviceClassifier;
        const std::size_t _progressQueueSize;

        std::atomic<bool> _abortScan{};
        Wt::WIOService _ioService;

        mutable std::shared_mutex _statusMutex;
        std::condition_variable_any _statusCondVar;
        State _curState{ State::Idle };
        std::optional<ScanStats> _currentScanStats;
        std::optional<ScanStats> _lastScanStats;
        std::optional<std::string> _lastFatalError;
        std::optional<std::string> _currentFatalError;
    };
} // namespace gamus::scanner
