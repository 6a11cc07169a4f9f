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

#include "ScannerService.hpp"

#include <algorithm>
#include <thread>
#include <unordered_set>

#include "core/IConfig.hpp"
#include "core/IJob.hpp"
#include "core/IJobScheduler.hpp"
#include "core/ILogger.hpp"
#include "database/Exception.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "services/scanner/Exception.hpp"

#include "DirectoryWalker.hpp"
#include "FileImportJob.hpp"
#include "JobQueue.hpp"
#include "ProgressReporter.hpp"
#include "ScanErrorLogger.hpp"

namespace gamus::scanner
{
    namespace
    {
        unsigned long getConfigULong(std::string_view setting, unsigned long def)
        {
            if (core::IConfig * config{ core::Service<core::IConfig>::get() })
                return config->getULong(setting, def);

            return def;
        }

        std::size_t getScannerThreadCount()
        {
            std::size_t threadCount{ getConfigULong("scanner-thread-count", 0) };

            if (threadCount == 0)
                threadCount = std::max<std::size_t>(std::thread::hardware_concurrency() / 2, 1);

            return threadCount;
        }

        class DeviceImportJob : public core::IJob
        {
        public:
            using ImportFunction = std::function<void(const DeviceGroup&)>;

            DeviceImportJob(const DeviceGroup& group, ImportFunction importFunction)
                : _group{ group }
                , _importFunction{ std::move(importFunction) }
            {
            }

        private:
            core::LiteralString getName() const override { return "Import Device Files"; }

            void run() override
            {
                _importFunction(_group);
            }

            const DeviceGroup& _group;
            ImportFunction _importFunction;
        };
    } // namespace

    std::unique_ptr<IScannerService> createScannerService(db::IDb& db, std::unique_ptr<audio::IMetadataExtractor> extractor)
    {
        return std::make_unique<ScannerService>(db, std::move(extractor));
    }

    ScannerService::ScannerService(db::IDb& db, std::unique_ptr<audio::IMetadataExtractor> extractor)
        : _db{ db }
        , _extractor{ std::move(extractor) }
        , _persister{ db }
        , _deviceClassifier{ DeviceClassifier::Settings{ .maxWorkerCount = getScannerThreadCount(), .mbPerWorker = static_cast<double>(getConfigULong("scanner-mb-per-worker", 50)) } }
        , _progressQueueSize{ getConfigULong("scanner-progress-queue-size", 1'024) }
    {
        if (!_extractor)
            throw Exception{ "No metadata extractor provided" };

        _ioService.setThreadCount(1);

        GAMUS_LOG(SCANNER, INFO, "Using up to " << getScannerThreadCount() << " worker(s) per device");

        db::CatalogStats stats;
        {
            auto& session{ _db.getTLSSession() };
            auto transaction{ session.createReadTransaction() };
            stats = session.getCatalogStats();
        }

        // Indexes may not be used if the stats are outdated, making imports slower and slower
        GAMUS_LOG(SCANNER, INFO, "Catalog file count = " << stats.libraryFileCount);
        if (stats.libraryFileCount >= 1'000)
            _db.getTLSSession().fullAnalyze();

        _ioService.start();
    }

    ScannerService::~ScannerService()
    {
        GAMUS_LOG(SCANNER, INFO, "Stopping service...");
        _abortScan = true;
        _ioService.stop();
        GAMUS_LOG(SCANNER, INFO, "Service stopped!");
    }

    void ScannerService::requestImport(const ScannerConfig& config, std::shared_ptr<IProgressObserver> observer)
    {
        {
            std::unique_lock lock{ _statusMutex };

            if (_curState == State::Scanning)
                throw ScanAlreadyInProgressException{};

            _curState = State::Scanning;
            _currentScanStats.emplace();
            _currentScanStats->startTime = Wt::WDateTime::currentDateTime();
            _currentFatalError.reset();
        }

        _abortScan = false;
        _ioService.post([this, config, observer = std::move(observer)] {
            scan(config, observer);
        });
    }

    void ScannerService::requestStop()
    {
        GAMUS_LOG(SCANNER, DEBUG, "Scan stop requested");
        _abortScan = true;
    }

    ScannerService::Status ScannerService::getStatus() const
    {
        Status res;

        std::shared_lock lock{ _statusMutex };

        res.currentState = _curState;
        res.currentScanStats = _currentScanStats;
        res.lastScanStats = _lastScanStats;
        res.lastFatalError = _lastFatalError;

        return res;
    }

    void ScannerService::waitForCompletion()
    {
        std::shared_lock lock{ _statusMutex };
        _statusCondVar.wait(lock, [this] { return _curState != State::Scanning; });
    }

    ScanSummary ScannerService::classify(const ScannerConfig& config)
    {
        std::vector<std::shared_ptr<ScanError>> walkErrors;
        const std::vector<RootCandidates> roots{ collectCandidates(config, walkErrors, false) };

        ScanSummary summary;
        for (const DeviceGroup& group : _deviceClassifier.classify(roots))
        {
            summary.devices.push_back(DeviceSummary{
                .deviceId = group.deviceId,
                .roots = group.roots,
                .bandwidthMBps = group.bandwidthMBps,
                .workerCount = group.workerCount,
                .candidateCount = group.files.size(),
            });
            summary.totalCandidates += group.files.size();
        }

        return summary;
    }

    void ScannerService::scan(const ScannerConfig& config, std::shared_ptr<IProgressObserver> observer)
    {
        GAMUS_LOG(SCANNER, INFO, "New scan started!");

        std::optional<std::string> fatalError;
        ScanStats stats;
        {
            ProgressReporter reporter{ std::move(observer), _progressQueueSize };

            try
            {
                importFiles(config, reporter);
            }
            catch (const std::exception& e)
            {
                onFatalError(e.what());
            }

            {
                std::shared_lock lock{ _statusMutex };
                fatalError = _currentFatalError;
            }

            if (fatalError)
                reporter.post(ImportFailed{ *fatalError });
            else
                reporter.post(ImportFinished{});
            reporter.flush();

            std::unique_lock lock{ _statusMutex };
            _currentScanStats->droppedEvents = reporter.getDroppedEventCount();
            _currentScanStats->stopTime = Wt::WDateTime::currentDateTime();
            stats = *_currentScanStats;
        }

        if (fatalError)
            GAMUS_LOG(SCANNER, ERROR, "Scan failed: " << *fatalError);
        else
            GAMUS_LOG(SCANNER, INFO, "Scan " << (_abortScan ? "aborted" : "complete") << ". Changes = " << stats.getChangesCount() << " (added = " << stats.additions << ", updated = " << stats.updates << "), Not changed = " << stats.skips << ", Processed = " << stats.getProcessedFileCount() << "/" << stats.totalFileCount << " (errors = " << stats.errors << ", walk errors = " << stats.walkErrors << ")");

        {
            std::unique_lock lock{ _statusMutex };

            _curState = fatalError ? State::Failed : State::Succeeded;
            _lastScanStats = std::move(stats);
            _lastFatalError = std::move(fatalError);
            _currentScanStats.reset(); // must be sync with _curState
        }
        _statusCondVar.notify_all();
    }

    void ScannerService::importFiles(const ScannerConfig& config, ProgressReporter& reporter)
    {
        if (config.roots.empty())
        {
            GAMUS_LOG(SCANNER, INFO, "No root directory configured: nothing to import");
            reporter.post(ImportStarted{ 0 });
            return;
        }

        std::vector<std::shared_ptr<ScanError>> walkErrors;
        const std::vector<RootCandidates> roots{ collectCandidates(config, walkErrors, true) };
        const std::vector<DeviceGroup> groups{ _deviceClassifier.classify(roots) };

        std::size_t totalFileCount{};
        for (const DeviceGroup& group : groups)
            totalFileCount += group.files.size();

        {
            std::unique_lock lock{ _statusMutex };

            _currentScanStats->totalFileCount = totalFileCount;
            _currentScanStats->walkErrors = walkErrors.size();
            for (const std::shared_ptr<ScanError>& error : walkErrors)
            {
                if (_currentScanStats->errorList.size() < ScanStats::maxStoredErrorCount)
                    _currentScanStats->errorList.push_back(error);
            }
        }

        GAMUS_LOG(SCANNER, INFO, "Found " << totalFileCount << " file(s) to import on " << groups.size() << " device(s)");
        reporter.post(ImportStarted{ totalFileCount });

        importDeviceGroups(groups, reporter);
    }

    void ScannerService::importDeviceGroups(std::span<const DeviceGroup> groups, ProgressReporter& reporter)
    {
        if (groups.empty())
            return;

        // devices are imported concurrently, each one with its own workers
        auto deviceScheduler{ core::createJobScheduler("ScannerDevice", groups.size()) };
        for (const DeviceGroup& group : groups)
        {
            deviceScheduler->scheduleJob(std::make_unique<DeviceImportJob>(group, [this, &reporter](const DeviceGroup& deviceGroup) {
                importDeviceGroup(deviceGroup, reporter);
            }));
        }
        deviceScheduler->wait();
    }

    void ScannerService::importDeviceGroup(const DeviceGroup& group, ProgressReporter& reporter)
    {
        constexpr std::size_t queuedJobsPerWorker{ 4 };
        constexpr std::size_t processJobsDoneBatchSize{ 16 };
        constexpr float drainRatio{ 0.85 };

        auto workerScheduler{ core::createJobScheduler("ScannerWorker", group.workerCount) };
        workerScheduler->setShouldAbortCallback([this] { return _abortScan.load(); });

        JobQueue queue{ *workerScheduler, group.workerCount * queuedJobsPerWorker, [&](std::span<std::unique_ptr<core::IJob>> jobsDone) { processImportJobsDone(jobsDone, reporter); }, processJobsDoneBatchSize, drainRatio };

        for (const std::filesystem::path& file : group.files)
        {
            if (_abortScan)
            {
                GAMUS_LOG(SCANNER, DEBUG, "Import aborted on device " << group.deviceId);
                break;
            }

            queue.push(std::make_unique<FileImportJob>(*_extractor, _persister, file));
        }

        queue.finish();
    }

    void ScannerService::processImportJobsDone(std::span<std::unique_ptr<core::IJob>> jobsDone, ProgressReporter& reporter)
    {
        for (const std::unique_ptr<core::IJob>& job : jobsDone)
        {
            const auto& importJob{ static_cast<const FileImportJob&>(*job) };

            switch (importJob.getStatus())
            {
            case FileImportJob::Status::Added:
            case FileImportJob::Status::Updated:
            case FileImportJob::Status::Skipped:
                {
                    std::unique_lock lock{ _statusMutex };

                    _currentScanStats->successes++;
                    if (importJob.getStatus() == FileImportJob::Status::Added)
                        _currentScanStats->additions++;
                    else if (importJob.getStatus() == FileImportJob::Status::Updated)
                        _currentScanStats->updates++;
                    else
                        _currentScanStats->skips++;
                }
                reporter.post(FileImported{ importJob.getPath().string() });
                break;

            case FileImportJob::Status::Failed:
                {
                    const std::shared_ptr<ScanError>& error{ importJob.getError() };

                    ScanErrorLogger errorLogger;
                    error->accept(errorLogger);

                    {
                        std::unique_lock lock{ _statusMutex };

                        _currentScanStats->errors++;
                        if (_currentScanStats->errorList.size() < ScanStats::maxStoredErrorCount)
                            _currentScanStats->errorList.push_back(error);
                    }
                    reporter.post(FileFailed{ importJob.getPath().string(), error->getMessage() });
                }
                break;

            case FileImportJob::Status::CatalogUnavailable:
                onFatalError(importJob.getFatalError());
                break;
            }
        }
    }

    std::vector<RootCandidates> ScannerService::collectCandidates(const ScannerConfig& config, std::vector<std::shared_ptr<ScanError>>& walkErrors, bool abortable)
    {
        std::vector<RootCandidates> res;

        const WalkOptions options{
            .extensions = normalizeAudioExtensions(config.audioExtensions),
            .ignoreHidden = config.ignoreHidden,
            .maxDepth = config.maxDepth,
        };

        // overlapping roots must not import the same file twice
        std::unordered_set<std::string> knownFiles;

        for (const std::filesystem::path& root : config.roots)
        {
            RootCandidates& candidates{ res.emplace_back() };
            candidates.root = root;

            DirectoryWalker walker{ options, [&](const std::filesystem::path& path, std::error_code ec) {
                                       auto error{ std::make_shared<IOScanError>(path, ec) };

                                       ScanErrorLogger errorLogger;
                                       error->accept(errorLogger);
                                       walkErrors.push_back(std::move(error));
                                   } };

            const bool completed{ walker.walk(root, [&](const std::filesystem::path& file) {
                if (knownFiles.insert(file.lexically_normal().string()).second)
                    candidates.files.push_back(file);

                return !abortable || !_abortScan;
            }) };

            if (!completed)
                break;
        }

        return res;
    }

    void ScannerService::onFatalError(std::string_view error)
    {
        GAMUS_LOG(SCANNER, ERROR, "Fatal error, aborting scan: " << error);

        {
            std::unique_lock lock{ _statusMutex };
            if (!_currentFatalError)
                _currentFatalError = std::string{ error };
        }

        _abortScan = true;
    }
} // namespace gamus::scanner
