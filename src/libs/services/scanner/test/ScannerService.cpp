/*
 * Copyright (C) 2024 Emeric Poupon
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

#include <array>

#include <gtest/gtest.h>

#include "database/objects/Artist.hpp"
#include "database/objects/LibraryFile.hpp"
#include "database/objects/Release.hpp"
#include "database/objects/ReleaseTrack.hpp"
#include "database/objects/Song.hpp"
#include "services/scanner/Exception.hpp"
#include "services/scanner/IScannerService.hpp"

#include "Common.hpp"

namespace gamus::scanner::tests
{
    namespace
    {
        class ScannerServiceTest : public ScannerFixture
        {
        public:
            ScannerServiceTest(std::chrono::milliseconds extractDuration = {})
            {
                auto extractor{ std::make_unique<FakeMetadataExtractor>(extractDuration) };
                fakeExtractor = extractor.get();
                scanner = createScannerService(tmpDb.getDb(), std::move(extractor));
            }

            ScannerConfig createConfig() const
            {
                ScannerConfig config;
                config.roots = { libraryDir.getPath() };
                return config;
            }

            std::shared_ptr<RecordingObserver> importAndWait(const ScannerConfig& config)
            {
                auto observer{ std::make_shared<RecordingObserver>() };
                scanner->requestImport(config, observer);
                scanner->waitForCompletion();
                return observer;
            }

            std::size_t getLibraryFileCount()
            {
                auto transaction{ session.createReadTransaction() };
                return db::LibraryFile::getCount(session);
            }

            FakeMetadataExtractor* fakeExtractor{};
            std::unique_ptr<IScannerService> scanner;
        };

        class SlowScannerServiceTest : public ScannerServiceTest
        {
        public:
            SlowScannerServiceTest()
                : ScannerServiceTest{ std::chrono::milliseconds{ 5 } } {}
        };

        void checkEventOrdering(const std::vector<ProgressEvent>& events)
        {
            ASSERT_GE(events.size(), 2);
            EXPECT_TRUE(std::holds_alternative<ImportStarted>(events.front()));
            EXPECT_TRUE(std::holds_alternative<ImportFinished>(events.back()));
            for (std::size_t i{ 1 }; i < events.size() - 1; ++i)
                EXPECT_TRUE(std::holds_alternative<FileImported>(events[i]) || std::holds_alternative<FileFailed>(events[i])) << "unexpected " << getEventName(events[i]);
        }
    } // namespace

    TEST_F(ScannerServiceTest, initialState)
    {
        const IScannerService::Status status{ scanner->getStatus() };
        EXPECT_EQ(status.currentState, IScannerService::State::Idle);
        EXPECT_FALSE(status.currentScanStats);
        EXPECT_FALSE(status.lastScanStats);
        EXPECT_FALSE(status.lastFatalError);

        // nothing to wait for
        scanner->waitForCompletion();
    }

    TEST_F(ScannerServiceTest, import)
    {
        libraryDir.createFile("Album/01 - Artist - One.mp3", "one");
        libraryDir.createFile("Album/02 - Artist - Two.flac", "two");
        libraryDir.createFile("Album/03 - Artist - Three.ogg", "three");
        const std::filesystem::path corruptFile{ libraryDir.createFile("Album/corrupt.mp3", "corrupt") };
        libraryDir.createFile("Album/notes.txt");
        libraryDir.createFile("Album/cover.jpg", "jpeg");

        const auto observer{ importAndWait(createConfig()) };

        const std::vector<ProgressEvent> events{ observer->getEvents() };
        checkEventOrdering(events);
        EXPECT_EQ(std::get<ImportStarted>(events.front()).totalFileCount, 4);
        EXPECT_EQ(observer->getEventCount<FileImported>(), 3);
        ASSERT_EQ(observer->getEventCount<FileFailed>(), 1);
        for (const ProgressEvent& event : events)
        {
            if (const FileFailed * failed{ std::get_if<FileFailed>(&event) })
            {
                EXPECT_EQ(failed->path, corruptFile.string());
                EXPECT_TRUE(failed->error.starts_with("corrupt stream: ")) << failed->error;
            }
        }

        const IScannerService::Status status{ scanner->getStatus() };
        EXPECT_EQ(status.currentState, IScannerService::State::Succeeded);
        EXPECT_FALSE(status.currentScanStats);
        EXPECT_FALSE(status.lastFatalError);
        ASSERT_TRUE(status.lastScanStats);
        EXPECT_EQ(status.lastScanStats->totalFileCount, 4);
        EXPECT_EQ(status.lastScanStats->successes, 3);
        EXPECT_EQ(status.lastScanStats->additions, 3);
        EXPECT_EQ(status.lastScanStats->errors, 1);
        EXPECT_EQ(status.lastScanStats->getProcessedFileCount(), 4);
        EXPECT_EQ(status.lastScanStats->errorList.size(), 1);

        EXPECT_EQ(getLibraryFileCount(), 3);
    }

    TEST_F(ScannerServiceTest, filteredImportIsIdempotent)
    {
        libraryDir.createFile("Album/01 - Artist - One.mp3", "one");
        libraryDir.createFile("Album/02 - Artist - Two.mp3", "two");
        libraryDir.createFile("Album/03 - Artist - Three.mp3", "three");
        libraryDir.createFile("Album/corrupt.mp3", "corrupt");
        // not candidates
        libraryDir.createFile(".foo/track.mp3");
        libraryDir.createFile("track.txt");
        libraryDir.createFile("Album/04 - Artist - Four.flac");
        libraryDir.createFile("a/b/c/05 - Artist - Deep.mp3");

        ScannerConfig config{ createConfig() };
        config.audioExtensions = { "mp3" };
        config.ignoreHidden = true;
        config.maxDepth = 2;

        auto getRowCounts{ [this] {
            auto transaction{ session.createReadTransaction() };
            return std::array<std::size_t, 5>{ db::Artist::getCount(session), db::Song::getCount(session), db::Release::getCount(session), db::ReleaseTrack::getCount(session), db::LibraryFile::getCount(session) };
        } };

        {
            const auto observer{ importAndWait(config) };
            const std::vector<ProgressEvent> events{ observer->getEvents() };
            checkEventOrdering(events);
            EXPECT_EQ(std::get<ImportStarted>(events.front()).totalFileCount, 4);
            EXPECT_EQ(observer->getEventCount<FileImported>(), 3);
            EXPECT_EQ(observer->getEventCount<FileFailed>(), 1);
            EXPECT_EQ(getLibraryFileCount(), 3);
        }

        const auto rowCounts{ getRowCounts() };
        EXPECT_EQ(rowCounts[0], 1); // one artist for all the files
        EXPECT_EQ(rowCounts[2], 1);

        {
            const auto observer{ importAndWait(config) };
            EXPECT_EQ(observer->getEventCount<FileImported>(), 3);
            EXPECT_EQ(observer->getEventCount<FileFailed>(), 1);
        }
        EXPECT_EQ(getRowCounts(), rowCounts);
    }

    TEST_F(ScannerServiceTest, rescanSkipsUnchangedFiles)
    {
        libraryDir.createFile("Album/01 - Artist - One.mp3", "one");
        libraryDir.createFile("Album/02 - Artist - Two.mp3", "two");

        importAndWait(createConfig());
        EXPECT_EQ(fakeExtractor->getExtractCount(), 2);

        const auto observer{ importAndWait(createConfig()) };
        EXPECT_EQ(fakeExtractor->getExtractCount(), 2);
        EXPECT_EQ(observer->getEventCount<FileImported>(), 2);

        const IScannerService::Status status{ scanner->getStatus() };
        ASSERT_TRUE(status.lastScanStats);
        EXPECT_EQ(status.lastScanStats->successes, 2);
        EXPECT_EQ(status.lastScanStats->skips, 2);
        EXPECT_EQ(status.lastScanStats->getChangesCount(), 0);

        EXPECT_EQ(getLibraryFileCount(), 2);
    }

    TEST_F(ScannerServiceTest, failureIsolation)
    {
        libraryDir.createFile("01 - Artist - Good.mp3");
        libraryDir.createFile("corrupt.mp3");
        libraryDir.createFile("unsupported.mp3");
        libraryDir.createFile("unreadable.mp3");

        const auto observer{ importAndWait(createConfig()) };
        checkEventOrdering(observer->getEvents());
        EXPECT_EQ(observer->getEventCount<FileImported>(), 1);
        EXPECT_EQ(observer->getEventCount<FileFailed>(), 3);

        const IScannerService::Status status{ scanner->getStatus() };
        EXPECT_EQ(status.currentState, IScannerService::State::Succeeded);
        ASSERT_TRUE(status.lastScanStats);
        EXPECT_EQ(status.lastScanStats->errors, 3);

        std::size_t unreadableCount{};
        std::size_t unsupportedCount{};
        std::size_t corruptCount{};
        for (const std::shared_ptr<ScanError>& error : status.lastScanStats->errorList)
        {
            if (std::dynamic_pointer_cast<UnreadableFileError>(error))
                unreadableCount++;
            else if (std::dynamic_pointer_cast<UnsupportedFormatError>(error))
                unsupportedCount++;
            else if (std::dynamic_pointer_cast<CorruptStreamError>(error))
                corruptCount++;
        }
        EXPECT_EQ(unreadableCount, 1);
        EXPECT_EQ(unsupportedCount, 1);
        EXPECT_EQ(corruptCount, 1);

        EXPECT_EQ(getLibraryFileCount(), 1);
    }

    TEST_F(ScannerFixture, catalogUnavailableFailsImport)
    {
        for (int i{ 1 }; i <= 10; ++i)
            libraryDir.createFile("Album/" + std::to_string(i) + " - Artist - Title " + std::to_string(i) + ".mp3", "data" + std::to_string(i));

        SwitchableDb db{ tmpDb.getDb() };
        const std::unique_ptr<IScannerService> scanner{ createScannerService(db, std::make_unique<FakeMetadataExtractor>()) };

        ScannerConfig config;
        config.roots = { libraryDir.getPath() };

        db.setAvailable(false);
        auto observer{ std::make_shared<RecordingObserver>() };
        scanner->requestImport(config, observer);
        scanner->waitForCompletion();

        const std::vector<ProgressEvent> events{ observer->getEvents() };
        ASSERT_GE(events.size(), 2);
        EXPECT_TRUE(std::holds_alternative<ImportStarted>(events.front()));
        ASSERT_TRUE(std::holds_alternative<ImportFailed>(events.back()));
        EXPECT_NE(std::get<ImportFailed>(events.back()).error.find("unable to open database file"), std::string::npos);
        EXPECT_EQ(observer->getEventCount<ImportFailed>(), 1);
        EXPECT_EQ(observer->getEventCount<ImportFinished>(), 0);
        // not a per file failure
        EXPECT_EQ(observer->getEventCount<FileFailed>(), 0);

        {
            const IScannerService::Status status{ scanner->getStatus() };
            EXPECT_EQ(status.currentState, IScannerService::State::Failed);
            EXPECT_FALSE(status.currentScanStats);
            ASSERT_TRUE(status.lastFatalError);
            EXPECT_NE(status.lastFatalError->find("unable to open database file"), std::string::npos);
            ASSERT_TRUE(status.lastScanStats);
            EXPECT_EQ(status.lastScanStats->successes, 0);
        }

        // nothing half written, and the next run starts from a clean state
        db.setAvailable(true);
        {
            auto transaction{ session.createReadTransaction() };
            EXPECT_EQ(db::LibraryFile::getCount(session), 0);
        }

        auto secondObserver{ std::make_shared<RecordingObserver>() };
        scanner->requestImport(config, secondObserver);
        scanner->waitForCompletion();
        EXPECT_EQ(secondObserver->getEventCount<ImportFinished>(), 1);
        EXPECT_EQ(secondObserver->getEventCount<ImportFailed>(), 0);
        EXPECT_EQ(secondObserver->getEventCount<FileImported>(), 10);

        const IScannerService::Status status{ scanner->getStatus() };
        EXPECT_EQ(status.currentState, IScannerService::State::Succeeded);
        EXPECT_FALSE(status.lastFatalError);
    }

    TEST_F(ScannerServiceTest, noRoot)
    {
        const auto observer{ importAndWait(ScannerConfig{}) };

        const std::vector<ProgressEvent> events{ observer->getEvents() };
        ASSERT_EQ(events.size(), 2);
        EXPECT_EQ(std::get<ImportStarted>(events[0]).totalFileCount, 0);
        EXPECT_TRUE(std::holds_alternative<ImportFinished>(events[1]));
        EXPECT_EQ(scanner->getStatus().currentState, IScannerService::State::Succeeded);
    }

    TEST_F(ScannerServiceTest, missingRoot)
    {
        libraryDir.createFile("01 - Artist - One.mp3");

        ScannerConfig config{ createConfig() };
        config.roots.push_back(libraryDir.getPath() / "missing");

        const auto observer{ importAndWait(config) };
        checkEventOrdering(observer->getEvents());
        EXPECT_EQ(observer->getEventCount<FileImported>(), 1);
        // walk errors are not file errors
        EXPECT_EQ(observer->getEventCount<FileFailed>(), 0);

        const IScannerService::Status status{ scanner->getStatus() };
        EXPECT_EQ(status.currentState, IScannerService::State::Succeeded);
        ASSERT_TRUE(status.lastScanStats);
        EXPECT_EQ(status.lastScanStats->walkErrors, 1);
        EXPECT_EQ(status.lastScanStats->errors, 0);
        ASSERT_EQ(status.lastScanStats->errorList.size(), 1);
        EXPECT_TRUE(std::dynamic_pointer_cast<IOScanError>(status.lastScanStats->errorList.front()));
    }

    TEST_F(ScannerServiceTest, overlappingRoots)
    {
        libraryDir.createFile("Album/01 - Artist - One.mp3");
        libraryDir.createFile("Album/02 - Artist - Two.mp3");

        ScannerConfig config{ createConfig() };
        config.roots.push_back(libraryDir.getPath() / "Album");

        const auto observer{ importAndWait(config) };
        const std::vector<ProgressEvent> events{ observer->getEvents() };
        checkEventOrdering(events);
        EXPECT_EQ(std::get<ImportStarted>(events.front()).totalFileCount, 2);
        EXPECT_EQ(getLibraryFileCount(), 2);
    }

    TEST_F(ScannerServiceTest, nullObserver)
    {
        libraryDir.createFile("01 - Artist - One.mp3");

        scanner->requestImport(createConfig(), nullptr);
        scanner->waitForCompletion();

        EXPECT_EQ(scanner->getStatus().currentState, IScannerService::State::Succeeded);
        EXPECT_EQ(getLibraryFileCount(), 1);
    }

    TEST_F(ScannerServiceTest, classify)
    {
        libraryDir.createFile("a/01 - Artist - One.mp3");
        libraryDir.createFile("b/01 - Artist - Two.mp3");
        libraryDir.createFile("b/notes.txt");

        ScannerConfig config;
        config.roots = { libraryDir.getPath() / "a", libraryDir.getPath() / "b" };

        const ScanSummary summary{ scanner->classify(config) };
        EXPECT_EQ(summary.totalCandidates, 2);
        ASSERT_EQ(summary.devices.size(), 1);
        EXPECT_EQ(summary.devices.front().roots.size(), 2);
        EXPECT_EQ(summary.devices.front().candidateCount, 2);
        EXPECT_GE(summary.devices.front().workerCount, 1);

        // dry run
        EXPECT_EQ(fakeExtractor->getExtractCount(), 0);
        EXPECT_EQ(getLibraryFileCount(), 0);
        EXPECT_EQ(scanner->getStatus().currentState, IScannerService::State::Idle);
    }

    TEST_F(SlowScannerServiceTest, alreadyInProgress)
    {
        for (int i{ 1 }; i <= 20; ++i)
            libraryDir.createFile("Album/" + std::to_string(i) + " - Artist - Title.mp3");

        auto observer{ std::make_shared<RecordingObserver>() };
        scanner->requestImport(createConfig(), observer);
        EXPECT_EQ(scanner->getStatus().currentState, IScannerService::State::Scanning);
        EXPECT_THROW(scanner->requestImport(createConfig(), observer), ScanAlreadyInProgressException);

        scanner->waitForCompletion();
        EXPECT_EQ(scanner->getStatus().currentState, IScannerService::State::Succeeded);
        // only one run reported
        EXPECT_EQ(observer->getEventCount<ImportStarted>(), 1);
        EXPECT_EQ(observer->getEventCount<ImportFinished>(), 1);

        // accepted again once terminated
        EXPECT_NO_THROW(importAndWait(createConfig()));
    }

    TEST_F(SlowScannerServiceTest, stop)
    {
        constexpr std::size_t fileCount{ 300 };
        for (std::size_t i{ 1 }; i <= fileCount; ++i)
            libraryDir.createFile("Album/" + std::to_string(i) + " - Artist - Title " + std::to_string(i) + ".mp3", "data" + std::to_string(i));

        IScannerService* service{ scanner.get() };
        auto observer{ std::make_shared<RecordingObserver>([service](const ProgressEvent& event) {
            if (std::holds_alternative<FileImported>(event))
                service->requestStop();
        }) };

        scanner->requestImport(createConfig(), observer);
        scanner->waitForCompletion();

        // partial run, still terminated by a finish event
        checkEventOrdering(observer->getEvents());
        EXPECT_EQ(std::get<ImportStarted>(observer->getEvents().front()).totalFileCount, fileCount);

        const IScannerService::Status status{ scanner->getStatus() };
        EXPECT_EQ(status.currentState, IScannerService::State::Succeeded);
        ASSERT_TRUE(status.lastScanStats);
        EXPECT_GE(status.lastScanStats->successes, 1);
        EXPECT_LT(status.lastScanStats->successes, fileCount);

        // every completed file has been committed
        EXPECT_EQ(getLibraryFileCount(), status.lastScanStats->additions);
    }
} // namespace gamus::scanner::tests
