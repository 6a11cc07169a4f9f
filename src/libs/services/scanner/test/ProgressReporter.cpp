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

#include <future>
#include <stdexcept>

#include <gtest/gtest.h>

#include "Common.hpp"
#include "ProgressReporter.hpp"

namespace gamus::scanner::tests
{
    namespace
    {
        std::vector<std::string> getImportedPaths(const std::vector<ProgressEvent>& events)
        {
            std::vector<std::string> res;
            for (const ProgressEvent& event : events)
            {
                if (const FileImported * imported{ std::get_if<FileImported>(&event) })
                    res.push_back(imported->path);
            }
            return res;
        }
    } // namespace

    TEST(ProgressReporter, eventNames)
    {
        EXPECT_EQ(getEventName(ImportStarted{ 2 }), "import:start");
        EXPECT_EQ(getEventName(FileImported{ "a.mp3" }), "import:success");
        EXPECT_EQ(getEventName(FileFailed{ "a.mp3", "error" }), "import:error");
        EXPECT_EQ(getEventName(ImportFinished{}), "import:finish");
        EXPECT_EQ(getEventName(ImportFailed{ "error" }), "import:failed");
    }

    TEST(ProgressReporter, order)
    {
        auto observer{ std::make_shared<RecordingObserver>() };
        {
            ProgressReporter reporter{ observer, 100 };
            reporter.post(ImportStarted{ 3 });
            reporter.post(FileImported{ "a.mp3" });
            reporter.post(FileFailed{ "b.mp3", "corrupt" });
            reporter.post(FileImported{ "c.mp3" });
            reporter.post(ImportFinished{});
            reporter.flush();

            EXPECT_EQ(reporter.getDroppedEventCount(), 0);
        }

        const std::vector<ProgressEvent> events{ observer->getEvents() };
        ASSERT_EQ(events.size(), 5);
        ASSERT_TRUE(std::holds_alternative<ImportStarted>(events[0]));
        EXPECT_EQ(std::get<ImportStarted>(events[0]).totalFileCount, 3);
        EXPECT_EQ(std::get<FileImported>(events[1]).path, "a.mp3");
        EXPECT_EQ(std::get<FileFailed>(events[2]).path, "b.mp3");
        EXPECT_EQ(std::get<FileImported>(events[3]).path, "c.mp3");
        EXPECT_TRUE(std::holds_alternative<ImportFinished>(events[4]));
    }

    TEST(ProgressReporter, destructorDeliversRemainingEvents)
    {
        auto observer{ std::make_shared<RecordingObserver>() };
        {
            ProgressReporter reporter{ observer, 100 };
            for (int i{}; i < 50; ++i)
                reporter.post(FileImported{ std::to_string(i) });
        }

        EXPECT_EQ(observer->getEventCount<FileImported>(), 50);
    }

    TEST(ProgressReporter, noObserver)
    {
        ProgressReporter reporter{ nullptr, 10 };
        reporter.post(ImportStarted{ 1 });
        reporter.post(ImportFinished{});
        reporter.flush();
    }

    TEST(ProgressReporter, throwingObserver)
    {
        std::size_t callCount{};
        auto observer{ std::make_shared<RecordingObserver>([&](const ProgressEvent&) {
            callCount++;
            throw std::runtime_error{ "observer failure" };
        }) };

        ProgressReporter reporter{ observer, 10 };
        reporter.post(ImportStarted{ 1 });
        reporter.post(FileImported{ "a.mp3" });
        reporter.post(ImportFinished{});
        reporter.flush();

        EXPECT_EQ(callCount, 3);
    }

    TEST(ProgressReporter, slowObserverDropsOldestSuccessEvents)
    {
        std::promise<void> blocked;
        std::promise<void> release;
        std::shared_future<void> released{ release.get_future().share() };
        bool firstEvent{ true };

        auto observer{ std::make_shared<RecordingObserver>([&](const ProgressEvent&) {
            if (firstEvent)
            {
                firstEvent = false;
                blocked.set_value();
                released.wait();
            }
        }) };

        ProgressReporter reporter{ observer, 3 };
        reporter.post(ImportStarted{ 10 });
        blocked.get_future().wait();

        for (int i{}; i < 10; ++i)
        {
            reporter.post(FileImported{ std::to_string(i) });
            if (i == 5)
                reporter.post(FileFailed{ "failed", "error" });
        }
        reporter.post(ImportFinished{});

        release.set_value();
        reporter.flush();

        EXPECT_EQ(reporter.getDroppedEventCount(), 7);

        const std::vector<ProgressEvent> events{ observer->getEvents() };
        EXPECT_EQ(getImportedPaths(events), (std::vector<std::string>{ "7", "8", "9" }));
        // other events are never dropped
        EXPECT_TRUE(std::holds_alternative<ImportStarted>(events.front()));
        EXPECT_EQ(observer->getEventCount<FileFailed>(), 1);
        EXPECT_TRUE(std::holds_alternative<ImportFinished>(events.back()));
    }
} // namespace gamus::scanner::tests
