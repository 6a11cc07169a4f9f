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

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "audio/IMetadataExtractor.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "services/scanner/ProgressEvents.hpp"

namespace gamus::scanner::tests
{
    // Removed with its whole content on destruction
    class TmpDirectory final
    {
    public:
        TmpDirectory();
        ~TmpDirectory();
        TmpDirectory(const TmpDirectory&) = delete;
        TmpDirectory& operator=(const TmpDirectory&) = delete;

        const std::filesystem::path& getPath() const { return _path; }

        // Parent directories are created as needed
        std::filesystem::path createFile(const std::filesystem::path& relativePath, std::string_view content = "data");
        std::filesystem::path createDirectory(const std::filesystem::path& relativePath);

    private:
        const std::filesystem::path _path;
    };

    class TmpDatabase final
    {
    public:
        TmpDatabase();
        ~TmpDatabase();
        TmpDatabase(const TmpDatabase&) = delete;
        TmpDatabase& operator=(const TmpDatabase&) = delete;

        db::IDb& getDb() { return *_db; }

    private:
        const std::filesystem::path _dbPath;
        std::unique_ptr<db::IDb> _db;
    };

    // Forwards to a real catalog until switched off, then fails like a catalog whose file went away
    class SwitchableDb final : public db::IDb
    {
    public:
        SwitchableDb(db::IDb& db);

        void setAvailable(bool available) { _available = available; }

    private:
        db::Session& getTLSSession() override;

        db::IDb& _db;
        std::atomic<bool> _available{ true };
    };

    // Builds metadata from the file itself, no decoding
    // Files named "corrupt*", "unsupported*" or "unreadable*" fail accordingly
    class FakeMetadataExtractor final : public audio::IMetadataExtractor
    {
    public:
        FakeMetadataExtractor(std::chrono::milliseconds extractDuration = {});

        audio::FileMetadata extractFromPath(const std::filesystem::path& path) const override;

        std::size_t getExtractCount() const { return _extractCount; }

    private:
        const std::chrono::milliseconds _extractDuration;
        mutable std::atomic<std::size_t> _extractCount{};
    };

    class RecordingObserver final : public IProgressObserver
    {
    public:
        using Callback = std::function<void(const ProgressEvent&)>;
        RecordingObserver(Callback callback = {});

        void onEvent(const ProgressEvent& event) override;

        std::vector<ProgressEvent> getEvents() const;

        template<typename EventType>
        std::size_t getEventCount() const
        {
            std::size_t count{};
            for (const ProgressEvent& event : getEvents())
            {
                if (std::holds_alternative<EventType>(event))
                    count++;
            }
            return count;
        }

    private:
        const Callback _callback;
        mutable std::mutex _mutex;
        std::vector<ProgressEvent> _events;
    };

    class ScannerFixture : public ::testing::Test
    {
    public:
        TmpDirectory libraryDir;
        TmpDatabase tmpDb;
        db::Session session{ tmpDb.getDb() };
    };
} // namespace gamus::scanner::tests
