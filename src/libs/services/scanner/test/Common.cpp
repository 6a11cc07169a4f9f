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

#include "Common.hpp"

#include <fstream>
#include <thread>

#include "audio/Exception.hpp"
#include "core/Path.hpp"
#include "core/UUID.hpp"
#include "database/Exception.hpp"

namespace gamus::scanner::tests
{
    namespace
    {
        std::filesystem::path generateTmpPath(std::string_view suffix)
        {
            return std::filesystem::temp_directory_path() / ("gamus-scanner-test-" + std::string{ core::UUID::generate().getAsString() } + std::string{ suffix });
        }
    } // namespace

    TmpDirectory::TmpDirectory()
        : _path{ generateTmpPath("") }
    {
        std::filesystem::create_directories(_path);
    }

    TmpDirectory::~TmpDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);
    }

    std::filesystem::path TmpDirectory::createFile(const std::filesystem::path& relativePath, std::string_view content)
    {
        const std::filesystem::path path{ _path / relativePath };
        std::filesystem::create_directories(path.parent_path());

        std::ofstream ofs{ path, std::ios::binary };
        ofs << content;

        return path;
    }

    std::filesystem::path TmpDirectory::createDirectory(const std::filesystem::path& relativePath)
    {
        const std::filesystem::path path{ _path / relativePath };
        std::filesystem::create_directories(path);

        return path;
    }

    TmpDatabase::TmpDatabase()
        : _dbPath{ generateTmpPath(".db") }
        , _db{ db::createDb(_dbPath) }
    {
        db::Session session{ *_db };
        session.prepareTablesIfNeeded();
        session.createIndexesIfNeeded();
    }

    TmpDatabase::~TmpDatabase()
    {
        _db.reset();

        std::error_code ec;
        std::filesystem::remove(_dbPath, ec);
        std::filesystem::remove(_dbPath.string() + "-wal", ec);
        std::filesystem::remove(_dbPath.string() + "-shm", ec);
    }

    SwitchableDb::SwitchableDb(db::IDb& db)
        : _db{ db }
    {
    }

    db::Session& SwitchableDb::getTLSSession()
    {
        if (!_available)
            throw db::CatalogUnavailableException{ "Cannot open catalog: unable to open database file" };

        return _db.getTLSSession();
    }

    FakeMetadataExtractor::FakeMetadataExtractor(std::chrono::milliseconds extractDuration)
        : _extractDuration{ extractDuration }
    {
    }

    audio::FileMetadata FakeMetadataExtractor::extractFromPath(const std::filesystem::path& path) const
    {
        _extractCount++;

        if (_extractDuration.count() > 0)
            std::this_thread::sleep_for(_extractDuration);

        const std::string stem{ path.stem().string() };
        if (stem.starts_with("corrupt"))
            throw audio::CorruptStreamException{ "cannot decode frame" };
        if (stem.starts_with("unsupported"))
            throw audio::UnsupportedFormatException{ "unknown container" };
        if (stem.starts_with("unreadable"))
            throw audio::UnreadableException{ "cannot open file", std::make_error_code(std::errc::permission_denied) };

        audio::FileMetadata metadata;
        metadata.path = path;
        metadata.sizeBytes = std::filesystem::file_size(path);
        metadata.modifiedUnix = core::pathUtils::getLastWriteTime(path).toTime_t();
        metadata.duration = std::chrono::milliseconds{ 180'000 };
        metadata.bitrateKbps = 320;
        metadata.sampleRateHz = 44'100;
        metadata.channelCount = 2;
        metadata.fingerprint = "0123456789abcdef";
        metadata.bpm = 120;
        metadata.qualityScore = 0.9;
        metadata.qualityAssessment = "Excellent";

        return metadata;
    }

    RecordingObserver::RecordingObserver(Callback callback)
        : _callback{ std::move(callback) }
    {
    }

    void RecordingObserver::onEvent(const ProgressEvent& event)
    {
        {
            const std::scoped_lock lock{ _mutex };
            _events.push_back(event);
        }

        if (_callback)
            _callback(event);
    }

    std::vector<ProgressEvent> RecordingObserver::getEvents() const
    {
        const std::scoped_lock lock{ _mutex };
        return _events;
    }
} // namespace gamus::scanner::tests
