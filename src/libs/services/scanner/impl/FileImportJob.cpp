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

#include "FileImportJob.hpp"

#include <cstdint>

#include "audio/IMetadataExtractor.hpp"
#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "database/Exception.hpp"

#include "Persister.hpp"

namespace gamus::scanner
{
    FileImportJob::FileImportJob(const audio::IMetadataExtractor& extractor, Persister& persister, const std::filesystem::path& file)
        : _extractor{ extractor }
        , _persister{ persister }
        , _file{ file }
    {
    }

    void FileImportJob::run()
    {
        std::error_code ec;
        const std::uintmax_t fileSize{ std::filesystem::file_size(_file, ec) };
        if (ec)
        {
            _error = std::make_shared<UnreadableFileError>(_file, ec);
            return;
        }

        std::int64_t modifiedUnix{};
        try
        {
            modifiedUnix = core::pathUtils::getLastWriteTime(_file).toTime_t();
        }
        catch (const core::GamusException&)
        {
            _error = std::make_shared<UnreadableFileError>(_file, std::make_error_code(std::errc::io_error));
            return;
        }

        try
        {
            if (_persister.isUpToDate(_file, fileSize, modifiedUnix))
            {
                GAMUS_LOG(SCANNER, DEBUG, "Skipped " << _file << ": no change since last scan");
                _status = Status::Skipped;
                return;
            }
        }
        catch (const std::exception& e)
        {
            onPersistenceError(e);
            return;
        }

        importFile();
    }

    void FileImportJob::importFile()
    {
        audio::FileMetadata metadata;
        try
        {
            metadata = _extractor.extractFromPath(_file);
        }
        catch (const audio::UnreadableException& e)
        {
            _error = std::make_shared<UnreadableFileError>(_file, e.getErrorCode());
            return;
        }
        catch (const audio::UnsupportedFormatException& e)
        {
            _error = std::make_shared<UnsupportedFormatError>(_file, e.what());
            return;
        }
        catch (const audio::CorruptStreamException& e)
        {
            _error = std::make_shared<CorruptStreamError>(_file, e.what());
            return;
        }
        catch (const audio::Exception& e)
        {
            _error = std::make_shared<UnsupportedFormatError>(_file, e.what());
            return;
        }
        catch (const std::exception& e)
        {
            GAMUS_LOG(SCANNER, DEBUG, "Unexpected failure while reading " << _file << ": " << e.what());
            _error = std::make_shared<CorruptStreamError>(_file, e.what());
            return;
        }

        try
        {
            const Persister::Outcome outcome{ _persister.persist(metadata) };
            _status = outcome == Persister::Outcome::Added ? Status::Added : Status::Updated;
        }
        catch (const std::exception& e)
        {
            onPersistenceError(e);
        }
    }

    void FileImportJob::onPersistenceError(const std::exception& e)
    {
        if (db::isCatalogUnavailableError(e))
        {
            _status = Status::CatalogUnavailable;
            _fatalError = e.what();
            return;
        }

        _status = Status::Failed;
        _error = std::make_shared<PersistenceError>(_file, e.what());
    }
} // namespace gamus::scanner
