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

#include <filesystem>
#include <memory>
#include <string>

#include "core/IJob.hpp"
#include "services/scanner/ScanErrors.hpp"

namespace gamus::audio
{
    class IMetadataExtractor;
}

namespace gamus::scanner
{
    class Persister;

    // Extracts and persists one file
    class FileImportJob : public core::IJob
    {
    public:
        enum class Status
        {
            Added,
            Updated,
            Skipped, // unchanged since last scan
            Failed,
            CatalogUnavailable, // fatal for the whole scan
        };

        FileImportJob(const audio::IMetadataExtractor& extractor, Persister& persister, const std::filesystem::path& file);

        const std::filesystem::path& getPath() const { return _file; }
        Status getStatus() const { return _status; }
        const std::shared_ptr<ScanError>& getError() const { return _error; } // set if Failed
        const std::string& getFatalError() const { return _fatalError; }      // set if CatalogUnavailable

    private:
        core::LiteralString getName() const override { return "Import File"; }
        void run() override;

        void importFile();
        void onPersistenceError(const std::exception& e);

        const audio::IMetadataExtractor& _extractor;
        Persister& _persister;
        const std::filesystem::path _file;

        Status _status{ Status::Failed };
        std::shared_ptr<ScanError> _error;
        std::string _fatalError;
    };
} // namespace gamus::scanner
