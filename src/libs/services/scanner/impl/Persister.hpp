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

#include <cstdint>
#include <filesystem>

namespace gamus::audio
{
    struct FileMetadata;
}

namespace gamus::db
{
    class IDb;
}

namespace gamus::scanner
{
    // Only writer of the catalog during a scan, may be used from any thread
    class Persister
    {
    public:
        enum class Outcome
        {
            Added,
            Updated,
        };

        Persister(db::IDb& db);
        ~Persister() = default;
        Persister(const Persister&) = delete;
        Persister& operator=(const Persister&) = delete;

        // True if the file is already in the catalog with the same size and modification time
        bool isUpToDate(const std::filesystem::path& path, std::uint64_t sizeBytes, std::int64_t modifiedUnix);

        // Writes the whole entity graph of the file in one transaction
        // Throws on error, nothing is written in that case
        Outcome persist(const audio::FileMetadata& metadata);

    private:
        db::IDb& _db;
    };
} // namespace gamus::scanner
