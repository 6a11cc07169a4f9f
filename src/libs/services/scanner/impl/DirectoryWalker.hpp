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
#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_set>
#include <vector>

namespace gamus::scanner
{
    struct WalkOptions
    {
        std::vector<std::string> extensions; // lower case, without dot
        bool ignoreHidden{ true };
        std::optional<unsigned> maxDepth; // 0 means only the files directly in the root
    };

    // Explores a root directory, following directory symlinks
    // Each physical directory is explored at most once (canonical path)
    // Not restartable: create a new walker for each walk
    class DirectoryWalker
    {
    public:
        // return false to stop the walk
        using FileCallback = std::function<bool(const std::filesystem::path& file)>;
        using ErrorCallback = std::function<void(const std::filesystem::path& path, std::error_code ec)>;

        DirectoryWalker(const WalkOptions& options, ErrorCallback errorCallback);
        ~DirectoryWalker() = default;
        DirectoryWalker(const DirectoryWalker&) = delete;
        DirectoryWalker& operator=(const DirectoryWalker&) = delete;

        // return false if the walk has been stopped by the callback
        bool walk(const std::filesystem::path& root, const FileCallback& callback);

    private:
        bool exploreRecursive(const std::filesystem::path& directory, unsigned depth, const FileCallback& callback);
        bool markVisited(const std::filesystem::path& directory);
        bool isCandidate(const std::filesystem::path& file) const;

        const WalkOptions _options;
        ErrorCallback _errorCallback;
        std::unordered_set<std::string> _visitedDirectories;
        bool _done{};
    };
} // namespace gamus::scanner
