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

#include "DirectoryWalker.hpp"

#include <stdexcept>

#include "core/ILogger.hpp"
#include "core/Path.hpp"

namespace gamus::scanner
{
    DirectoryWalker::DirectoryWalker(const WalkOptions& options, ErrorCallback errorCallback)
        : _options{ options }
        , _errorCallback{ std::move(errorCallback) }
    {
    }

    bool DirectoryWalker::walk(const std::filesystem::path& root, const FileCallback& callback)
    {
        if (_done)
            throw std::logic_error{ "Directory walker already used" };
        _done = true;

        return exploreRecursive(root, 0, callback);
    }

    bool DirectoryWalker::markVisited(const std::filesystem::path& directory)
    {
        std::error_code ec;
        const std::filesystem::path canonicalPath{ std::filesystem::canonical(directory, ec) };
        if (ec)
        {
            _errorCallback(directory, ec);
            return false;
        }

        return _visitedDirectories.insert(canonicalPath.string()).second;
    }

    bool DirectoryWalker::isCandidate(const std::filesystem::path& file) const
    {
        if (_options.ignoreHidden && core::pathUtils::isHidden(file))
            return false;

        return core::pathUtils::hasFileAnyExtension(file, _options.extensions);
    }

    bool DirectoryWalker::exploreRecursive(const std::filesystem::path& directory, unsigned depth, const FileCallback& callback)
    {
        if (!markVisited(directory))
        {
            GAMUS_LOG(SCANNER, DEBUG, "Skipping directory " << directory << ": already explored or unresolvable");
            return true;
        }

        std::error_code ec;
        std::filesystem::directory_iterator itPath{ directory, std::filesystem::directory_options::follow_directory_symlink, ec };
        if (ec)
        {
            _errorCallback(directory, ec);
            return true; // try to continue exploring anyway
        }

        std::filesystem::directory_iterator itEnd;
        while (itPath != itEnd)
        {
            bool continueExploring{ true };

            const std::filesystem::directory_entry& entry{ *itPath };
            const std::filesystem::path& path{ entry.path() };

            if (!_options.ignoreHidden || !core::pathUtils::isHidden(path))
            {
                std::error_code statusEc;
                if (entry.is_regular_file(statusEc))
                {
                    if (isCandidate(path))
                        continueExploring = callback(path);
                }
                else if (entry.is_directory(statusEc))
                {
                    if (!_options.maxDepth || depth < *_options.maxDepth)
                        continueExploring = exploreRecursive(path, depth + 1, callback);
                }
                else if (statusEc)
                {
                    _errorCallback(path, statusEc);
                }
            }

            if (!continueExploring)
                return false;

            itPath.increment(ec);
            if (ec)
            {
                _errorCallback(directory, ec);
                break;
            }
        }

        return true;
    }
} // namespace gamus::scanner
