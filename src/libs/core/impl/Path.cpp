/*
 * Copyright (C) 2013 Emeric Poupon
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

#include "core/Path.hpp"

#include <algorithm>
#include <sys/stat.h>
#include <sys/types.h>

#include "core/Exception.hpp"
#include "core/String.hpp"

namespace gamus::core::pathUtils
{
    bool ensureDirectory(const std::filesystem::path& dir)
    {
        if (std::filesystem::exists(dir))
            return std::filesystem::is_directory(dir);
        else
            return std::filesystem::create_directories(dir);
    }

    Wt::WDateTime getLastWriteTime(const std::filesystem::path& file)
    {
        struct stat sb{};

        if (::stat(file.c_str(), &sb) == -1)
            throw GamusException{ "Failed to get stats on file '" + file.string() + "'" };

        return Wt::WDateTime::fromTime_t(sb.st_mtime);
    }

    bool hasFileAnyExtension(const std::filesystem::path& file, std::span<const std::string> supportedExtensions)
    {
        std::string extension{ stringUtils::stringToLower(file.extension().string()) };
        if (extension.empty())
            return false;

        extension.erase(0, 1); // leading dot
        return std::find(std::cbegin(supportedExtensions), std::cend(supportedExtensions), extension) != std::cend(supportedExtensions);
    }

    bool isHidden(const std::filesystem::path& path)
    {
        const std::string fileName{ path.filename().string() };
        if (fileName == "." || fileName == "..")
            return false;

        return !fileName.empty() && fileName.front() == '.';
    }
} // namespace gamus::core::pathUtils
