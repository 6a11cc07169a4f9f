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

#pragma once

#include <filesystem>
#include <span>
#include <string>

#include <Wt/WDateTime.h>

namespace gamus::core::pathUtils
{
    // Make sure the given path is a directory
    // Create it if needed
    bool ensureDirectory(const std::filesystem::path& dir);

    // Get the last write time since Epoch
    Wt::WDateTime getLastWriteTime(const std::filesystem::path& file);

    // Check if file's extension is one of provided extensions
    // extensions are expected lower case, without the leading dot
    bool hasFileAnyExtension(const std::filesystem::path& file, std::span<const std::string> extensions);

    // Hidden means the file name starts with a dot ("." and ".." excluded)
    bool isHidden(const std::filesystem::path& path);
} // namespace gamus::core::pathUtils
