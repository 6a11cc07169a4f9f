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

#include <filesystem>

#include "TagMap.hpp"

namespace gamus::audio::taglib
{
    // Reads the embedded tags, returns an empty map if TagLib cannot handle the file
    TagMap readTags(const std::filesystem::path& path, bool enableExtraDebugLogs);
} // namespace gamus::audio::taglib
