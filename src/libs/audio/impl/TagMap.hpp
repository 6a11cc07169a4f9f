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

#include <string>
#include <unordered_map>

#include "audio/FileMetadata.hpp"

namespace gamus::audio
{
    // lower case keys, first value of each tag
    using TagMap = std::unordered_map<std::string, std::string>;

    // Inserts the entries of src whose key is not yet present in dst
    void mergeTagMaps(TagMap& dst, const TagMap& src);

    Tags resolveTags(const TagMap& tagMap);

    // Accepts "N" and "N/M", N > 0
    std::optional<int> parsePosition(std::string_view str);
} // namespace gamus::audio
