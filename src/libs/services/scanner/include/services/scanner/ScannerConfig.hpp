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
#include <optional>
#include <string>
#include <vector>

namespace gamus::scanner
{
    struct ScannerConfig
    {
        std::vector<std::filesystem::path> roots;
        std::vector<std::string> audioExtensions{ "mp3", "flac", "ogg" }; // lower case, without dot
        bool ignoreHidden{ true };
        std::optional<unsigned> maxDepth; // unlimited if not set

        bool operator==(const ScannerConfig& other) const = default;
    };

    // Trims, removes the leading dot, lower-cases and de-duplicates (order kept)
    std::vector<std::string> normalizeAudioExtensions(const std::vector<std::string>& extensions);

    // Returns the default config if the file does not exist
    // Extensions are normalized, an empty root list is accepted (no-op scan)
    // Throws InvalidScannerConfigException on parse error
    ScannerConfig readScannerConfig(const std::filesystem::path& configPath);

    // Throws InvalidScannerConfigException if there is no root or if the file cannot be written
    void writeScannerConfig(const std::filesystem::path& configPath, const ScannerConfig& config);
} // namespace gamus::scanner
