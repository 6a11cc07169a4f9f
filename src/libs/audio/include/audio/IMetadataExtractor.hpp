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

#include "audio/Exception.hpp"
#include "audio/FileMetadata.hpp"

namespace gamus::audio
{
    struct ExtractorOptions
    {
        bool enableAnalysis{ true }; // decode samples to compute fingerprint, bpm and quality
        bool enableExtraDebugLogs{};
    };

    class IMetadataExtractor
    {
    public:
        virtual ~IMetadataExtractor() = default;

        // Throws UnreadableException, UnsupportedFormatException or CorruptStreamException
        // Safe to be called concurrently
        virtual FileMetadata extractFromPath(const std::filesystem::path& path) const = 0;
    };

    std::unique_ptr<IMetadataExtractor> createMetadataExtractor(const ExtractorOptions& options = {});
} // namespace gamus::audio
