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

#include "audio/IMetadataExtractor.hpp"

namespace gamus::audio
{
    class MetadataExtractor : public IMetadataExtractor
    {
    public:
        MetadataExtractor(const ExtractorOptions& options);
        ~MetadataExtractor() override = default;
        MetadataExtractor(const MetadataExtractor&) = delete;
        MetadataExtractor& operator=(const MetadataExtractor&) = delete;

    private:
        FileMetadata extractFromPath(const std::filesystem::path& path) const override;

        const ExtractorOptions _options;
    };
} // namespace gamus::audio
