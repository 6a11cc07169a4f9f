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

#include "ScanErrorLogger.hpp"

#include <cassert>

#include "core/ILogger.hpp"

namespace gamus::scanner
{
    void ScanErrorLogger::visit([[maybe_unused]] const ScanError& error)
    {
        // There should never be a ScanError without a specific type
        assert(false);
    }

    void ScanErrorLogger::visit(const IOScanError& error)
    {
        GAMUS_LOG(SCANNER, ERROR, "Failed to explore directory " << error.path << ": " << error.err.message());
    }

    void ScanErrorLogger::visit(const UnreadableFileError& error)
    {
        GAMUS_LOG(SCANNER, ERROR, "Failed to read file " << error.path << ": " << error.err.message());
    }

    void ScanErrorLogger::visit(const UnsupportedFormatError& error)
    {
        GAMUS_LOG(SCANNER, ERROR, "Failed to parse audio file " << error.path << ": unsupported format (" << error.details << ")");
    }

    void ScanErrorLogger::visit(const CorruptStreamError& error)
    {
        GAMUS_LOG(SCANNER, ERROR, "Failed to decode audio file " << error.path << ": " << error.details);
    }

    void ScanErrorLogger::visit(const PersistenceError& error)
    {
        GAMUS_LOG(SCANNER, ERROR, "Failed to save file " << error.path << " in catalog, rolled back: " << error.details);
    }
} // namespace gamus::scanner
