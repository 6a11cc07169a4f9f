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

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace gamus::scanner
{
    struct ImportStarted
    {
        std::size_t totalFileCount{};
    };

    struct FileImported
    {
        std::string path;
    };

    struct FileFailed
    {
        std::string path;
        std::string error;
    };

    // Terminal event of a run that was not aborted by a fatal error
    struct ImportFinished
    {
    };

    // Terminal event of a run that was aborted by a fatal error, no ImportFinished is emitted
    struct ImportFailed
    {
        std::string error;
    };

    using ProgressEvent = std::variant<ImportStarted, FileImported, FileFailed, ImportFinished, ImportFailed>;

    // "import:start", "import:success", "import:error", "import:finish" or "import:failed"
    std::string_view getEventName(const ProgressEvent& event);

    // Called from a single dedicated thread, must not block for long
    class IProgressObserver
    {
    public:
        virtual ~IProgressObserver() = default;

        virtual void onEvent(const ProgressEvent& event) = 0;
    };
} // namespace gamus::scanner
