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

#include "services/scanner/ProgressEvents.hpp"

namespace gamus::scanner
{
    namespace
    {
        struct EventNameVisitor
        {
            std::string_view operator()(const ImportStarted&) const { return "import:start"; }
            std::string_view operator()(const FileImported&) const { return "import:success"; }
            std::string_view operator()(const FileFailed&) const { return "import:error"; }
            std::string_view operator()(const ImportFinished&) const { return "import:finish"; }
            std::string_view operator()(const ImportFailed&) const { return "import:failed"; }
        };
    } // namespace

    std::string_view getEventName(const ProgressEvent& event)
    {
        return std::visit(EventNameVisitor{}, event);
    }
} // namespace gamus::scanner
