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

#include <Wt/WDateTime.h>

#include <memory>
#include <vector>

#include "ScanErrors.hpp"

namespace gamus::scanner
{
    struct ScanStats
    {
        Wt::WDateTime startTime;
        Wt::WDateTime stopTime;

        std::size_t totalFileCount{}; // candidates, known once the walk is drained

        std::size_t successes{}; // includes skips
        std::size_t errors{};    // per file errors
        std::size_t skips{};     // no change since last scan
        std::size_t additions{}; // added in DB
        std::size_t updates{};   // updated file in DB

        std::size_t walkErrors{};    // directories that could not be explored
        std::size_t droppedEvents{}; // success events dropped by a slow observer

        static constexpr std::size_t maxStoredErrorCount{ 5'000 };
        std::vector<std::shared_ptr<ScanError>> errorList; // walk and file errors, capped

        std::size_t getProcessedFileCount() const;
        std::size_t getChangesCount() const;
    };
} // namespace gamus::scanner
