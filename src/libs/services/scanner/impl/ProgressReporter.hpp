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

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

#include "services/scanner/ProgressEvents.hpp"

namespace gamus::scanner
{
    // Delivers events to the observer from a dedicated thread, in posting order
    // Success events are capped: the oldest queued one is dropped on overflow
    // Other events are never dropped
    class ProgressReporter
    {
    public:
        ProgressReporter(std::shared_ptr<IProgressObserver> observer, std::size_t maxQueuedSuccessEvents);
        ~ProgressReporter(); // delivers remaining events
        ProgressReporter(const ProgressReporter&) = delete;
        ProgressReporter& operator=(const ProgressReporter&) = delete;

        void post(ProgressEvent event);

        // Blocks until all the posted events are delivered
        void flush();

        std::size_t getDroppedEventCount() const;

    private:
        void run();
        bool dropOldestSuccessEvent();

        const std::shared_ptr<IProgressObserver> _observer;
        const std::size_t _maxQueuedSuccessEvents;

        mutable std::mutex _mutex;
        std::condition_variable _condVar;
        std::deque<ProgressEvent> _events;
        std::size_t _queuedSuccessEventCount{};
        std::size_t _droppedEventCount{};
        bool _delivering{};
        bool _stop{};

        std::thread _thread;
    };
} // namespace gamus::scanner
