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

#include "ProgressReporter.hpp"

#include <algorithm>

#include "core/ILogger.hpp"

namespace gamus::scanner
{
    ProgressReporter::ProgressReporter(std::shared_ptr<IProgressObserver> observer, std::size_t maxQueuedSuccessEvents)
        : _observer{ std::move(observer) }
        , _maxQueuedSuccessEvents{ std::max<std::size_t>(maxQueuedSuccessEvents, 1) }
        , _thread{ [this] { run(); } }
    {
    }

    ProgressReporter::~ProgressReporter()
    {
        {
            std::scoped_lock lock{ _mutex };
            _stop = true;
        }
        _condVar.notify_all();
        _thread.join();

        GAMUS_LOG_IF(SCANNER, INFO, _droppedEventCount > 0, "Dropped " << _droppedEventCount << " progress event(s): observer too slow");
    }

    void ProgressReporter::post(ProgressEvent event)
    {
        {
            std::scoped_lock lock{ _mutex };

            if (std::holds_alternative<FileImported>(event))
            {
                if (_queuedSuccessEventCount >= _maxQueuedSuccessEvents && dropOldestSuccessEvent())
                    _droppedEventCount++;

                _queuedSuccessEventCount++;
            }

            _events.push_back(std::move(event));
        }
        _condVar.notify_all();
    }

    bool ProgressReporter::dropOldestSuccessEvent()
    {
        auto it{ std::find_if(std::begin(_events), std::end(_events), [](const ProgressEvent& event) { return std::holds_alternative<FileImported>(event); }) };
        if (it == std::end(_events))
            return false;

        _events.erase(it);
        _queuedSuccessEventCount--;
        return true;
    }

    void ProgressReporter::flush()
    {
        std::unique_lock lock{ _mutex };
        _condVar.wait(lock, [this] { return _events.empty() && !_delivering; });
    }

    std::size_t ProgressReporter::getDroppedEventCount() const
    {
        std::scoped_lock lock{ _mutex };
        return _droppedEventCount;
    }

    void ProgressReporter::run()
    {
        std::unique_lock lock{ _mutex };

        while (true)
        {
            _condVar.wait(lock, [this] { return _stop || !_events.empty(); });
            if (_events.empty())
                break; // stop requested and everything delivered

            ProgressEvent event{ std::move(_events.front()) };
            _events.pop_front();
            if (std::holds_alternative<FileImported>(event))
                _queuedSuccessEventCount--;

            _delivering = true;
            lock.unlock();

            if (_observer)
            {
                try
                {
                    _observer->onEvent(event);
                }
                catch (const std::exception& e)
                {
                    GAMUS_LOG(SCANNER, ERROR, "Progress observer failed on '" << getEventName(event) << "': " << e.what());
                }
            }

            lock.lock();
            _delivering = false;
            _condVar.notify_all();
        }
    }
} // namespace gamus::scanner
