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

#include "JobQueue.hpp"

#include <algorithm>

#include "core/IJob.hpp"
#include "core/IJobScheduler.hpp"

namespace gamus::scanner
{
    JobQueue::JobQueue(core::IJobScheduler& scheduler, std::size_t maxQueueSize, ProcessFunction processJobsDoneFunc, std::size_t batchSize, float drainThreshold)
        : _scheduler{ scheduler }
        , _maxQueueSize{ std::max<std::size_t>(maxQueueSize, 1) }
        , _processJobsDoneFunc{ std::move(processJobsDoneFunc) }
        , _batchSize{ std::max<std::size_t>(batchSize, 1) }
        , _drainThreshold{ drainThreshold }
    {
    }

    JobQueue::~JobQueue()
    {
        // jobs reference objects owned by the caller
        _scheduler.wait();
    }

    void JobQueue::push(std::unique_ptr<core::IJob> job)
    {
        _scheduler.scheduleJob(std::move(job));

        processDoneJobs(static_cast<std::size_t>(_maxQueueSize * _drainThreshold));
        _scheduler.waitUntilJobCountAtMost(_maxQueueSize);
    }

    void JobQueue::finish()
    {
        if (_finished)
            return;
        _finished = true;

        _scheduler.wait();
        processDoneJobs(0);
    }

    void JobQueue::processDoneJobs(std::size_t maxRemainingJobsDone)
    {
        while (_scheduler.getJobsDoneCount() > maxRemainingJobsDone)
        {
            if (_scheduler.popJobsDone(_jobsDone, _batchSize) == 0)
                break;

            _processJobsDoneFunc(std::span{ _jobsDone });
            _jobsDone.clear();
        }
    }
} // namespace gamus::scanner
