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

#include <functional>
#include <memory>
#include <span>
#include <vector>

namespace gamus::core
{
    class IJob;
    class IJobScheduler;
} // namespace gamus::core

namespace gamus::scanner
{
    // Bounded feed of a job scheduler, done jobs are handed back in the pushing thread
    class JobQueue
    {
    public:
        using ProcessFunction = std::function<void(std::span<std::unique_ptr<core::IJob>>)>;

        // maxQueueSize: max number of scheduled jobs not yet processed, push blocks above
        // processBatchSize: how many done jobs to hand back at once to processJobsDoneFunc
        // drainThreshold: fraction of maxQueueSize at which done jobs are processed
        JobQueue(core::IJobScheduler& scheduler, std::size_t maxQueueSize, ProcessFunction processJobsDoneFunc, std::size_t processBatchSize, float drainThreshold);
        ~JobQueue();
        JobQueue(const JobQueue&) = delete;
        JobQueue& operator=(const JobQueue&) = delete;

        // may wait and invoke processJobsDoneFunc
        void push(std::unique_ptr<core::IJob> job);

        // waits for all the jobs, including the discarded ones, and processes the remaining done jobs
        void finish();

    private:
        void processDoneJobs(std::size_t maxRemainingJobsDone);

        core::IJobScheduler& _scheduler;
        const std::size_t _maxQueueSize;
        ProcessFunction _processJobsDoneFunc;
        const std::size_t _batchSize;
        const float _drainThreshold;
        std::vector<std::unique_ptr<core::IJob>> _jobsDone;
        bool _finished{};
    };
} // namespace gamus::scanner
