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

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "core/IJobScheduler.hpp"

namespace gamus::core
{
    class JobScheduler : public IJobScheduler
    {
    public:
        JobScheduler(LiteralString name, std::size_t threadCount);
        ~JobScheduler() override;
        JobScheduler(const JobScheduler&) = delete;
        JobScheduler& operator=(const JobScheduler&) = delete;

    private:
        void setShouldAbortCallback(ShouldAbortCallback callback) override;

        std::size_t getThreadCount() const override;
        void scheduleJob(std::unique_ptr<IJob> job) override;

        std::size_t getJobsDoneCount() const override;
        std::size_t popJobsDone(std::vector<std::unique_ptr<IJob>>& jobs, std::size_t maxCount) override;

        void waitUntilJobCountAtMost(std::size_t maxOngoingJobs) override;
        void wait() override;

        void runJob(std::unique_ptr<IJob> job);
        void onJobFinished(std::unique_ptr<IJob> job);

        LiteralString _name;
        boost::asio::io_context _ioContext;
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type> _work;
        std::vector<std::thread> _workers;

        ShouldAbortCallback _abortCallback;

        mutable std::mutex _mutex;
        std::size_t _ongoingJobCount{};
        std::deque<std::unique_ptr<IJob>> _doneJobs;
        std::condition_variable _condVar;
    };
} // namespace gamus::core
