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

#include "JobScheduler.hpp"

#include <exception>

#include <boost/asio/post.hpp>

#include "core/IJob.hpp"
#include "core/ILogger.hpp"

namespace gamus::core
{
    std::unique_ptr<IJobScheduler> createJobScheduler(LiteralString name, std::size_t threadCount)
    {
        return std::make_unique<JobScheduler>(name, threadCount);
    }

    JobScheduler::JobScheduler(LiteralString name, std::size_t threadCount)
        : _name{ name }
        , _work{ boost::asio::make_work_guard(_ioContext) }
    {
        GAMUS_LOG(UTILS, DEBUG, "[" << _name << "] starting " << threadCount << " worker(s)");

        for (std::size_t i{}; i < threadCount; ++i)
            _workers.emplace_back([this] { _ioContext.run(); });
    }

    JobScheduler::~JobScheduler()
    {
        // jobs reference this instance
        wait();

        _work.reset();
        _ioContext.stop();
        for (std::thread& worker : _workers)
            worker.join();

        GAMUS_LOG(UTILS, DEBUG, "[" << _name << "] workers stopped");
    }

    void JobScheduler::setShouldAbortCallback(ShouldAbortCallback callback)
    {
        std::scoped_lock lock{ _mutex };
        _abortCallback = std::move(callback);
    }

    std::size_t JobScheduler::getThreadCount() const
    {
        return _workers.size();
    }

    void JobScheduler::scheduleJob(std::unique_ptr<IJob> job)
    {
        {
            std::scoped_lock lock{ _mutex };
            _ongoingJobCount += 1;
        }

        boost::asio::post(_ioContext, [job = std::move(job), this]() mutable { runJob(std::move(job)); });
    }

    void JobScheduler::runJob(std::unique_ptr<IJob> job)
    {
        ShouldAbortCallback abortCallback;
        {
            std::scoped_lock lock{ _mutex };
            abortCallback = _abortCallback;
        }

        if (abortCallback && abortCallback())
        {
            GAMUS_LOG(UTILS, DEBUG, "[" << _name << "] discarding job '" << job->getName() << "'");
            onJobFinished({});
            return;
        }

        // a throwing job is still reported as done, it must not stall wait()
        try
        {
            job->run();
        }
        catch (const std::exception& e)
        {
            GAMUS_LOG(UTILS, ERROR, "[" << _name << "] job '" << job->getName() << "' failed: " << e.what());
        }

        onJobFinished(std::move(job));
    }

    void JobScheduler::onJobFinished(std::unique_ptr<IJob> job)
    {
        {
            std::scoped_lock lock{ _mutex };

            if (job)
                _doneJobs.emplace_back(std::move(job));
            _ongoingJobCount -= 1;
        }

        _condVar.notify_all();
    }

    std::size_t JobScheduler::getJobsDoneCount() const
    {
        std::scoped_lock lock{ _mutex };
        return _doneJobs.size();
    }

    std::size_t JobScheduler::popJobsDone(std::vector<std::unique_ptr<IJob>>& doneJobs, std::size_t maxCount)
    {
        doneJobs.clear();
        doneJobs.reserve(maxCount);

        {
            std::scoped_lock lock{ _mutex };

            while (doneJobs.size() < maxCount && !_doneJobs.empty())
            {
                doneJobs.push_back(std::move(_doneJobs.front()));
                _doneJobs.pop_front();
            }
        }

        return doneJobs.size();
    }

    void JobScheduler::waitUntilJobCountAtMost(std::size_t maxOngoingJobs)
    {
        std::unique_lock lock{ _mutex };
        _condVar.wait(lock, [=, this] { return _ongoingJobCount <= maxOngoingJobs; });
    }

    void JobScheduler::wait()
    {
        waitUntilJobCountAtMost(0);
    }
} // namespace gamus::core
