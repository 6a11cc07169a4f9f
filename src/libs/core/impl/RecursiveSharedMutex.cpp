/*
 * Copyright (C) 2019 Emeric Poupon
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

#include "core/RecursiveSharedMutex.hpp"

#include <cassert>

namespace gamus::core
{
    void RecursiveSharedMutex::lock()
    {
        const auto thisThreadId{ std::this_thread::get_id() };

        if (_uniqueOwner == thisThreadId)
        {
            // already owned by this thread
            _uniqueCount++;
            return;
        }

        _mutex.lock();
        _uniqueOwner = thisThreadId;
        assert(_uniqueCount == 0);
        _uniqueCount = 1;
    }

    void RecursiveSharedMutex::unlock()
    {
        assert(_uniqueCount > 0);

        if (--_uniqueCount == 0)
        {
            _uniqueOwner = {};
            _mutex.unlock();
        }
    }

    void RecursiveSharedMutex::lock_shared()
    {
        const auto thisThreadId{ std::this_thread::get_id() };

        if (_uniqueOwner == thisThreadId)
        {
            std::scoped_lock lock{ _sharedCountMutex };
            _sharedCounts[thisThreadId]++;
            return;
        }

        bool needLock{};
        {
            std::scoped_lock lock{ _sharedCountMutex };

            auto& sharedCount{ _sharedCounts[thisThreadId] };
            if (sharedCount == 0)
                needLock = true;
            else
                ++sharedCount;
        }

        if (needLock)
        {
            _mutex.lock_shared();

            std::scoped_lock lock{ _sharedCountMutex };
            _sharedCounts[thisThreadId]++;
        }
    }

    void RecursiveSharedMutex::unlock_shared()
    {
        const auto thisThreadId{ std::this_thread::get_id() };

        bool needUnlock{};
        {
            std::scoped_lock lock{ _sharedCountMutex };

            auto itCount{ _sharedCounts.find(thisThreadId) };
            assert(itCount != std::end(_sharedCounts) && itCount->second > 0);
            const bool lastShared{ --itCount->second == 0 };
            if (lastShared)
                _sharedCounts.erase(itCount);

            // shared locks taken while owning the unique lock did not lock the underlying mutex
            needUnlock = lastShared && _uniqueOwner != thisThreadId;
        }

        if (needUnlock)
            _mutex.unlock_shared();
    }

    bool RecursiveSharedMutex::isUniqueLocked() const
    {
        return _uniqueOwner == std::this_thread::get_id();
    }

    bool RecursiveSharedMutex::isSharedLocked() const
    {
        const auto thisThreadId{ std::this_thread::get_id() };
        if (_uniqueOwner == thisThreadId)
            return true;

        std::scoped_lock lock{ _sharedCountMutex };
        const auto itCount{ _sharedCounts.find(thisThreadId) };
        return itCount != std::cend(_sharedCounts) && itCount->second > 0;
    }
} // namespace gamus::core
