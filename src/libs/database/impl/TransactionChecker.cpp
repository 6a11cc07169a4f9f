/*
 * Copyright (C) 2023 Emeric Poupon
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

#include "TransactionChecker.hpp"

#if GAMUS_CHECK_TRANSACTION_ACCESSES

    #include <algorithm>
    #include <cassert>
    #include <vector>

namespace gamus::db
{
    namespace
    {
        struct StackEntry
        {
            TransactionChecker::TransactionType type;
            const Wt::Dbo::Session* session{};
        };

        thread_local std::vector<StackEntry> transactionStack;
    } // namespace

    void TransactionChecker::pushWriteTransaction(const Wt::Dbo::Session& session)
    {
        pushTransaction(TransactionType::Write, session);
    }

    void TransactionChecker::pushReadTransaction(const Wt::Dbo::Session& session)
    {
        pushTransaction(TransactionType::Read, session);
    }

    void TransactionChecker::popWriteTransaction(const Wt::Dbo::Session& session)
    {
        popTransaction(TransactionType::Write, session);
    }

    void TransactionChecker::popReadTransaction(const Wt::Dbo::Session& session)
    {
        popTransaction(TransactionType::Read, session);
    }

    void TransactionChecker::pushTransaction(TransactionType type, const Wt::Dbo::Session& session)
    {
        assert(transactionStack.empty() || transactionStack.back().session == &session);
        transactionStack.push_back(StackEntry{ type, &session });
    }

    void TransactionChecker::popTransaction([[maybe_unused]] TransactionType type, [[maybe_unused]] const Wt::Dbo::Session& session)
    {
        assert(!transactionStack.empty());
        assert(transactionStack.back().type == type);
        assert(transactionStack.back().session == &session);
        transactionStack.pop_back();
    }

    void TransactionChecker::checkWriteTransaction([[maybe_unused]] const Wt::Dbo::Session& session)
    {
        // a read transaction nested in a write transaction is still a write access
        assert(std::any_of(std::cbegin(transactionStack), std::cend(transactionStack), [&](const StackEntry& entry) { return entry.type == TransactionType::Write && entry.session == &session; }));
    }

    void TransactionChecker::checkReadTransaction([[maybe_unused]] const Wt::Dbo::Session& session)
    {
        assert(!transactionStack.empty());
        assert(transactionStack.back().session == &session);
    }
} // namespace gamus::db

#endif
