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

#pragma once

#include <Wt/Dbo/Session.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "database/Transaction.hpp"

namespace gamus::db
{
    struct CatalogStats
    {
        std::size_t artistCount{};
        std::size_t songCount{};
        std::size_t releaseCount{};
        std::size_t releaseTrackCount{};
        std::size_t libraryFileCount{};
    };

    class IDb;
    class Session
    {
    public:
        Session(IDb& db);
        ~Session() = default;
        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        [[nodiscard]] WriteTransaction createWriteTransaction();
        [[nodiscard]] ReadTransaction createReadTransaction();

        void checkWriteTransaction() const;
        void checkReadTransaction() const;

        void execute(std::string_view statement);

        // Refreshes the sqlite planner stats, one table or index per write transaction
        void fullAnalyze();

        CatalogStats getCatalogStats(); // need to acquire a read transaction

        void prepareTablesIfNeeded(); // need to run only once at startup
        void createIndexesIfNeeded();

        // returning a ptr here to ease further wrapping using operator->
        Wt::Dbo::Session* getDboSession() { return &_session; }
        const Wt::Dbo::Session* getDboSession() const { return &_session; }

        IDb& getDb() { return _db; }

        template<typename Object, typename... Args>
        typename Object::pointer create(Args&&... args)
        {
            checkWriteTransaction();

            typename Object::pointer res{ Object::create(*this, std::forward<Args>(args)...) };
            getDboSession()->flush();

            return res;
        }

    private:
        std::vector<std::string> retrieveEntriesToAnalyze();
        void analyzeEntry(const std::string& entry);

        IDb& _db;
        Wt::Dbo::Session _session;
    };
} // namespace gamus::db
