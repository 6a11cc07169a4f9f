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

#include "Db.hpp"

#include <chrono>
#include <string_view>
#include <vector>

#include <Wt/Dbo/Exception.h>
#include <Wt/Dbo/FixedSqlConnectionPool.h>
#include <Wt/Dbo/backend/Sqlite3.h>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "database/Exception.hpp"
#include "database/Session.hpp"

namespace gamus::db
{
    namespace
    {
        // Every pooled connection to the catalog file gets the same pragmas
        class CatalogConnection : public Wt::Dbo::backend::Sqlite3
        {
        public:
            CatalogConnection(const std::filesystem::path& catalogPath)
                : Wt::Dbo::backend::Sqlite3{ catalogPath.string() }
            {
                applyPragmas();
            }

            CatalogConnection(const CatalogConnection& other)
                : Wt::Dbo::backend::Sqlite3{ other }
            {
                applyPragmas();
            }

        private:
            CatalogConnection& operator=(const CatalogConnection&) = delete;

            std::unique_ptr<SqlConnection> clone() const override
            {
                return std::make_unique<CatalogConnection>(*this);
            }

            void applyPragmas()
            {
                // WAL lets readers browse the catalog while an import writes to it
                executeSql("PRAGMA journal_mode=WAL");
                executeSql("PRAGMA synchronous=normal");
                executeSql("PRAGMA foreign_keys=ON");
                executeSql("PRAGMA busy_timeout=10000");
            }
        };

        enum class IntegrityCheck
        {
            None,
            Quick,
            Full,
        };

        struct CatalogSettings
        {
            bool showQueries{};
            IntegrityCheck integrityCheck{ IntegrityCheck::Quick };
        };

        CatalogSettings readCatalogSettings()
        {
            CatalogSettings settings;

            const core::IConfig* config{ core::Service<core::IConfig>::get() };
            if (!config) // tests run without any config
                return settings;

            settings.showQueries = config->getBool("db-show-queries", false);

            const std::string check{ config->getString("db-integrity-check", "quick") };
            if (check == "none")
                settings.integrityCheck = IntegrityCheck::None;
            else if (check == "quick")
                settings.integrityCheck = IntegrityCheck::Quick;
            else if (check == "full")
                settings.integrityCheck = IntegrityCheck::Full;
            else
                throw Exception{ "Invalid 'db-integrity-check' value: '" + check + "'. Expected 'quick', 'full' or 'none'." };

            return settings;
        }

        // Returns the problems reported by sqlite, empty if the catalog file is sound
        std::vector<std::string> collectIntegrityProblems(Wt::Dbo::SqlConnection& connection, IntegrityCheck check)
        {
            std::vector<std::string> problems;

            {
                auto statement{ connection.prepareStatement(check == IntegrityCheck::Full ? "PRAGMA integrity_check" : "PRAGMA quick_check") };
                statement->execute();

                std::string result;
                result.reserve(256);
                while (statement->nextRow())
                {
                    result.clear();
                    statement->getResult(0, &result, static_cast<int>(result.capacity()));
                    if (result != "ok")
                        problems.push_back(result);
                }
            }

            if (check == IntegrityCheck::Full)
            {
                // rows are (table, rowid, referred table, fk index)
                auto statement{ connection.prepareStatement("PRAGMA foreign_key_check") };
                statement->execute();

                std::string table;
                table.reserve(64);
                while (statement->nextRow())
                {
                    table.clear();
                    long long rowId{};
                    statement->getResult(0, &table, static_cast<int>(table.capacity()));
                    statement->getResult(1, &rowId);
                    problems.push_back("dangling reference in table '" + table + "', rowid = " + std::to_string(rowId));
                }
            }

            return problems;
        }
    } // namespace

    std::unique_ptr<IDb> createDb(const std::filesystem::path& dbPath, std::size_t connectionCount)
    {
        return std::make_unique<Db>(dbPath, connectionCount);
    }

    Db::Db(const std::filesystem::path& dbPath, std::size_t connectionCount)
    {
        const CatalogSettings settings{ readCatalogSettings() };

        GAMUS_LOG(DB, INFO, "Opening catalog " << dbPath << " using " << connectionCount << " connection(s)");

        std::unique_ptr<CatalogConnection> connection;
        try
        {
            connection = std::make_unique<CatalogConnection>(dbPath);
        }
        catch (const Wt::Dbo::Exception& e)
        {
            GAMUS_LOG(DB, ERROR, "Cannot open catalog " << dbPath << ": " << e.what());
            throw CatalogUnavailableException{ "Cannot open catalog '" + dbPath.string() + "': " + e.what() };
        }
        connection->setProperty("show-queries", settings.showQueries ? "true" : "false");

        if (settings.integrityCheck != IntegrityCheck::None)
            checkIntegrity(*connection, settings.integrityCheck == IntegrityCheck::Full);

        auto connectionPool{ std::make_unique<Wt::Dbo::FixedSqlConnectionPool>(std::move(connection), connectionCount) };
        connectionPool->setTimeout(std::chrono::seconds{ 10 });
        _connectionPool = std::move(connectionPool);
    }

    void Db::checkIntegrity(Wt::Dbo::SqlConnection& connection, bool full)
    {
        GAMUS_LOG(DB, INFO, "Checking catalog integrity (" << (full ? "full" : "quick") << ")...");

        const std::vector<std::string> problems{ collectIntegrityProblems(connection, full ? IntegrityCheck::Full : IntegrityCheck::Quick) };
        for (const std::string& problem : problems)
            GAMUS_LOG(DB, ERROR, "Catalog integrity error: " << problem);

        if (!problems.empty())
            throw CatalogUnavailableException{ "Catalog integrity check failed! Please restore from a backup or recreate the catalog." };

        GAMUS_LOG(DB, INFO, "Catalog integrity check passed!");
    }

    Session& Db::getTLSSession()
    {
        std::scoped_lock lock{ _tlsSessionsMutex };

        std::unique_ptr<Session>& session{ _tlsSessions[std::this_thread::get_id()] };
        if (!session)
            session = std::make_unique<Session>(*this);

        return *session;
    }
} // namespace gamus::db
