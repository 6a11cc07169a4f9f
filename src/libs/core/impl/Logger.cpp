/*
 * Copyright (C) 2013 Emeric Poupon
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

#include "Logger.hpp"

#include <Wt/WDateTime.h>

#include <iostream>
#include <system_error>
#include <thread>

#include "core/Exception.hpp"
#include "core/String.hpp"

namespace gamus::core::logging
{
    namespace
    {
        constexpr Severity allSeverities[]{ Severity::FATAL, Severity::ERROR, Severity::WARNING, Severity::INFO, Severity::DEBUG };
    }

    const char* getModuleName(Module mod)
    {
        switch (mod)
        {
        case Module::AUDIO:
            return "AUDIO";
        case Module::CONFIG:
            return "CONFIG";
        case Module::DB:
            return "DB";
        case Module::MAIN:
            return "MAIN";
        case Module::METADATA:
            return "METADATA";
        case Module::SCANNER:
            return "SCANNER";
        case Module::SERVICE:
            return "SERVICE";
        case Module::UTILS:
            return "UTILS";
        }
        return "";
    }

    const char* getSeverityName(Severity sev)
    {
        switch (sev)
        {
        case Severity::FATAL:
            return "fatal";
        case Severity::ERROR:
            return "error";
        case Severity::WARNING:
            return "warning";
        case Severity::INFO:
            return "info";
        case Severity::DEBUG:
            return "debug";
        }
        return "";
    }

    std::optional<Severity> parseSeverity(std::string_view str)
    {
        for (Severity severity : allSeverities)
        {
            if (stringUtils::stringCaseInsensitiveEqual(str, getSeverityName(severity)))
                return severity;
        }

        return std::nullopt;
    }

    Log::Log(ILogger& logger, Module module, Severity severity)
        : _logger{ logger }
        , _module{ module }
        , _severity{ severity }
    {
    }

    Log::~Log()
    {
        _logger.processLog(*this);
    }

    std::string Log::getMessage() const
    {
        return _oss.str();
    }

    std::unique_ptr<ILogger> createLogger(Severity minSeverity, const std::filesystem::path& logFilePath)
    {
        return std::make_unique<Logger>(minSeverity, logFilePath);
    }

    Logger::Logger(Severity minSeverity, const std::filesystem::path& logFilePath)
        : _minSeverity{ minSeverity }
    {
        if (!logFilePath.empty())
        {
            _logFile.open(logFilePath, std::ios::out | std::ios::app);
            if (!_logFile.is_open())
            {
                const std::error_code ec{ errno, std::generic_category() };
                throw GamusException{ "Cannot open log file '" + logFilePath.string() + "' for writing: " + ec.message() };
            }
        }
    }

    bool Logger::isSeverityActive(Severity severity) const
    {
        // severities are declared from the most to the least severe
        return severity <= _minSeverity;
    }

    std::ostream& Logger::getStream(Severity severity)
    {
        if (_logFile.is_open())
            return _logFile;

        return severity <= Severity::WARNING ? std::cerr : std::cout;
    }

    void Logger::processLog(const Log& log)
    {
        if (!isSeverityActive(log.getSeverity()))
            return;

        const std::string timestamp{ stringUtils::toISO8601String(Wt::WDateTime::currentDateTime()) };
        const std::string message{ log.getMessage() };

        std::scoped_lock lock{ _mutex };
        getStream(log.getSeverity()) << timestamp << " " << std::this_thread::get_id() << " [" << getSeverityName(log.getSeverity()) << "] [" << getModuleName(log.getModule()) << "] " << message << std::endl;
    }
} // namespace gamus::core::logging
