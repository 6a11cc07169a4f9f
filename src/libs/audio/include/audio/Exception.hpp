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

#include <string>
#include <string_view>
#include <system_error>

#include "core/Exception.hpp"

namespace gamus::audio
{
    class Exception : public core::GamusException
    {
    public:
        using core::GamusException::GamusException;
    };

    // File cannot be opened or read
    class UnreadableException : public Exception
    {
    public:
        UnreadableException(std::string_view message, std::error_code err)
            : Exception{ std::string{ message } + ": " + err.message() }
            , _err{ err }
        {
        }

        std::error_code getErrorCode() const { return _err; }

    private:
        std::error_code _err;
    };

    // Container or codec not recognized
    class UnsupportedFormatException : public Exception
    {
    public:
        using Exception::Exception;
    };

    // Headers parsed but the audio stream cannot be decoded
    class CorruptStreamException : public Exception
    {
    public:
        using Exception::Exception;
    };
} // namespace gamus::audio
