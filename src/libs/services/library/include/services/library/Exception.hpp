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

#include "core/Exception.hpp"

namespace gamus::library
{
    class Exception : public core::GamusException
    {
    public:
        using core::GamusException::GamusException;
    };

    class DuplicateArtistException : public Exception
    {
    public:
        DuplicateArtistException(std::string_view name)
            : Exception{ "Artist '" + std::string{ name } + "' already exists" } {}
    };

    // Empty name or title
    class InvalidArgumentException : public Exception
    {
    public:
        using Exception::Exception;
    };
} // namespace gamus::library
