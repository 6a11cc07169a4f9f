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

#pragma once

#include <memory>

#include "core/Exception.hpp"

namespace gamus::core
{
    // Registers the process-wide instance of an interface (config, logger) for the
    // lifetime of this object. get() returns nullptr while nothing is registered,
    // which is how libraries run in unit tests.
    template<typename Class>
    class Service
    {
    public:
        explicit Service(std::unique_ptr<Class> service)
        {
            if (_service)
                throw GamusException{ "Service already registered" };

            _service = std::move(service);
        }

        ~Service()
        {
            _service.reset();
        }

        Service(const Service&) = delete;
        Service& operator=(const Service&) = delete;

        Class* operator->() const { return _service.get(); }

        static Class* get() { return _service.get(); }

    private:
        static inline std::unique_ptr<Class> _service;
    };
} // namespace gamus::core
