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

#include "database/IdType.hpp"

#include "core/UUID.hpp"

namespace gamus::db
{
    IdType::IdType(ValueType id)
        : _id{ std::move(id) }
    {
    }

    IdType::ValueType IdType::generateValue()
    {
        return std::string{ core::UUID::generate().getAsString() };
    }

    std::ostream& operator<<(std::ostream& os, const IdType& id)
    {
        os << id.getValue();
        return os;
    }
} // namespace gamus::db
