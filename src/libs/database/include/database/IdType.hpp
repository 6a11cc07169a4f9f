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

#include <functional>
#include <ostream>
#include <string>

namespace gamus::db
{
    // Opaque identifier, stored as a lower-case UUID string
    class IdType
    {
    public:
        using ValueType = std::string;

        IdType() = default;
        IdType(ValueType id);

        bool isValid() const { return !_id.empty(); }
        const std::string& toString() const { return _id; }

        const ValueType& getValue() const { return _id; }
        auto operator<=>(const IdType& other) const = default;

    protected:
        static ValueType generateValue();

    private:
        ValueType _id;
    };

    std::ostream& operator<<(std::ostream& os, const IdType& id);
} // namespace gamus::db

#define GAMUS_DECLARE_IDTYPE(name)                                           \
    namespace gamus::db                                                      \
    {                                                                        \
        class name : public IdType                                           \
        {                                                                    \
        public:                                                              \
            using IdType::IdType;                                            \
            static name generate() { return name{ generateValue() }; }       \
            auto operator<=>(const name& other) const = default;             \
        };                                                                   \
    }                                                                        \
    namespace std                                                            \
    {                                                                        \
        template<>                                                           \
        class hash<gamus::db::name>                                          \
        {                                                                    \
        public:                                                              \
            size_t operator()(const gamus::db::name& id) const               \
            {                                                                \
                return std::hash<gamus::db::name::ValueType>()(id.getValue()); \
            }                                                                \
        };                                                                   \
    } // ns std
