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

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace gamus::core
{
    std::uint64_t xxHash3_64(std::span<const std::byte> buffer);

    // Incremental version, same result as hashing the concatenated buffers at once
    class XxHash3Hasher
    {
    public:
        XxHash3Hasher();
        ~XxHash3Hasher();
        XxHash3Hasher(const XxHash3Hasher&) = delete;
        XxHash3Hasher& operator=(const XxHash3Hasher&) = delete;

        void update(std::span<const std::byte> buffer);
        std::uint64_t digest() const;

    private:
        struct State;
        std::unique_ptr<State> _state;
    };
} // namespace gamus::core
