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

#include "core/XxHash3.hpp"

#include <xxhash.h>

#include "core/Exception.hpp"

namespace gamus::core
{
    std::uint64_t xxHash3_64(std::span<const std::byte> buffer)
    {
        return XXH3_64bits(buffer.data(), buffer.size());
    }

    struct XxHash3Hasher::State
    {
        State()
            : state{ XXH3_createState() }
        {
            if (!state)
                throw GamusException{ "Cannot allocate xxHash3 state" };
        }

        ~State()
        {
            XXH3_freeState(state);
        }

        XXH3_state_t* state;
    };

    XxHash3Hasher::XxHash3Hasher()
        : _state{ std::make_unique<State>() }
    {
        if (XXH3_64bits_reset(_state->state) == XXH_ERROR)
            throw GamusException{ "Cannot reset xxHash3 state" };
    }

    XxHash3Hasher::~XxHash3Hasher() = default;

    void XxHash3Hasher::update(std::span<const std::byte> buffer)
    {
        if (XXH3_64bits_update(_state->state, buffer.data(), buffer.size()) == XXH_ERROR)
            throw GamusException{ "Cannot update xxHash3 state" };
    }

    std::uint64_t XxHash3Hasher::digest() const
    {
        return XXH3_64bits_digest(_state->state);
    }
} // namespace gamus::core
