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

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "core/XxHash3.hpp"

namespace gamus::audio
{
    // Hash of the decoded samples quantized to 16 bits, independent from tags and container
    class Fingerprinter
    {
    public:
        void process(std::span<const float> samples);

        // 16 lower case hex digits
        std::string getFingerprint() const;

        static std::int16_t quantize(float sample);

    private:
        core::XxHash3Hasher _hasher;
        std::vector<std::byte> _buffer;
    };
} // namespace gamus::audio
