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

#include "Fingerprinter.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace gamus::audio
{
    std::int16_t Fingerprinter::quantize(float sample)
    {
        if (std::isnan(sample))
            return 0;

        return static_cast<std::int16_t>(std::lround(std::clamp(sample, -1.f, 1.f) * 32767.f));
    }

    void Fingerprinter::process(std::span<const float> samples)
    {
        // little endian, whatever the host
        _buffer.resize(samples.size() * 2);
        for (std::size_t i{}; i < samples.size(); ++i)
        {
            const auto value{ static_cast<std::uint16_t>(quantize(samples[i])) };
            _buffer[2 * i] = static_cast<std::byte>(value & 0xFF);
            _buffer[2 * i + 1] = static_cast<std::byte>(value >> 8);
        }

        _hasher.update(_buffer);
    }

    std::string Fingerprinter::getFingerprint() const
    {
        std::ostringstream oss;
        oss << std::hex << std::setw(16) << std::setfill('0') << _hasher.digest();
        return oss.str();
    }
} // namespace gamus::audio
