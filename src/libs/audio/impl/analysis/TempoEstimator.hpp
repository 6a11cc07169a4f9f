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

#include <cstddef>
#include <memory>
#include <optional>
#include <span>

#include <aubio/aubio.h>

namespace gamus::audio
{
    // Beat tracking on mono samples
    class TempoEstimator
    {
    public:
        static constexpr std::size_t windowSize{ 1024 };
        static constexpr std::size_t hopSize{ 512 };
        static constexpr std::size_t minBeatCount{ 4 };

        TempoEstimator(std::size_t sampleRate);
        ~TempoEstimator();
        TempoEstimator(const TempoEstimator&) = delete;
        TempoEstimator& operator=(const TempoEstimator&) = delete;

        void process(std::span<const float> samples);

        // Rounded to 0.01, absent if not enough beats were detected
        std::optional<double> getBpm() const;
        std::size_t getBeatCount() const { return _beatCount; }

    private:
        using TempoPtr = std::unique_ptr<aubio_tempo_t, decltype(&del_aubio_tempo)>;
        using FvecPtr = std::unique_ptr<fvec_t, decltype(&del_fvec)>;

        TempoPtr _tempo;
        FvecPtr _input;
        FvecPtr _output;
        std::size_t _inputFill{};
        std::size_t _beatCount{};
    };
} // namespace gamus::audio
