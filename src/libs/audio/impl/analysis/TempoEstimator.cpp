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

#include "TempoEstimator.hpp"

#include <cmath>

#include "audio/Exception.hpp"

namespace gamus::audio
{
    TempoEstimator::TempoEstimator(std::size_t sampleRate)
        : _tempo{ new_aubio_tempo(const_cast<char_t*>("default"), windowSize, hopSize, static_cast<uint_t>(sampleRate)), &del_aubio_tempo }
        , _input{ new_fvec(hopSize), &del_fvec }
        , _output{ new_fvec(2), &del_fvec }
    {
        if (!_tempo)
            throw Exception{ "aubio: failed to create tempo object" };
        if (!_input || !_output)
            throw Exception{ "aubio: failed to allocate tempo buffers" };
    }

    TempoEstimator::~TempoEstimator() = default;

    void TempoEstimator::process(std::span<const float> samples)
    {
        for (const float sample : samples)
        {
            _input->data[_inputFill] = sample;
            if (++_inputFill < hopSize)
                continue;

            _inputFill = 0;
            aubio_tempo_do(_tempo.get(), _input.get(), _output.get());
            if (fvec_get_sample(_output.get(), 0) != smpl_t(0))
                _beatCount++;
        }
    }

    std::optional<double> TempoEstimator::getBpm() const
    {
        if (_beatCount < minBeatCount)
            return std::nullopt;

        const double bpm{ aubio_tempo_get_bpm(_tempo.get()) };
        if (!(bpm > 0))
            return std::nullopt;

        return std::round(bpm * 100) / 100;
    }
} // namespace gamus::audio
