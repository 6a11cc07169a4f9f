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

#include "SpectralAnalyzer.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "audio/Exception.hpp"

namespace gamus::audio
{
    const char* toString(QualityLevel level)
    {
        switch (level)
        {
        case QualityLevel::Perfect:
            return "Perfect";
        case QualityLevel::High:
            return "High";
        case QualityLevel::Medium:
            return "Medium";
        case QualityLevel::Low:
            return "Low";
        case QualityLevel::Inconclusive:
            return "Inconclusive";
        }

        return "";
    }

    std::string QualityResult::getAssessment() const
    {
        std::ostringstream oss;
        oss << toString(level);

        if (level == QualityLevel::Inconclusive)
            oss << " (signal too low)";
        else if (cutoffFrequency)
            oss << " (cutoff " << std::fixed << std::setprecision(1) << (*cutoffFrequency / 1000) << " kHz)";
        else
            oss << " (full range)";

        return oss.str();
    }

    SpectralAnalyzer::SpectralAnalyzer(std::size_t sampleRate, std::size_t startSample, std::size_t maxSampleCount, const Parameters& parameters)
        : _parameters{ parameters }
        , _sampleRate{ sampleRate }
        , _startSample{ startSample }
        , _maxSampleCount{ maxSampleCount }
        , _fft{ new_aubio_fft(static_cast<uint_t>(parameters.fftWindowSize)), &del_aubio_fft }
        , _window{ new_aubio_window(const_cast<char_t*>("hanning"), static_cast<uint_t>(parameters.fftWindowSize)), &del_fvec }
        , _input{ new_fvec(static_cast<uint_t>(parameters.fftWindowSize)), &del_fvec }
        , _spectrum{ new_cvec(static_cast<uint_t>(parameters.fftWindowSize)), &del_cvec }
        , _magnitudeSum(parameters.fftWindowSize / 2, 0.)
    {
        if (!_fft || !_window || !_input || !_spectrum)
            throw Exception{ "aubio: failed to allocate fft buffers" };
    }

    SpectralAnalyzer::~SpectralAnalyzer() = default;

    void SpectralAnalyzer::process(std::span<const float> samples)
    {
        const std::size_t endSample{ _startSample + _maxSampleCount };

        for (const float sample : samples)
        {
            const std::size_t index{ _sampleIndex++ };
            if (index < _startSample)
                continue;
            if (index >= endSample)
                return;

            _input->data[_inputFill] = sample * _window->data[_inputFill];
            if (++_inputFill == _parameters.fftWindowSize)
            {
                processWindow();
                _inputFill = 0;
            }
        }
    }

    void SpectralAnalyzer::processWindow()
    {
        aubio_fft_do(_fft.get(), _input.get(), _spectrum.get());

        for (std::size_t i{}; i < _magnitudeSum.size(); ++i)
            _magnitudeSum[i] += _spectrum->norm[i];

        _windowCount++;
    }

    QualityResult SpectralAnalyzer::finish() const
    {
        if (_windowCount == 0)
            return QualityResult{};

        std::vector<float> spectrumDb(_magnitudeSum.size());
        std::transform(std::cbegin(_magnitudeSum), std::cend(_magnitudeSum), std::begin(spectrumDb), [this](double sum) {
            const double average{ sum / static_cast<double>(_windowCount) };
            return static_cast<float>(20 * std::log10(std::max(average, 1e-10)));
        });

        return evaluate(spectrumDb, _sampleRate, _parameters);
    }

    QualityResult SpectralAnalyzer::evaluate(std::span<const float> spectrumDb, std::size_t sampleRate, const Parameters& parameters)
    {
        QualityResult result;
        if (spectrumDb.empty() || sampleRate == 0)
            return result;

        const float nyquist{ static_cast<float>(sampleRate) / 2 };
        const float binWidth{ nyquist / static_cast<float>(spectrumDb.size()) };

        auto getBandLevel = [&](float start, float end) -> std::optional<float> {
            const std::size_t startBin{ static_cast<std::size_t>(start / binWidth) };
            const std::size_t endBin{ std::min(static_cast<std::size_t>(end / binWidth), spectrumDb.size()) };
            if (startBin >= endBin)
                return std::nullopt;

            float sum{};
            for (std::size_t i{ startBin }; i < endBin; ++i)
                sum += spectrumDb[i];

            return sum / static_cast<float>(endBin - startBin);
        };

        const std::optional<float> referenceDb{ getBandLevel(parameters.referenceBandStart, parameters.referenceBandEnd) };
        if (!referenceDb || *referenceDb <= parameters.silenceThresholdDb)
            return result;

        result.bandLevels.push_back(*referenceDb);
        for (std::size_t i{}; i < parameters.checkBandCount; ++i)
        {
            const float start{ parameters.checkBandStart + static_cast<float>(i) * parameters.checkBandWidth };
            if (start >= nyquist)
                break;

            const std::optional<float> bandDb{ getBandLevel(start, start + parameters.checkBandWidth) };
            if (!bandDb)
                continue;

            result.bandLevels.push_back(*bandDb);
            if (*referenceDb - *bandDb > parameters.significantDropDb)
            {
                result.cutoffFrequency = start;
                break;
            }
        }

        result.score = computeScore(result.cutoffFrequency);
        result.level = computeLevel(result.score);

        return result;
    }

    double SpectralAnalyzer::computeScore(std::optional<float> cutoffFrequency)
    {
        if (!cutoffFrequency)
            return 10;

        const float frequency{ *cutoffFrequency };
        if (frequency >= 21'500)
            return 9.8;
        if (frequency >= 20'000)
            return 9;
        if (frequency >= 19'000)
            return 8;
        if (frequency >= 17'000)
            return 7;
        if (frequency >= 16'000)
            return 6;
        if (frequency >= 15'000)
            return 5;

        return 3;
    }

    QualityLevel SpectralAnalyzer::computeLevel(double score)
    {
        if (score <= 0)
            return QualityLevel::Inconclusive;
        if (score >= 9.5)
            return QualityLevel::Perfect;
        if (score >= 8)
            return QualityLevel::High;
        if (score >= 6)
            return QualityLevel::Medium;

        return QualityLevel::Low;
    }
} // namespace gamus::audio
