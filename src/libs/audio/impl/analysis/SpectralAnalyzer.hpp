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
#include <string>
#include <vector>

#include <aubio/aubio.h>

namespace gamus::audio
{
    enum class QualityLevel
    {
        Perfect,
        High,
        Medium,
        Low,
        Inconclusive,
    };

    const char* toString(QualityLevel level);

    struct QualityResult
    {
        double score{}; // 0 to 10
        QualityLevel level{ QualityLevel::Inconclusive };
        std::optional<float> cutoffFrequency; // Hz, start of the first band past the cutoff
        std::vector<float> bandLevels;        // dB, reference band first then each check band

        std::string getAssessment() const;
    };

    // Detects the high frequency cutoff that lossy encoders leave in the spectrum
    // Samples are expected mono, fed in order
    class SpectralAnalyzer
    {
    public:
        struct Parameters
        {
            std::size_t fftWindowSize{ 8192 };
            float referenceBandStart{ 14'000 };
            float referenceBandEnd{ 16'000 };
            float checkBandStart{ 17'000 };
            float checkBandWidth{ 1'000 };
            std::size_t checkBandCount{ 6 };
            float significantDropDb{ 18 };
            float silenceThresholdDb{ -100 };
        };

        // Only the samples in [startSample, startSample + maxSampleCount) are analyzed
        SpectralAnalyzer(std::size_t sampleRate, std::size_t startSample, std::size_t maxSampleCount, const Parameters& parameters = {});
        ~SpectralAnalyzer();
        SpectralAnalyzer(const SpectralAnalyzer&) = delete;
        SpectralAnalyzer& operator=(const SpectralAnalyzer&) = delete;

        void process(std::span<const float> samples);
        QualityResult finish() const;

        // bands are averaged over the dB spectrum, bin i covering [i * binWidth, (i + 1) * binWidth)
        static QualityResult evaluate(std::span<const float> spectrumDb, std::size_t sampleRate, const Parameters& parameters);
        static double computeScore(std::optional<float> cutoffFrequency);
        static QualityLevel computeLevel(double score);

    private:
        void processWindow();

        const Parameters _parameters;
        const std::size_t _sampleRate;
        const std::size_t _startSample;
        const std::size_t _maxSampleCount;

        using FftPtr = std::unique_ptr<aubio_fft_t, decltype(&del_aubio_fft)>;
        using FvecPtr = std::unique_ptr<fvec_t, decltype(&del_fvec)>;
        using CvecPtr = std::unique_ptr<cvec_t, decltype(&del_cvec)>;

        std::size_t _sampleIndex{};
        FftPtr _fft;
        FvecPtr _window;
        FvecPtr _input;
        CvecPtr _spectrum;
        std::size_t _inputFill{};
        std::vector<double> _magnitudeSum;
        std::size_t _windowCount{};
    };
} // namespace gamus::audio
