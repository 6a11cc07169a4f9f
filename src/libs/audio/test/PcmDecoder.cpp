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

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

#include "ffmpeg/AudioFile.hpp"
#include "ffmpeg/PcmDecoder.hpp"

#include "WavFile.hpp"

namespace gamus::audio::ffmpeg::tests
{
    using namespace audio::tests;

    namespace
    {
        struct DecodeResult
        {
            std::size_t outputSampleRate{};
            std::size_t sampleCount{};
            std::size_t visitedSampleCount{};
            std::size_t resamplerInitCount{};
            std::size_t decodedFrameCount{};
            std::size_t decodeErrorCount{};
            float peak{};
        };

        DecodeResult decodeFile(const std::filesystem::path& path)
        {
            const AudioFile audioFile{ path };
            PcmDecoder decoder{ audioFile };

            DecodeResult result;
            result.outputSampleRate = decoder.getOutputSampleRate();
            result.sampleCount = decoder.decode([&](std::span<const float> samples) {
                result.visitedSampleCount += samples.size();
                for (const float sample : samples)
                    result.peak = std::max(result.peak, std::abs(sample));
            });
            result.resamplerInitCount = decoder.getResamplerInitCount();
            result.decodedFrameCount = decoder.getDecodedFrameCount();
            result.decodeErrorCount = decoder.getDecodeErrorCount();

            return result;
        }
    } // namespace

    TEST(PcmDecoder, keepsStreamSampleRate)
    {
        ScopedTmpDirectory tmpDir;
        const std::filesystem::path path{ tmpDir.getPath() / "stereo48k.wav" };
        writeWavFile(path, generateNoise(48'000 * 2, 3), 2, 48'000);

        const DecodeResult result{ decodeFile(path) };
        EXPECT_EQ(result.outputSampleRate, 48'000);
        EXPECT_EQ(result.sampleCount, 48'000);
        EXPECT_EQ(result.visitedSampleCount, result.sampleCount);
        EXPECT_EQ(result.resamplerInitCount, 1);
        EXPECT_EQ(result.decodeErrorCount, 0);
    }

    TEST(PcmDecoder, sampleRateChangeMidStream)
    {
        constexpr std::size_t framesPerSegment{ 100 };
        const Mp3Segment segments[]{
            { 44'100, framesPerSegment },
            { 48'000, framesPerSegment },
        };

        ScopedTmpDirectory tmpDir;
        const std::filesystem::path path{ tmpDir.getPath() / "chained.mp3" };
        writeSilentMp3File(path, segments);

        const DecodeResult result{ decodeFile(path) };
        EXPECT_EQ(result.outputSampleRate, 44'100);
        EXPECT_EQ(result.resamplerInitCount, 2);
        EXPECT_FALSE(areDecodeErrorsDominant(result.decodedFrameCount, result.decodeErrorCount));
        EXPECT_EQ(result.peak, 0.f);

        // the 48 kHz part is brought back to 44.1 kHz instead of being read as 44.1 kHz samples
        const double expectedSampleCount{ framesPerSegment * mp3FrameSampleCount + framesPerSegment * mp3FrameSampleCount * 44'100. / 48'000. };
        EXPECT_NEAR(static_cast<double>(result.sampleCount), expectedSampleCount, 2 * mp3FrameSampleCount);
        EXPECT_LT(result.sampleCount, 2 * framesPerSegment * mp3FrameSampleCount - mp3FrameSampleCount * 4);
    }

    TEST(PcmDecoder, constantSampleRateMp3)
    {
        const Mp3Segment segments[]{ { 32'000, 50 } };

        ScopedTmpDirectory tmpDir;
        const std::filesystem::path path{ tmpDir.getPath() / "silence.mp3" };
        writeSilentMp3File(path, segments);

        const DecodeResult result{ decodeFile(path) };
        EXPECT_EQ(result.outputSampleRate, 32'000);
        EXPECT_EQ(result.resamplerInitCount, 1);
        EXPECT_NEAR(static_cast<double>(result.sampleCount), 50. * mp3FrameSampleCount, 2 * mp3FrameSampleCount);
    }

    TEST(PcmDecoder, decodeErrorsDominance)
    {
        EXPECT_FALSE(areDecodeErrorsDominant(100, 0));
        EXPECT_FALSE(areDecodeErrorsDominant(100, 3));
        EXPECT_FALSE(areDecodeErrorsDominant(10, 10));
        EXPECT_TRUE(areDecodeErrorsDominant(10, 11));
        EXPECT_TRUE(areDecodeErrorsDominant(0, 1));
        EXPECT_FALSE(areDecodeErrorsDominant(0, 0));
    }
} // namespace gamus::audio::ffmpeg::tests
