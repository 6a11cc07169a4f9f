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
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <vector>

extern "C"
{
    struct AVCodecContext;
    struct AVFrame;
    struct AVPacket;
    struct SwrContext;
}

namespace gamus::audio::ffmpeg
{
    class AudioFile;

    // Decides whether a stream is too damaged to be analyzed: more packets failed than frames decoded
    [[nodiscard]] bool areDecodeErrorsDominant(std::size_t decodedFrameCount, std::size_t decodeErrorCount);

    // Decodes the best audio stream of a file into mono float samples
    // Output keeps the stream sample rate; frames that switch rate, sample format or channel layout
    // mid-stream are converted back to it
    class PcmDecoder
    {
    public:
        // Throws UnsupportedFormatException if no decoder is available
        PcmDecoder(const AudioFile& audioFile);
        ~PcmDecoder();
        PcmDecoder(const PcmDecoder&) = delete;
        PcmDecoder& operator=(const PcmDecoder&) = delete;

        std::size_t getOutputSampleRate() const { return _outputSampleRate; }

        using SampleVisitor = std::function<void(std::span<const float> samples)>;

        // Returns the number of samples that went through the visitor
        // Packets that fail to decode are skipped and counted
        std::size_t decode(const SampleVisitor& visitor);

        std::size_t getDecodedFrameCount() const { return _decodedFrameCount; }
        std::size_t getDecodeErrorCount() const { return _decodeErrorCount; }
        std::size_t getResamplerInitCount() const { return _resamplerInitCount; }

    private:
        void sendPacket(const AVPacket* packet, const SampleVisitor& visitor);
        void processFrame(const AVFrame& frame, const SampleVisitor& visitor);
        void flushResampler(const SampleVisitor& visitor);
        void initResampler(const AVFrame& frame);

        struct InputFormat
        {
            int sampleRate{};
            int sampleFormat{ -1 };
            int channelCount{};
            std::uint64_t channelMask{};

            bool operator==(const InputFormat&) const = default;
        };
        static InputFormat getInputFormat(const AVFrame& frame);

        struct CodecContextDeleter
        {
            void operator()(AVCodecContext* context) const;
        };
        struct ResamplerDeleter
        {
            void operator()(SwrContext* context) const;
        };

        const AudioFile& _audioFile;
        int _streamIndex{};
        std::size_t _outputSampleRate{};
        std::unique_ptr<AVCodecContext, CodecContextDeleter> _codecContext;
        std::unique_ptr<SwrContext, ResamplerDeleter> _resampler;
        InputFormat _resamplerInputFormat;
        std::vector<float> _outputBuffer;
        std::size_t _sampleCount{};
        std::size_t _decodedFrameCount{};
        std::size_t _decodeErrorCount{};
        std::size_t _resamplerInitCount{};
    };
} // namespace gamus::audio::ffmpeg
