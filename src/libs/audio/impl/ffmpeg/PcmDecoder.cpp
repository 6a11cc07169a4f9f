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

#include "PcmDecoder.hpp"

#include <cstdint>

extern "C"
{
#define __STDC_CONSTANT_MACROS
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libswresample/swresample.h>
}

#include "core/ILogger.hpp"

#include "audio/Exception.hpp"

#include "AudioFile.hpp"

namespace gamus::audio::ffmpeg
{
    namespace
    {
        struct PacketDeleter
        {
            void operator()(AVPacket* packet) const { ::av_packet_free(&packet); }
        };

        struct FrameDeleter
        {
            void operator()(AVFrame* frame) const { ::av_frame_free(&frame); }
        };
    } // namespace

    bool areDecodeErrorsDominant(std::size_t decodedFrameCount, std::size_t decodeErrorCount)
    {
        return decodeErrorCount > 0 && decodeErrorCount > decodedFrameCount;
    }

    void PcmDecoder::CodecContextDeleter::operator()(AVCodecContext* context) const
    {
        ::avcodec_free_context(&context);
    }

    void PcmDecoder::ResamplerDeleter::operator()(SwrContext* context) const
    {
        ::swr_free(&context);
    }

    PcmDecoder::PcmDecoder(const AudioFile& audioFile)
        : _audioFile{ audioFile }
    {
        AVFormatContext* formatContext{ _audioFile.getFormatContext() };

#if LIBAVFORMAT_VERSION_MAJOR < 59
        AVCodec* codec{};
#else
        const AVCodec* codec{};
#endif
        const int res{ ::av_find_best_stream(formatContext, AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0) };
        if (res == AVERROR_DECODER_NOT_FOUND || (res >= 0 && !codec))
            throw UnsupportedFormatException{ "No decoder found for '" + _audioFile.getPath().string() + "'" };
        if (res < 0)
            throw UnsupportedFormatException{ "No audio stream found in '" + _audioFile.getPath().string() + "'" };

        _streamIndex = res;

        _codecContext.reset(::avcodec_alloc_context3(codec));
        if (!_codecContext)
            throw Exception{ "Cannot allocate codec context" };

        int error{ ::avcodec_parameters_to_context(_codecContext.get(), formatContext->streams[_streamIndex]->codecpar) };
        if (error < 0)
            throw CorruptStreamException{ "Cannot set codec parameters for '" + _audioFile.getPath().string() + "': " + averrorToString(error) };

        error = ::avcodec_open2(_codecContext.get(), codec, nullptr);
        if (error < 0)
            throw UnsupportedFormatException{ "Cannot open decoder '" + std::string{ codec->name } + "' for '" + _audioFile.getPath().string() + "': " + averrorToString(error) };

        if (_codecContext->sample_rate <= 0)
            throw CorruptStreamException{ "No sample rate in '" + _audioFile.getPath().string() + "'" };
        _outputSampleRate = static_cast<std::size_t>(_codecContext->sample_rate);
    }

    PcmDecoder::~PcmDecoder() = default;

    std::size_t PcmDecoder::decode(const SampleVisitor& visitor)
    {
        std::unique_ptr<AVPacket, PacketDeleter> packet{ ::av_packet_alloc() };
        if (!packet)
            throw Exception{ "Cannot allocate packet" };

        AVFormatContext* formatContext{ _audioFile.getFormatContext() };

        int error;
        while ((error = ::av_read_frame(formatContext, packet.get())) >= 0)
        {
            if (packet->stream_index == _streamIndex)
                sendPacket(packet.get(), visitor);

            ::av_packet_unref(packet.get());
        }

        if (error != AVERROR_EOF)
        {
            GAMUS_LOG(AUDIO, DEBUG, "Read error in " << _audioFile.getPath() << ": " << averrorToString(error));
            _decodeErrorCount++;
        }

        // drain the decoder
        sendPacket(nullptr, visitor);
        flushResampler(visitor);

        GAMUS_LOG_IF(AUDIO, DEBUG, _decodeErrorCount > 0, _decodeErrorCount << " decode error(s) in " << _audioFile.getPath());

        return _sampleCount;
    }

    void PcmDecoder::sendPacket(const AVPacket* packet, const SampleVisitor& visitor)
    {
        int error{ ::avcodec_send_packet(_codecContext.get(), packet) };
        if (error < 0 && error != AVERROR(EAGAIN) && error != AVERROR_EOF)
        {
            _decodeErrorCount++;
            return;
        }

        std::unique_ptr<AVFrame, FrameDeleter> frame{ ::av_frame_alloc() };
        if (!frame)
            throw Exception{ "Cannot allocate frame" };

        while ((error = ::avcodec_receive_frame(_codecContext.get(), frame.get())) >= 0)
        {
            _decodedFrameCount++;
            processFrame(*frame, visitor);
            ::av_frame_unref(frame.get());
        }

        if (error != AVERROR(EAGAIN) && error != AVERROR_EOF)
            _decodeErrorCount++;
    }

    PcmDecoder::InputFormat PcmDecoder::getInputFormat(const AVFrame& frame)
    {
        InputFormat format;
        format.sampleRate = frame.sample_rate;
        format.sampleFormat = frame.format;
#if LIBAVCODEC_VERSION_INT < AV_VERSION_INT(59, 24, 100)
        format.channelCount = frame.channels;
        format.channelMask = frame.channel_layout;
#else
        format.channelCount = frame.ch_layout.nb_channels;
        format.channelMask = frame.ch_layout.order == AV_CHANNEL_ORDER_NATIVE ? frame.ch_layout.u.mask : 0;
#endif
        return format;
    }

    void PcmDecoder::initResampler(const AVFrame& frame)
    {
        SwrContext* context{};

#if LIBAVCODEC_VERSION_INT < AV_VERSION_INT(59, 24, 100)
        const std::int64_t inputLayout{ frame.channel_layout ? static_cast<std::int64_t>(frame.channel_layout) : ::av_get_default_channel_layout(frame.channels) };
        context = ::swr_alloc_set_opts(nullptr,
                                       AV_CH_LAYOUT_MONO, AV_SAMPLE_FMT_FLT, static_cast<int>(_outputSampleRate),
                                       inputLayout, static_cast<AVSampleFormat>(frame.format), frame.sample_rate,
                                       0, nullptr);
#else
        AVChannelLayout outputLayout;
        ::av_channel_layout_default(&outputLayout, 1);
        if (::swr_alloc_set_opts2(&context,
                                  &outputLayout, AV_SAMPLE_FMT_FLT, static_cast<int>(_outputSampleRate),
                                  &frame.ch_layout, static_cast<AVSampleFormat>(frame.format), frame.sample_rate,
                                  0, nullptr)
            < 0)
            context = nullptr;
#endif
        _resampler.reset(context);
        if (!_resampler)
            throw Exception{ "Cannot allocate resampler" };

        if (const int error{ ::swr_init(_resampler.get()) }; error < 0)
            throw CorruptStreamException{ "Cannot init resampler for '" + _audioFile.getPath().string() + "': " + averrorToString(error) };

        _resamplerInputFormat = getInputFormat(frame);
        _resamplerInitCount++;
    }

    void PcmDecoder::processFrame(const AVFrame& frame, const SampleVisitor& visitor)
    {
        if (!_resampler)
        {
            initResampler(frame);
        }
        else if (getInputFormat(frame) != _resamplerInputFormat)
        {
            GAMUS_LOG(AUDIO, DEBUG, "Input format changed in " << _audioFile.getPath() << ": " << _resamplerInputFormat.sampleRate << " Hz -> " << frame.sample_rate << " Hz");

            // samples buffered for the previous format must not go through the new conversion
            flushResampler(visitor);
            initResampler(frame);
        }

        const int maxOutputSamples{ ::swr_get_out_samples(_resampler.get(), frame.nb_samples) };
        if (maxOutputSamples <= 0)
            return;

        _outputBuffer.resize(static_cast<std::size_t>(maxOutputSamples));
        std::uint8_t* output{ reinterpret_cast<std::uint8_t*>(_outputBuffer.data()) };
        const int convertedSamples{ ::swr_convert(_resampler.get(), &output, maxOutputSamples, const_cast<const std::uint8_t**>(frame.extended_data), frame.nb_samples) };
        if (convertedSamples < 0)
        {
            _decodeErrorCount++;
            return;
        }

        if (convertedSamples > 0)
        {
            visitor(std::span<const float>{ _outputBuffer.data(), static_cast<std::size_t>(convertedSamples) });
            _sampleCount += static_cast<std::size_t>(convertedSamples);
        }
    }

    void PcmDecoder::flushResampler(const SampleVisitor& visitor)
    {
        if (!_resampler)
            return;

        _outputBuffer.resize(4096);
        while (true)
        {
            std::uint8_t* output{ reinterpret_cast<std::uint8_t*>(_outputBuffer.data()) };
            const int convertedSamples{ ::swr_convert(_resampler.get(), &output, static_cast<int>(_outputBuffer.size()), nullptr, 0) };
            if (convertedSamples <= 0)
                break;

            visitor(std::span<const float>{ _outputBuffer.data(), static_cast<std::size_t>(convertedSamples) });
            _sampleCount += static_cast<std::size_t>(convertedSamples);
        }
    }
} // namespace gamus::audio::ffmpeg
