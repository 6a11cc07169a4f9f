/*
 * Copyright (C) 2020 Emeric Poupon
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

#include "AudioFile.hpp"

#include <array>
#include <cassert>
#include <cerrno>

extern "C"
{
#define __STDC_CONSTANT_MACROS
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
}

#include "core/ILogger.hpp"
#include "core/String.hpp"

#include "audio/Exception.hpp"

namespace gamus::audio::ffmpeg
{
    namespace
    {
        void getMetaDataFromDictionnary(AVDictionary* dictionnary, AudioFile::MetadataMap& res)
        {
            if (!dictionnary)
                return;

            AVDictionaryEntry* tag = NULL;
            while ((tag = ::av_dict_get(dictionnary, "", tag, AV_DICT_IGNORE_SUFFIX)))
            {
                res[core::stringUtils::stringToLower(tag->key)] = tag->value;
            }
        }

        bool isIOError(int avError)
        {
            switch (AVUNERROR(avError))
            {
            case ENOENT:
            case EACCES:
            case EPERM:
            case EIO:
            case EISDIR:
            case ENOTDIR:
            case ENXIO:
                return true;
            default:
                return false;
            }
        }

        [[noreturn]] void throwOpenError(const std::filesystem::path& p, int avError)
        {
            if (isIOError(avError))
                throw UnreadableException{ "Cannot open '" + p.string() + "'", std::error_code{ AVUNERROR(avError), std::generic_category() } };

            throw UnsupportedFormatException{ "Cannot open '" + p.string() + "': " + averrorToString(avError) };
        }
    } // namespace

    std::string averrorToString(int error)
    {
        std::array<char, 128> buf = { 0 };

        if (::av_strerror(error, buf.data(), buf.size()) == 0)
            return buf.data();

        return "Unknown error";
    }

    AudioFile::AudioFile(const std::filesystem::path& p)
        : _p{ p }
    {
        int error{ avformat_open_input(&_context, _p.c_str(), nullptr, nullptr) };
        if (error < 0)
        {
            GAMUS_LOG(AUDIO, DEBUG, "Cannot open " << _p << ": " << averrorToString(error));
            throwOpenError(_p, error);
        }

        error = avformat_find_stream_info(_context, nullptr);
        if (error < 0)
        {
            GAMUS_LOG(AUDIO, DEBUG, "Cannot find stream information on " << _p << ": " << averrorToString(error));
            avformat_close_input(&_context);
            throw CorruptStreamException{ "Cannot find stream information in '" + _p.string() + "': " + averrorToString(error) };
        }
    }

    AudioFile::~AudioFile()
    {
        avformat_close_input(&_context);
    }

    const std::filesystem::path& AudioFile::getPath() const
    {
        return _p;
    }

    ContainerInfo AudioFile::getContainerInfo() const
    {
        ContainerInfo info;

        info.containerName = _context->iformat->name;
        info.bitrate = _context->bit_rate > 0 ? static_cast<std::size_t>(_context->bit_rate) : 0;
        info.duration = std::chrono::milliseconds{ _context->duration == AV_NOPTS_VALUE ? 0 : _context->duration * 1'000 / AV_TIME_BASE };

        return info;
    }

    AudioFile::MetadataMap AudioFile::getMetaData() const
    {
        MetadataMap res;

        getMetaDataFromDictionnary(_context->metadata, res);

        // OGG files carry their tags in the streams
        if (res.empty())
        {
            for (std::size_t i{}; i < _context->nb_streams; ++i)
            {
                getMetaDataFromDictionnary(_context->streams[i]->metadata, res);

                if (!res.empty())
                    break;
            }
        }

        return res;
    }

    std::vector<StreamInfo> AudioFile::getStreamInfo() const
    {
        std::vector<StreamInfo> res;

        for (std::size_t i{}; i < _context->nb_streams; ++i)
        {
            std::optional<StreamInfo> streamInfo{ getStreamInfo(i) };
            if (streamInfo)
                res.emplace_back(std::move(*streamInfo));
        }

        return res;
    }

    std::optional<std::size_t> AudioFile::getBestStreamIndex() const
    {
        int res = ::av_find_best_stream(_context,
                                        AVMEDIA_TYPE_AUDIO,
                                        -1, // Auto
                                        -1, // Auto
                                        NULL,
                                        0);

        if (res < 0)
            return std::nullopt;

        return res;
    }

    std::optional<StreamInfo> AudioFile::getBestStreamInfo() const
    {
        std::optional<StreamInfo> res;

        std::optional<std::size_t> bestStreamIndex{ getBestStreamIndex() };
        if (bestStreamIndex)
            res = getStreamInfo(*bestStreamIndex);

        return res;
    }

    std::optional<StreamInfo> AudioFile::getStreamInfo(std::size_t streamIndex) const
    {
        std::optional<StreamInfo> res;

        AVStream* avstream{ _context->streams[streamIndex] };
        assert(avstream);

        // cover art
        if (avstream->disposition & AV_DISPOSITION_ATTACHED_PIC)
            return res;

        if (!avstream->codecpar)
        {
            GAMUS_LOG(AUDIO, ERROR, "Skipping stream " << streamIndex << " since no codecpar is set");
            return res;
        }

        if (avstream->codecpar->codec_type != AVMEDIA_TYPE_AUDIO)
            return res;

        res.emplace();

        res->index = streamIndex;
        res->codecName = ::avcodec_get_name(avstream->codecpar->codec_id);

        if (avstream->codecpar->bit_rate > 0)
            res->bitrate = static_cast<std::size_t>(avstream->codecpar->bit_rate);
        if (avstream->codecpar->bits_per_coded_sample)
            res->bitsPerSample = static_cast<std::size_t>(avstream->codecpar->bits_per_coded_sample);
        else if (avstream->codecpar->bits_per_raw_sample)
            res->bitsPerSample = static_cast<std::size_t>(avstream->codecpar->bits_per_raw_sample);

#if LIBAVCODEC_VERSION_INT < AV_VERSION_INT(59, 24, 100)
        if (avstream->codecpar->channels)
            res->channelCount = static_cast<std::size_t>(avstream->codecpar->channels);
#else
        if (avstream->codecpar->ch_layout.nb_channels)
            res->channelCount = static_cast<std::size_t>(avstream->codecpar->ch_layout.nb_channels);
#endif
        if (avstream->codecpar->sample_rate)
            res->sampleRate = static_cast<std::size_t>(avstream->codecpar->sample_rate);

        return res;
    }
} // namespace gamus::audio::ffmpeg
