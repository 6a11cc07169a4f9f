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

#include "MetadataExtractor.hpp"

#include <cstring>
#include <string>

#include "core/ILogger.hpp"
#include "core/Path.hpp"

#include "analysis/Fingerprinter.hpp"
#include "analysis/SpectralAnalyzer.hpp"
#include "analysis/TempoEstimator.hpp"
#include "ffmpeg/AudioFile.hpp"
#include "ffmpeg/PcmDecoder.hpp"
#include "taglib/TagReader.hpp"
#include "TagMap.hpp"

namespace gamus::audio
{
    namespace
    {
        constexpr std::chrono::seconds maxSpectralAnalysisDuration{ 10 };

        std::vector<unsigned char> toFeatureBlob(std::span<const float> values)
        {
            std::vector<unsigned char> res;
            res.reserve(values.size() * sizeof(std::uint32_t));

            for (const float value : values)
            {
                std::uint32_t bits;
                std::memcpy(&bits, &value, sizeof(bits));
                for (std::size_t i{}; i < sizeof(bits); ++i)
                    res.push_back(static_cast<unsigned char>((bits >> (8 * i)) & 0xFF));
            }

            return res;
        }

        void analyzeSamples(const ffmpeg::AudioFile& audioFile, FileMetadata& metadata)
        {
            ffmpeg::PcmDecoder decoder{ audioFile };

            // everything runs at the stream rate: resampling would low-pass the spectrum
            const std::size_t sampleRate{ decoder.getOutputSampleRate() };

            // spectral analysis on the middle of the file
            const std::size_t maxSpectralSampleCount{ static_cast<std::size_t>(maxSpectralAnalysisDuration.count()) * sampleRate };
            const std::size_t expectedSampleCount{ static_cast<std::size_t>(metadata.duration.count()) * sampleRate / 1000 };
            const std::size_t spectralStartSample{ expectedSampleCount > maxSpectralSampleCount ? (expectedSampleCount - maxSpectralSampleCount) / 2 : 0 };

            SpectralAnalyzer spectralAnalyzer{ sampleRate, spectralStartSample, maxSpectralSampleCount };
            TempoEstimator tempoEstimator{ sampleRate };
            Fingerprinter fingerprinter;

            const std::size_t sampleCount{ decoder.decode([&](std::span<const float> samples) {
                spectralAnalyzer.process(samples);
                tempoEstimator.process(samples);
                fingerprinter.process(samples);
            }) };

            if (sampleCount == 0)
                throw CorruptStreamException{ "No audio sample decoded from '" + audioFile.getPath().string() + "'" };

            if (ffmpeg::areDecodeErrorsDominant(decoder.getDecodedFrameCount(), decoder.getDecodeErrorCount()))
            {
                throw CorruptStreamException{ "Too many decode errors in '" + audioFile.getPath().string() + "': " + std::to_string(decoder.getDecodeErrorCount())
                                              + " error(s) for " + std::to_string(decoder.getDecodedFrameCount()) + " decoded frame(s)" };
            }

            if (metadata.duration.count() == 0)
                metadata.duration = std::chrono::milliseconds{ sampleCount * 1000 / sampleRate };

            metadata.fingerprint = fingerprinter.getFingerprint();
            metadata.bpm = tempoEstimator.getBpm();

            const QualityResult quality{ spectralAnalyzer.finish() };
            metadata.qualityScore = quality.score / 10;
            metadata.qualityAssessment = quality.getAssessment();
            metadata.features = toFeatureBlob(quality.bandLevels);
        }
    } // namespace

    std::unique_ptr<IMetadataExtractor> createMetadataExtractor(const ExtractorOptions& options)
    {
        return std::make_unique<MetadataExtractor>(options);
    }

    MetadataExtractor::MetadataExtractor(const ExtractorOptions& options)
        : _options{ options }
    {
    }

    FileMetadata MetadataExtractor::extractFromPath(const std::filesystem::path& path) const
    {
        FileMetadata metadata;
        metadata.path = path;

        std::error_code ec;
        metadata.sizeBytes = std::filesystem::file_size(path, ec);
        if (ec)
            throw UnreadableException{ "Cannot get size of '" + path.string() + "'", ec };

        try
        {
            metadata.modifiedUnix = core::pathUtils::getLastWriteTime(path).toTime_t();
        }
        catch (const core::GamusException& e)
        {
            throw UnreadableException{ e.what(), std::make_error_code(std::errc::io_error) };
        }

        const ffmpeg::AudioFile audioFile{ path };

        const std::optional<ffmpeg::StreamInfo> streamInfo{ audioFile.getBestStreamInfo() };
        if (!streamInfo)
            throw UnsupportedFormatException{ "No audio stream found in '" + path.string() + "'" };

        const ffmpeg::ContainerInfo containerInfo{ audioFile.getContainerInfo() };
        metadata.duration = containerInfo.duration;
        if (containerInfo.bitrate > 0)
            metadata.bitrateKbps = static_cast<int>(containerInfo.bitrate / 1000);
        else if (streamInfo->bitrate)
            metadata.bitrateKbps = static_cast<int>(*streamInfo->bitrate / 1000);
        if (streamInfo->sampleRate)
            metadata.sampleRateHz = static_cast<int>(*streamInfo->sampleRate);
        if (streamInfo->channelCount)
            metadata.channelCount = static_cast<int>(*streamInfo->channelCount);

        TagMap tagMap{ taglib::readTags(path, _options.enableExtraDebugLogs) };
        mergeTagMaps(tagMap, audioFile.getMetaData());
        metadata.tags = resolveTags(tagMap);

        if (_options.enableAnalysis)
            analyzeSamples(audioFile, metadata);

        GAMUS_LOG(METADATA, DEBUG, "Extracted " << path << ": duration = " << metadata.duration.count() << " ms, fingerprint = " << metadata.fingerprint.value_or("<none>") << ", quality = " << metadata.qualityAssessment.value_or("<none>"));

        return metadata;
    }
} // namespace gamus::audio
