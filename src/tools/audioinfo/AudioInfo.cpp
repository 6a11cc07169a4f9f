/*
 * Copyright (C) 2019 Emeric Poupon
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

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>

#include <boost/program_options.hpp>

#include "audio/Exception.hpp"
#include "audio/FileMetadata.hpp"
#include "audio/IMetadataExtractor.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"

namespace gamus::audio
{
    namespace
    {
        template<typename T>
        void displayOptional(std::ostream& os, std::string_view name, const std::optional<T>& value)
        {
            if (value)
                os << "\t" << name << ": " << *value << std::endl;
        }

        std::ostream& operator<<(std::ostream& os, const Tags& tags)
        {
            displayOptional(os, "Title", tags.title);
            displayOptional(os, "Album", tags.album);
            displayOptional(os, "Artist", tags.artist);
            displayOptional(os, "AlbumArtist", tags.albumArtist);
            displayOptional(os, "Date", tags.date);
            displayOptional(os, "Genre", tags.genre);
            displayOptional(os, "TrackNumber", tags.trackNumber);
            displayOptional(os, "DiscNumber", tags.discNumber);

            return os;
        }

        std::ostream& operator<<(std::ostream& os, const FileMetadata& metadata)
        {
            os << "\tSize: " << metadata.sizeBytes << " bytes" << std::endl;
            os << "\tDuration: " << std::fixed << std::setprecision(2) << std::chrono::duration_cast<std::chrono::duration<float>>(metadata.duration).count() << "s" << std::endl;
            displayOptional(os, "Bitrate (kbps)", metadata.bitrateKbps);
            displayOptional(os, "SampleRate", metadata.sampleRateHz);
            displayOptional(os, "ChannelCount", metadata.channelCount);
            displayOptional(os, "Fingerprint", metadata.fingerprint);
            displayOptional(os, "BPM", metadata.bpm);
            displayOptional(os, "QualityScore", metadata.qualityScore);
            displayOptional(os, "QualityAssessment", metadata.qualityAssessment);

            return os;
        }

        void displayInfo(const FileMetadata& metadata)
        {
            std::cout << "Audio properties:\n"
                      << metadata << std::endl;
            std::cout << "Tags:\n"
                      << metadata.tags << std::endl;
        }
    } // namespace
} // namespace gamus::audio

int main(int argc, char* argv[])
{
    try
    {
        using namespace gamus;
        namespace program_options = boost::program_options;

        program_options::options_description options{ "Options" };
        // clang-format off
        options.add_options()
            ("help,h", "Display this help message")
            ("no-analysis", "Skip sample decoding (no fingerprint, bpm or quality)")
            ("debug", "Display extra debug logs");
        // clang-format on

        program_options::options_description hiddenOptions{ "Hidden options" };
        hiddenOptions.add_options()("file", program_options::value<std::vector<std::string>>()->composing(), "file");

        program_options::options_description allOptions;
        allOptions.add(options).add(hiddenOptions);

        program_options::positional_options_description positional;
        positional.add("file", -1); // Handle remaining arguments as input files

        program_options::variables_map vm;
        program_options::store(program_options::command_line_parser(argc, argv)
                                   .options(allOptions)
                                   .positional(positional)
                                   .run(),
                               vm);

        program_options::notify(vm);

        auto displayHelp = [&](std::ostream& os) {
            os << "Usage: " << argv[0] << " [options] file..." << std::endl;
            os << options << std::endl;
        };

        if (vm.count("help"))
        {
            displayHelp(std::cout);
            return EXIT_SUCCESS;
        }

        if (vm.count("file") == 0)
        {
            std::cerr << "No input file provided" << std::endl;
            displayHelp(std::cerr);
            return EXIT_FAILURE;
        }

        audio::ExtractorOptions extractorOptions;
        extractorOptions.enableAnalysis = vm.count("no-analysis") == 0;
        extractorOptions.enableExtraDebugLogs = vm.count("debug") > 0;

        // log to stdout
        core::Service<core::logging::ILogger> logger{ core::logging::createLogger(extractorOptions.enableExtraDebugLogs ? core::logging::Severity::DEBUG : core::logging::Severity::INFO) };

        const auto extractor{ audio::createMetadataExtractor(extractorOptions) };

        bool hasFailure{};
        for (const std::string& inputFile : vm["file"].as<std::vector<std::string>>())
        {
            const std::filesystem::path file{ inputFile };

            try
            {
                std::cout << "Parsing file " << file << ":\n";
                audio::displayInfo(extractor->extractFromPath(file));
            }
            catch (const audio::Exception& e)
            {
                std::cerr << "Failed to parse file " << file << ": " << e.what() << std::endl;
                hasFailure = true;
            }
        }

        return hasFailure ? EXIT_FAILURE : EXIT_SUCCESS;
    }
    catch (std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
