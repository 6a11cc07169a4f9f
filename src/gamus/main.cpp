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

#include <cstdlib>
#include <iostream>
#include <mutex>

#include <boost/program_options.hpp>

#include "audio/IMetadataExtractor.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "core/String.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "services/library/Exception.hpp"
#include "services/library/ILibraryCommands.hpp"
#include "services/scanner/Exception.hpp"
#include "services/scanner/IScannerService.hpp"

namespace gamus
{
    namespace
    {
        namespace program_options = boost::program_options;

        core::logging::Severity getLogMinSeverity()
        {
            const std::string_view minSeverity{ core::Service<core::IConfig>::get()->getString("log-min-severity", "info") };
            if (const std::optional<core::logging::Severity> severity{ core::logging::parseSeverity(minSeverity) })
                return *severity;

            throw core::GamusException{ "Invalid config value for 'log-min-severity'" };
        }

        // Prints one line per event, using the transport event names
        class ConsoleProgressObserver : public scanner::IProgressObserver
        {
        public:
            ConsoleProgressObserver(bool verbose)
                : _verbose{ verbose } {}

        private:
            void onEvent(const scanner::ProgressEvent& event) override
            {
                std::visit([this](const auto& e) { print(e); }, event);
            }

            void print(const scanner::ImportStarted& event)
            {
                std::cout << scanner::getEventName(event) << " " << event.totalFileCount << std::endl;
            }

            void print(const scanner::FileImported& event)
            {
                if (_verbose)
                    std::cout << scanner::getEventName(event) << " " << event.path << std::endl;
            }

            void print(const scanner::FileFailed& event)
            {
                std::cout << scanner::getEventName(event) << " " << event.path << ": " << event.error << std::endl;
            }

            void print(const scanner::ImportFinished& event)
            {
                std::cout << scanner::getEventName(event) << std::endl;
            }

            void print(const scanner::ImportFailed& event)
            {
                std::cout << scanner::getEventName(event) << " " << event.error << std::endl;
            }

            const bool _verbose;
        };

        int runImport(library::ILibraryCommands& commands, scanner::IScannerService& scanner, bool verbose)
        {
            commands.importFull(std::make_shared<ConsoleProgressObserver>(verbose));
            scanner.waitForCompletion();

            const scanner::IScannerService::Status status{ scanner.getStatus() };
            if (status.lastScanStats)
            {
                const scanner::ScanStats& stats{ *status.lastScanStats };
                std::cout << "Processed " << stats.getProcessedFileCount() << "/" << stats.totalFileCount << " file(s): "
                          << stats.additions << " added, " << stats.updates << " updated, " << stats.skips << " unchanged, "
                          << stats.errors << " error(s), " << stats.walkErrors << " unexplored directorie(s)" << std::endl;
            }

            return status.currentState == scanner::IScannerService::State::Succeeded ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        int runScan(library::ILibraryCommands& commands)
        {
            const scanner::ScanSummary summary{ commands.scanLibrary() };

            for (const scanner::DeviceSummary& device : summary.devices)
            {
                std::cout << "Device " << device.deviceId << ": " << device.candidateCount << " file(s), " << device.workerCount << " worker(s)";
                if (device.bandwidthMBps)
                    std::cout << ", " << *device.bandwidthMBps << " MB/s";
                std::cout << std::endl;

                for (const std::filesystem::path& root : device.roots)
                    std::cout << "\t" << root.string() << std::endl;
            }
            std::cout << "Total: " << summary.totalCandidates << " file(s)" << std::endl;

            return EXIT_SUCCESS;
        }

        void displayScannerConfig(const scanner::ScannerConfig& config)
        {
            std::cout << "roots:" << std::endl;
            for (const std::filesystem::path& root : config.roots)
                std::cout << "\t" << root.string() << std::endl;
            std::cout << "audio-exts: " << core::stringUtils::joinStrings(config.audioExtensions, ",") << std::endl;
            std::cout << "ignore-hidden: " << (config.ignoreHidden ? "true" : "false") << std::endl;
            std::cout << "max-depth: " << (config.maxDepth ? std::to_string(*config.maxDepth) : "unlimited") << std::endl;
        }

        int runSetConfig(library::ILibraryCommands& commands, const program_options::variables_map& vm)
        {
            scanner::ScannerConfig config{ commands.getScannerConfig() };

            if (vm.count("root"))
            {
                config.roots.clear();
                for (const std::string& root : vm["root"].as<std::vector<std::string>>())
                    config.roots.push_back(root);
            }
            if (vm.count("ext"))
                config.audioExtensions = vm["ext"].as<std::vector<std::string>>();
            if (vm.count("ignore-hidden"))
                config.ignoreHidden = vm["ignore-hidden"].as<bool>();
            if (vm.count("max-depth"))
            {
                const int maxDepth{ vm["max-depth"].as<int>() };
                if (maxDepth < 0)
                    config.maxDepth.reset();
                else
                    config.maxDepth = static_cast<unsigned>(maxDepth);
            }

            commands.saveScannerConfig(config);
            displayScannerConfig(commands.getScannerConfig());

            return EXIT_SUCCESS;
        }

        std::string_view getArgument(const std::vector<std::string>& args, std::size_t index, std::string_view name)
        {
            if (args.size() <= index)
                throw core::GamusException{ "Missing argument '" + std::string{ name } + "'" };

            return args[index];
        }

        int runCommand(std::string_view command, const std::vector<std::string>& args, const program_options::variables_map& vm, library::ILibraryCommands& commands, scanner::IScannerService& scanner)
        {
            if (command == "import")
                return runImport(commands, scanner, vm.count("verbose") > 0);

            if (command == "scan")
                return runScan(commands);

            if (command == "get-config")
            {
                displayScannerConfig(commands.getScannerConfig());
                return EXIT_SUCCESS;
            }

            if (command == "set-config")
                return runSetConfig(commands, vm);

            if (command == "artists")
            {
                for (const library::ArtistEntry& artist : commands.listArtists())
                    std::cout << artist.id.toString() << "\t" << artist.name << std::endl;
                return EXIT_SUCCESS;
            }

            if (command == "create-artist")
            {
                library::NewArtist newArtist{ .name = std::string{ getArgument(args, 0, "name") }, .bio = std::nullopt };
                if (vm.count("bio"))
                    newArtist.bio = vm["bio"].as<std::string>();

                const library::ArtistEntry artist{ commands.createArtist(newArtist) };
                std::cout << artist.id.toString() << "\t" << artist.name << std::endl;
                return EXIT_SUCCESS;
            }

            if (command == "songs")
            {
                for (const library::SongEntry& song : commands.listSongs())
                    std::cout << song.id.toString() << "\t" << song.title << "\t" << song.acoustId.value_or("") << std::endl;
                return EXIT_SUCCESS;
            }

            if (command == "create-song")
            {
                library::NewSong newSong{ .title = std::string{ getArgument(args, 0, "title") }, .acoustId = std::nullopt };
                if (vm.count("acoustid"))
                    newSong.acoustId = vm["acoustid"].as<std::string>();

                const library::SongEntry song{ commands.createSong(newSong) };
                std::cout << song.id.toString() << "\t" << song.title << std::endl;
                return EXIT_SUCCESS;
            }

            if (command == "releases")
            {
                for (const library::ReleaseEntry& release : commands.listReleases())
                {
                    std::cout << release.id.toString() << "\t" << release.title << "\t" << core::stringUtils::joinStrings(release.mainArtists, ", ")
                              << "\t" << release.releaseDate.value_or("") << "\t" << release.trackCount << " track(s)" << std::endl;
                }
                return EXIT_SUCCESS;
            }

            throw core::GamusException{ "Unknown command '" + std::string{ command } + "'" };
        }
    } // namespace

    int main(int argc, char* argv[])
    {
        program_options::options_description options{ "Options" };
        // clang-format off
        options.add_options()
            ("help,h", "Display this help message")
            ("conf,c", program_options::value<std::string>()->default_value("/etc/gamus.conf"), "Gamus configuration file")
            ("verbose,v", "import: display every imported file")
            ("root", program_options::value<std::vector<std::string>>()->composing(), "set-config: root directory (repeatable)")
            ("ext", program_options::value<std::vector<std::string>>()->composing(), "set-config: audio file extension (repeatable)")
            ("ignore-hidden", program_options::value<bool>(), "set-config: skip hidden files and directories")
            ("max-depth", program_options::value<int>(), "set-config: maximum exploration depth, negative for unlimited")
            ("bio", program_options::value<std::string>(), "create-artist: artist biography")
            ("acoustid", program_options::value<std::string>(), "create-song: AcoustID of the song");
        // clang-format on

        program_options::options_description hiddenOptions{ "Hidden options" };
        hiddenOptions.add_options()("command", program_options::value<std::string>(), "command")("args", program_options::value<std::vector<std::string>>()->composing(), "args");

        program_options::options_description allOptions;
        allOptions.add(options).add(hiddenOptions);

        program_options::positional_options_description positional;
        positional.add("command", 1).add("args", -1);

        auto displayHelp{ [&](std::ostream& os) {
            os << "Usage: " << argv[0] << " [options] command [args]\n\n"
               << "Commands:\n"
               << "\timport\t\t\tfull import of the configured roots\n"
               << "\tscan\t\t\tclassify the configured roots, no extraction\n"
               << "\tget-config\t\tdisplay the scanner configuration\n"
               << "\tset-config\t\tupdate the scanner configuration\n"
               << "\tartists\t\t\tlist artists\n"
               << "\tcreate-artist name\tcreate an artist\n"
               << "\tsongs\t\t\tlist songs\n"
               << "\tcreate-song title\tcreate a song\n"
               << "\treleases\t\tlist releases\n\n"
               << options << std::endl;
        } };

        program_options::variables_map vm;
        try
        {
            program_options::store(program_options::command_line_parser(argc, argv)
                                       .options(allOptions)
                                       .positional(positional)
                                       .run(),
                                   vm);
            program_options::notify(vm);
        }
        catch (const program_options::error& e)
        {
            std::cerr << e.what() << std::endl;
            displayHelp(std::cerr);
            return EXIT_FAILURE;
        }

        if (vm.count("help"))
        {
            displayHelp(std::cout);
            return EXIT_SUCCESS;
        }

        if (vm.count("command") == 0)
        {
            std::cerr << "No command provided" << std::endl;
            displayHelp(std::cerr);
            return EXIT_FAILURE;
        }

        int res{ EXIT_FAILURE };
        try
        {
            core::Service<core::IConfig> config{ core::createConfig(vm["conf"].as<std::string>()) };

            const std::filesystem::path workingDir{ config->getPath("working-dir", "/var/gamus") };
            core::Service<core::logging::ILogger> logger{ core::logging::createLogger(getLogMinSeverity(), config->getPath("log-file", "")) };

            GAMUS_LOG(MAIN, INFO, "Starting, working dir = " << workingDir);

            const std::unique_ptr<db::IDb> database{ db::createDb(config->getPath("db-path", workingDir / "gamus.db"), config->getULong("db-connection-count", 10)) };
            {
                db::Session& session{ database->getTLSSession() };
                session.prepareTablesIfNeeded();
                session.createIndexesIfNeeded();
            }

            const std::unique_ptr<scanner::IScannerService> scannerService{ scanner::createScannerService(*database, audio::createMetadataExtractor()) };
            const std::unique_ptr<library::ILibraryCommands> commands{ library::createLibraryCommands(*database, *scannerService, config->getPath("scanner-config-path", workingDir / "scanner.conf")) };

            const std::vector<std::string> args{ vm.count("args") ? vm["args"].as<std::vector<std::string>>() : std::vector<std::string>{} };
            res = runCommand(vm["command"].as<std::string>(), args, vm, *commands, *scannerService);

            GAMUS_LOG(MAIN, INFO, "Quitting...");
        }
        catch (const scanner::Exception& e)
        {
            GAMUS_LOG(MAIN, ERROR, "Scanner error: " << e.what());
            std::cerr << "Scanner error: " << e.what() << std::endl;
        }
        catch (const library::Exception& e)
        {
            std::cerr << "Rejected: " << e.what() << std::endl;
        }
        catch (const std::exception& e)
        {
            GAMUS_LOG(MAIN, FATAL, "Caught std::exception: " << e.what());
            std::cerr << "Caught std::exception: " << e.what() << std::endl;
        }

        return res;
    }
} // namespace gamus

int main(int argc, char* argv[])
{
    return gamus::main(argc, argv);
}
