/*
 * Copyright (C) 2024 Emeric Poupon
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

#include <fstream>

#include <gtest/gtest.h>

#include "services/scanner/Exception.hpp"
#include "services/scanner/ScannerConfig.hpp"
#include "Common.hpp"

namespace gamus::scanner::tests
{
    namespace
    {
        void writeFile(const std::filesystem::path& path, std::string_view content)
        {
            std::ofstream ofs{ path };
            ofs << content;
        }
    } // namespace

    TEST(ScannerConfig, normalizeAudioExtensions)
    {
        EXPECT_EQ(normalizeAudioExtensions({}), std::vector<std::string>{});
        EXPECT_EQ(normalizeAudioExtensions({ "mp3" }), std::vector<std::string>{ "mp3" });
        EXPECT_EQ(normalizeAudioExtensions({ ".MP3", " flac ", "", ".", "Ogg", "mp3" }), (std::vector<std::string>{ "mp3", "flac", "ogg" }));
    }

    TEST(ScannerConfig, readMissingFile)
    {
        TmpDirectory dir;

        const ScannerConfig config{ readScannerConfig(dir.getPath() / "missing.conf") };
        EXPECT_EQ(config, ScannerConfig{});
        EXPECT_TRUE(config.roots.empty());
        EXPECT_EQ(config.audioExtensions, (std::vector<std::string>{ "mp3", "flac", "ogg" }));
        EXPECT_TRUE(config.ignoreHidden);
        EXPECT_FALSE(config.maxDepth);
    }

    TEST(ScannerConfig, read)
    {
        TmpDirectory dir;
        const std::filesystem::path configPath{ dir.getPath() / "scanner.conf" };
        writeFile(configPath, R"(
roots = [ "/music", "/mnt/nas/music" ];
audio-extensions = [ ".MP3", "flac", "opus" ];
ignore-hidden = false;
max-depth = 3;
)");

        const ScannerConfig config{ readScannerConfig(configPath) };
        EXPECT_EQ(config.roots, (std::vector<std::filesystem::path>{ "/music", "/mnt/nas/music" }));
        EXPECT_EQ(config.audioExtensions, (std::vector<std::string>{ "mp3", "flac", "opus" }));
        EXPECT_FALSE(config.ignoreHidden);
        ASSERT_TRUE(config.maxDepth);
        EXPECT_EQ(*config.maxDepth, 3);
    }

    TEST(ScannerConfig, readEmptyRoots)
    {
        TmpDirectory dir;
        const std::filesystem::path configPath{ dir.getPath() / "scanner.conf" };
        writeFile(configPath, "roots = [];\n");

        const ScannerConfig config{ readScannerConfig(configPath) };
        EXPECT_TRUE(config.roots.empty());
        EXPECT_EQ(config.audioExtensions, (std::vector<std::string>{ "mp3", "flac", "ogg" }));
    }

    TEST(ScannerConfig, readInvalid)
    {
        TmpDirectory dir;
        const std::filesystem::path configPath{ dir.getPath() / "scanner.conf" };

        writeFile(configPath, "roots = [ \"/music\" \n");
        EXPECT_THROW(readScannerConfig(configPath), InvalidScannerConfigException);

        writeFile(configPath, "roots = \"/music\";\n");
        EXPECT_THROW(readScannerConfig(configPath), InvalidScannerConfigException);

        writeFile(configPath, "max-depth = -1;\n");
        EXPECT_THROW(readScannerConfig(configPath), InvalidScannerConfigException);
    }

    TEST(ScannerConfig, writeAndRead)
    {
        TmpDirectory dir;
        const std::filesystem::path configPath{ dir.getPath() / "sub" / "scanner.conf" };

        ScannerConfig config;
        config.roots = { "/music", "/other" };
        config.audioExtensions = { "mp3", "wav" };
        config.ignoreHidden = false;
        config.maxDepth = 5;

        writeScannerConfig(configPath, config);
        EXPECT_EQ(readScannerConfig(configPath), config);

        config.maxDepth.reset();
        writeScannerConfig(configPath, config);
        EXPECT_EQ(readScannerConfig(configPath), config);
    }

    TEST(ScannerConfig, writeNoRoot)
    {
        TmpDirectory dir;
        const std::filesystem::path configPath{ dir.getPath() / "scanner.conf" };

        EXPECT_THROW(writeScannerConfig(configPath, ScannerConfig{}), InvalidScannerConfigException);
        EXPECT_FALSE(std::filesystem::exists(configPath));
    }
} // namespace gamus::scanner::tests
