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

#include "services/scanner/ScannerConfig.hpp"

#include <algorithm>

#include <libconfig.h++>

#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "core/String.hpp"
#include "services/scanner/Exception.hpp"

namespace gamus::scanner
{
    namespace
    {
        constexpr const char* rootsSetting{ "roots" };
        constexpr const char* audioExtensionsSetting{ "audio-extensions" };
        constexpr const char* ignoreHiddenSetting{ "ignore-hidden" };
        constexpr const char* maxDepthSetting{ "max-depth" };

        std::vector<std::string> readStrings(const libconfig::Config& config, const char* setting)
        {
            std::vector<std::string> res;

            const libconfig::Setting& values{ config.lookup(setting) };
            if (!values.isArray() && !values.isList())
                throw InvalidScannerConfigException{ std::string{ "Setting '" } + setting + "' must be a list of strings" };

            for (int i{}; i < values.getLength(); ++i)
                res.emplace_back(static_cast<const char*>(values[i]));

            return res;
        }
    } // namespace

    std::vector<std::string> normalizeAudioExtensions(const std::vector<std::string>& extensions)
    {
        std::vector<std::string> res;

        for (const std::string& extension : extensions)
        {
            std::string_view trimmed{ core::stringUtils::stringTrim(extension) };
            if (!trimmed.empty() && trimmed.front() == '.')
                trimmed.remove_prefix(1);
            if (trimmed.empty())
                continue;

            std::string normalized{ core::stringUtils::stringToLower(trimmed) };
            if (std::find(std::cbegin(res), std::cend(res), normalized) == std::cend(res))
                res.push_back(std::move(normalized));
        }

        return res;
    }

    ScannerConfig readScannerConfig(const std::filesystem::path& configPath)
    {
        ScannerConfig res;

        std::error_code ec;
        if (!std::filesystem::exists(configPath, ec))
        {
            GAMUS_LOG(SCANNER, DEBUG, "No scanner config found at " << configPath << ", using defaults");
            return res;
        }

        libconfig::Config config;
        try
        {
            config.readFile(configPath.c_str());

            if (config.exists(rootsSetting))
            {
                for (std::string& root : readStrings(config, rootsSetting))
                    res.roots.emplace_back(std::move(root));
            }

            if (config.exists(audioExtensionsSetting))
                res.audioExtensions = normalizeAudioExtensions(readStrings(config, audioExtensionsSetting));
            else
                res.audioExtensions = normalizeAudioExtensions(res.audioExtensions);

            config.lookupValue(ignoreHiddenSetting, res.ignoreHidden);

            int maxDepth{};
            if (config.lookupValue(maxDepthSetting, maxDepth))
            {
                if (maxDepth < 0)
                    throw InvalidScannerConfigException{ "Setting 'max-depth' must be positive" };
                res.maxDepth = static_cast<unsigned>(maxDepth);
            }
        }
        catch (const libconfig::FileIOException&)
        {
            throw InvalidScannerConfigException{ "Cannot open scanner config file '" + configPath.string() + "'" };
        }
        catch (const libconfig::ParseException& e)
        {
            throw InvalidScannerConfigException{ "Cannot parse scanner config file '" + configPath.string() + "', line = " + std::to_string(e.getLine()) + ", error = '" + e.getError() + "'" };
        }
        catch (const libconfig::ConfigException& e)
        {
            throw InvalidScannerConfigException{ "Bad setting in scanner config file '" + configPath.string() + "': " + e.what() };
        }

        GAMUS_LOG_IF(SCANNER, WARNING, res.roots.empty(), "No root directory set in " << configPath << ": scans will have nothing to import");

        return res;
    }

    void writeScannerConfig(const std::filesystem::path& configPath, const ScannerConfig& config)
    {
        if (config.roots.empty())
            throw InvalidScannerConfigException{ "At least one root directory is required" };

        libconfig::Config out;
        try
        {
            libconfig::Setting& root{ out.getRoot() };

            libconfig::Setting& roots{ root.add(rootsSetting, libconfig::Setting::TypeArray) };
            for (const std::filesystem::path& path : config.roots)
                roots.add(libconfig::Setting::TypeString) = path.string();

            libconfig::Setting& extensions{ root.add(audioExtensionsSetting, libconfig::Setting::TypeArray) };
            for (const std::string& extension : normalizeAudioExtensions(config.audioExtensions))
                extensions.add(libconfig::Setting::TypeString) = extension;

            root.add(ignoreHiddenSetting, libconfig::Setting::TypeBoolean) = config.ignoreHidden;
            if (config.maxDepth)
                root.add(maxDepthSetting, libconfig::Setting::TypeInt) = static_cast<int>(*config.maxDepth);

            if (configPath.has_parent_path() && !core::pathUtils::ensureDirectory(configPath.parent_path()))
                throw InvalidScannerConfigException{ "Cannot create directory for scanner config file '" + configPath.string() + "'" };

            out.writeFile(configPath.c_str());
        }
        catch (const libconfig::FileIOException&)
        {
            throw InvalidScannerConfigException{ "Cannot write scanner config file '" + configPath.string() + "'" };
        }
        catch (const libconfig::ConfigException& e)
        {
            throw InvalidScannerConfigException{ "Cannot build scanner config: " + std::string{ e.what() } };
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            throw InvalidScannerConfigException{ "Cannot create directory for scanner config file '" + configPath.string() + "': " + e.what() };
        }

        GAMUS_LOG(SCANNER, INFO, "Scanner config saved to " << configPath);
    }
} // namespace gamus::scanner
