/*
 * Copyright (C) 2013 Emeric Poupon
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

#include "Config.hpp"

#include "core/Exception.hpp"
#include "core/ILogger.hpp"

namespace gamus::core
{
    std::unique_ptr<IConfig> createConfig(const std::filesystem::path& p)
    {
        return std::make_unique<Config>(p);
    }

    Config::Config(const std::filesystem::path& p)
        : _path{ p }
    {
        // lets integer settings be read whatever their written width
        _config.setAutoConvert(true);

        try
        {
            _config.readFile(p.c_str());
        }
        catch (const libconfig::FileIOException&)
        {
            throw GamusException{ "Cannot open config file '" + p.string() + "'" };
        }
        catch (const libconfig::ParseException& e)
        {
            throw GamusException{ "Cannot parse config file '" + p.string() + "', line = " + std::to_string(e.getLine()) + ", error = '" + e.getError() + "'" };
        }

        GAMUS_LOG(CONFIG, DEBUG, "Using config file " << _path);
    }

    template<typename T>
    T Config::lookup(std::string_view setting, T def) const
    {
        try
        {
            return _config.lookup(std::string{ setting });
        }
        catch (const libconfig::SettingNotFoundException&)
        {
            return def;
        }
        catch (const libconfig::SettingTypeException&)
        {
            throw GamusException{ "Setting '" + std::string{ setting } + "' in config file '" + _path.string() + "' has the wrong type" };
        }
    }

    std::string_view Config::getString(std::string_view setting, std::string_view def)
    {
        const char* res{ lookup<const char*>(setting, nullptr) };
        return res ? std::string_view{ res } : def;
    }

    std::filesystem::path Config::getPath(std::string_view setting, const std::filesystem::path& def)
    {
        const char* res{ lookup<const char*>(setting, nullptr) };
        return res ? std::filesystem::path{ res } : def;
    }

    unsigned long Config::getULong(std::string_view setting, unsigned long def)
    {
        const long long res{ lookup<long long>(setting, static_cast<long long>(def)) };
        if (res < 0)
            throw GamusException{ "Setting '" + std::string{ setting } + "' in config file '" + _path.string() + "' must not be negative" };

        return static_cast<unsigned long>(res);
    }

    bool Config::getBool(std::string_view setting, bool def)
    {
        return lookup<bool>(setting, def);
    }
} // namespace gamus::core
