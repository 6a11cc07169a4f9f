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

#include "TagReader.hpp"

#include <taglib/apetag.h>
#include <taglib/fileref.h>
#include <taglib/id3v2tag.h>
#include <taglib/mp4file.h>
#include <taglib/mpcfile.h>
#include <taglib/mpegfile.h>
#include <taglib/tfile.h>
#include <taglib/tpropertymap.h>
#include <taglib/wavpackfile.h>

#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace gamus::audio::taglib
{
    namespace
    {
        void mergeProperties(TagMap& dst, const ::TagLib::PropertyMap& properties)
        {
            for (const auto& [key, values] : properties)
            {
                if (values.isEmpty())
                    continue;

                dst.try_emplace(core::stringUtils::stringToLower(key.to8Bit(true)), values.front().to8Bit(true));
            }
        }
    } // namespace

    TagMap readTags(const std::filesystem::path& path, bool enableExtraDebugLogs)
    {
        TagMap res;

        ::TagLib::FileRef fileRef{ path.c_str(), false /* no audio properties */ };
        if (fileRef.isNull() || !fileRef.file() || !fileRef.file()->isValid())
        {
            GAMUS_LOG(METADATA, DEBUG, "TagLib cannot parse " << path);
            return res;
        }

        ::TagLib::File& file{ *fileRef.file() };
        const ::TagLib::PropertyMap propertyMap{ file.properties() };

        if (enableExtraDebugLogs)
        {
            for (const auto& [key, values] : propertyMap)
            {
                for (const auto& value : values)
                    GAMUS_LOG(METADATA, DEBUG, "Key = '" << key.to8Bit(true) << "', value = '" << value.to8Bit(true) << "'");
            }

            for (const auto& value : propertyMap.unsupportedData())
                GAMUS_LOG(METADATA, DEBUG, "Unknown value: '" << value.to8Bit(true) << "'");
        }

        mergeProperties(res, propertyMap);

        // Some tags may not be known by TagLib
        auto getAPETags = [&](const ::TagLib::APE::Tag* apeTag) {
            if (!apeTag)
                return;

            mergeProperties(res, apeTag->properties());
        };

        if (::TagLib::MPEG::File * mp3File{ dynamic_cast<::TagLib::MPEG::File*>(&file) })
        {
            getAPETags(mp3File->APETag());
        }
        else if (::TagLib::MP4::File * mp4File{ dynamic_cast<::TagLib::MP4::File*>(&file) })
        {
            if (!res.contains("originaldate") && mp4File->tag())
            {
                // TagLib 2.0 only parses ----:com.apple.iTunes:ORIGINALDATE, older versions the lower case one
                const auto& items{ mp4File->tag()->itemMap() };
                for (const auto& origDateString : { "----:com.apple.iTunes:originaldate", "----:com.apple.iTunes:ORIGINALDATE" })
                {
                    auto itOrigDate{ items.find(origDateString) };
                    if (itOrigDate == std::cend(items))
                        continue;

                    const ::TagLib::StringList dates{ itOrigDate->second.toStringList() };
                    if (!dates.isEmpty())
                    {
                        res["originaldate"] = dates.front().to8Bit(true);
                        break;
                    }
                }
            }
        }
        else if (::TagLib::MPC::File * mpcFile{ dynamic_cast<::TagLib::MPC::File*>(&file) })
        {
            getAPETags(mpcFile->APETag());
        }
        else if (::TagLib::WavPack::File * wavPackFile{ dynamic_cast<::TagLib::WavPack::File*>(&file) })
        {
            getAPETags(wavPackFile->APETag());
        }

        return res;
    }
} // namespace gamus::audio::taglib
