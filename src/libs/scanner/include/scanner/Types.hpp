/*
 * Copyright (C) 2026 Emeric Poupon
 *
 * This file is part of Shelf.
 *
 * Shelf is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Shelf is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Shelf.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shelf::scanner
{
    enum class LibraryType
    {
        Manga,
        Comic,
        Book,
        Image,
    };

    enum class SeriesFormat
    {
        Unknown,
        Image,
        Archive,
        Epub,
        Pdf,
    };

    const char* toString(LibraryType type);
    const char* toString(SeriesFormat format);
    std::optional<LibraryType> parseLibraryType(std::string_view str);

    // "No value" sentinels for volume and chapter designators
    inline constexpr std::string_view defaultVolume{ "0" };
    inline constexpr std::string_view defaultChapter{ "0" };

    // Metadata embedded in the file itself (ComicInfo.xml like)
    // Empty fields mean "not set"
    struct EmbeddedMetadata
    {
        std::string series;
        std::string localizedSeries;
        std::string seriesSort;
        std::string titleSort;
        std::string volume;
        std::string number;
        std::string format;
    };

    struct ParsedRecord
    {
        std::string series;
        std::string seriesSort;
        std::string localizedSeries;
        std::string volumes{ defaultVolume };
        std::string chapters{ defaultChapter };
        std::string title;
        std::string filename;
        std::filesystem::path fullFilePath;
        SeriesFormat format{ SeriesFormat::Unknown };
        bool isSpecial{};
        std::optional<EmbeddedMetadata> embeddedMetadata;

        // Fills in the designators this record lacks from other
        void merge(const ParsedRecord& other);
    };

    // Aggregation key: ordered and compared on format and normalized name only,
    // folderPath being widened as records are added
    struct SeriesIdentity
    {
        std::string name;
        std::string normalizedName;
        SeriesFormat format{ SeriesFormat::Unknown };
        std::filesystem::path folderPath;

        bool operator==(const SeriesIdentity& other) const;
        bool operator<(const SeriesIdentity& other) const;
    };

    using RecordList = std::vector<std::shared_ptr<ParsedRecord>>;
    using SeriesMap = std::map<SeriesIdentity, RecordList>;
} // namespace shelf::scanner
