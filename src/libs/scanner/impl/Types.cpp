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

#include "scanner/Types.hpp"

#include <tuple>

#include "core/String.hpp"

namespace shelf::scanner
{
    const char* toString(LibraryType type)
    {
        switch (type)
        {
        case LibraryType::Manga:
            return "manga";
        case LibraryType::Comic:
            return "comic";
        case LibraryType::Book:
            return "book";
        case LibraryType::Image:
            return "image";
        }
        return "";
    }

    const char* toString(SeriesFormat format)
    {
        switch (format)
        {
        case SeriesFormat::Unknown:
            return "unknown";
        case SeriesFormat::Image:
            return "image";
        case SeriesFormat::Archive:
            return "archive";
        case SeriesFormat::Epub:
            return "epub";
        case SeriesFormat::Pdf:
            return "pdf";
        }
        return "";
    }

    std::optional<LibraryType> parseLibraryType(std::string_view str)
    {
        for (LibraryType type : { LibraryType::Manga, LibraryType::Comic, LibraryType::Book, LibraryType::Image })
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(str, toString(type)))
                return type;
        }

        return std::nullopt;
    }

    void ParsedRecord::merge(const ParsedRecord& other)
    {
        if (chapters.empty() || chapters == defaultChapter)
            chapters = other.chapters;
        if (volumes.empty() || volumes == defaultVolume)
            volumes = other.volumes;
        isSpecial = isSpecial || other.isSpecial;
    }

    bool SeriesIdentity::operator==(const SeriesIdentity& other) const
    {
        return format == other.format && normalizedName == other.normalizedName;
    }

    bool SeriesIdentity::operator<(const SeriesIdentity& other) const
    {
        return std::tie(format, normalizedName) < std::tie(other.format, other.normalizedName);
    }
} // namespace shelf::scanner
