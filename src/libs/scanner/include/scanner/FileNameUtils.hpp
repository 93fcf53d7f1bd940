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
#include <span>
#include <string>
#include <string_view>

#include "scanner/Types.hpp"

// Stateless predicates on file and directory names
namespace shelf::scanner::fileNameUtils
{
    std::span<const std::string_view> getSupportedExtensions();

    bool isArchive(const std::filesystem::path& file);
    bool isEpub(const std::filesystem::path& file);
    bool isPdf(const std::filesystem::path& file);
    bool isImage(const std::filesystem::path& file);
    bool isSupported(const std::filesystem::path& file);

    // "cover.jpg", "Series - Cover.png", "folder.jpg" but not "backcover.jpg"
    bool isCoverImage(const std::filesystem::path& file);

    // "._file.cbz" files left by macOS
    bool isMacOsMetadataFile(const std::filesystem::path& file);

    // NAS and OS housekeeping directories (@eaDir, __MACOSX, ...)
    bool isExcludedDirectory(const std::filesystem::path& directory);

    // Embedded "format" field denoting a special (one-shot, omake, annual...)
    bool hasSpecialFormatMarker(std::string_view format);

    SeriesFormat getSeriesFormat(const std::filesystem::path& file);

    // Volume designator found in str (without leading zeroes), defaultVolume if none
    std::string parseVolume(std::string_view str);

    // Chapter designator found in str (without leading zeroes), defaultChapter if none
    std::string parseChapter(std::string_view str);

    // Text preceding the first volume or chapter designator, bracketed groups removed
    // "Accel_World_v01_c003_(2012)" -> "Accel World", "Vol.02" -> ""
    std::string parseSeries(std::string_view str);
} // namespace shelf::scanner::fileNameUtils
