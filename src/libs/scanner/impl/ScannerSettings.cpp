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

#include "scanner/ScannerSettings.hpp"

#include <algorithm>
#include <thread>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"

#include "scanner/Exception.hpp"

namespace shelf::scanner
{
    ScannerSettings loadScannerSettings(core::IConfig& config)
    {
        ScannerSettings settings;

        settings.ignoreFileName = config.getString("ignore-file-name", IgnoreMatcher::defaultIgnoreFileName);

        settings.threadCount = config.getULong("scanner-thread-count", 0);
        if (settings.threadCount == 0)
            settings.threadCount = std::max<std::size_t>(std::thread::hardware_concurrency() / 2, 1);

        SHELF_LOG(CONFIG, DEBUG, "Scanner settings: ignore file name = '" << settings.ignoreFileName << "', thread count = " << settings.threadCount);

        return settings;
    }

    LibraryInfo loadLibraryInfo(core::IConfig& config)
    {
        LibraryInfo library;

        library.name = config.getString("library-name", "Library");

        const std::string_view libraryType{ config.getString("library-type", "manga") };
        const std::optional<LibraryType> type{ parseLibraryType(libraryType) };
        if (!type)
            throw Exception{ "Invalid library type '" + std::string{ libraryType } + "'" };
        library.type = *type;

        config.visitStrings("library-folders", [&](std::string_view folder) { library.folders.emplace_back(folder); }, {});
        library.scanByFolder = config.getBool("library-scan-by-folder", false);

        return library;
    }
} // namespace shelf::scanner
