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
#include <string>
#include <vector>

#include "scanner/IgnoreMatcher.hpp"
#include "scanner/Types.hpp"

namespace shelf::core
{
    class IConfig;
}

namespace shelf::scanner
{
    struct ScannerSettings
    {
        std::string ignoreFileName{ IgnoreMatcher::defaultIgnoreFileName };
        std::size_t threadCount{ 1 };

        bool operator==(const ScannerSettings& rhs) const = default;
    };

    struct LibraryInfo
    {
        std::string name;
        LibraryType type{ LibraryType::Manga };
        std::vector<std::filesystem::path> folders;
        bool scanByFolder{};
    };

    // "scanner-thread-count" set to 0 (default) means half of the hardware threads
    ScannerSettings loadScannerSettings(core::IConfig& config);

    // Throws scanner::Exception on bad library type
    LibraryInfo loadLibraryInfo(core::IConfig& config);
} // namespace shelf::scanner
