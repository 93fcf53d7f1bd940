/*
 * Copyright (C) 2016 Emeric Poupon
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

namespace shelf::core::pathUtils
{
    // Check if file name ends with one of provided extensions (case insensitive, multi part extensions like ".tar.gz" allowed)
    bool hasFileAnyExtension(const std::filesystem::path& file, std::span<const std::string_view> extensions);

    // Forward slashes only, no duplicated separators, no trailing separator (except for root)
    std::string normalizePath(std::string_view path);

    std::filesystem::path getLongestCommonPath(const std::filesystem::path& path1, const std::filesystem::path& path2);
} // namespace shelf::core::pathUtils
