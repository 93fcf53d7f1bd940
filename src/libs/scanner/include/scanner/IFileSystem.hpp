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
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace shelf::scanner
{
    // Filesystem primitives used by the scanner
    // Enumeration errors are logged and degrade to partial or empty results
    class IFileSystem
    {
    public:
        virtual ~IFileSystem() = default;

        virtual bool isDirectory(const std::filesystem::path& p) const = 0;
        virtual bool isFile(const std::filesystem::path& p) const = 0;

        // Immediate sub directories, sorted
        virtual std::vector<std::filesystem::path> getDirectories(const std::filesystem::path& directory) const = 0;

        // Files having one of the given extensions (all files if extensions is empty), sorted
        virtual std::vector<std::filesystem::path> getFiles(const std::filesystem::path& directory, std::span<const std::string_view> extensions, bool recursive) const = 0;

        // Throws IOException if the file cannot be read
        virtual std::vector<std::string> readAllLines(const std::filesystem::path& file) const = 0;
    };

    std::unique_ptr<IFileSystem> createLocalFileSystem();
} // namespace shelf::scanner
