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
#include <optional>

#include "scanner/Types.hpp"

namespace shelf::scanner
{
    class IFileSystem;

    // Turns a library file into a record
    // parse and getEmbeddedMetadata may be called concurrently
    class IFileParser
    {
    public:
        virtual ~IFileParser() = default;

        // nullptr if the file cannot be parsed
        // Throws FileNotFoundException if the file does not exist
        virtual std::unique_ptr<ParsedRecord> parse(const std::filesystem::path& file, const std::filesystem::path& scanRoot, LibraryType libraryType) = 0;

        virtual std::optional<EmbeddedMetadata> getEmbeddedMetadata(const std::filesystem::path& file) = 0;
    };

    // Parser relying on file and folder names only (no embedded metadata)
    std::unique_ptr<IFileParser> createFilenameParser(const IFileSystem& fileSystem);
} // namespace shelf::scanner
