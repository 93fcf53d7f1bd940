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

#include "scanner/IFileParser.hpp"

namespace shelf::scanner
{
    class FilenameParser final : public IFileParser
    {
    public:
        FilenameParser(const IFileSystem& fileSystem);
        ~FilenameParser() override = default;
        FilenameParser(const FilenameParser&) = delete;
        FilenameParser& operator=(const FilenameParser&) = delete;

    private:
        std::unique_ptr<ParsedRecord> parse(const std::filesystem::path& file, const std::filesystem::path& scanRoot, LibraryType libraryType) override;
        std::optional<EmbeddedMetadata> getEmbeddedMetadata(const std::filesystem::path& file) override;

        const IFileSystem& _fileSystem;
    };
} // namespace shelf::scanner
