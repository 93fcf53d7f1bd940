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

#include "scanner/IFileSystem.hpp"

namespace shelf::scanner
{
    class LocalFileSystem final : public IFileSystem
    {
    public:
        LocalFileSystem() = default;
        ~LocalFileSystem() override = default;
        LocalFileSystem(const LocalFileSystem&) = delete;
        LocalFileSystem& operator=(const LocalFileSystem&) = delete;

    private:
        bool isDirectory(const std::filesystem::path& p) const override;
        bool isFile(const std::filesystem::path& p) const override;
        std::vector<std::filesystem::path> getDirectories(const std::filesystem::path& directory) const override;
        std::vector<std::filesystem::path> getFiles(const std::filesystem::path& directory, std::span<const std::string_view> extensions, bool recursive) const override;
        std::vector<std::string> readAllLines(const std::filesystem::path& file) const override;
    };
} // namespace shelf::scanner
