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
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shelf::scanner
{
    class IFileSystem;

    // Exclusion globs read from per folder ignore files
    // '*' also matches directory separators
    class IgnoreMatcher
    {
    public:
        static constexpr std::string_view defaultIgnoreFileName{ ".shelfignore" };

        // nullopt if the folder has no ignore file or if it is empty
        static std::optional<IgnoreMatcher> load(const IFileSystem& fileSystem, const std::filesystem::path& folder, std::string_view ignoreFileName = defaultIgnoreFileName);

        void addPattern(std::string_view pattern);
        void merge(const IgnoreMatcher& other);

        bool matches(const std::filesystem::path& path) const;

        bool empty() const { return _patterns.empty(); }
        std::size_t getPatternCount() const { return _patterns.size(); }

    private:
        std::vector<std::string> _patterns;
    };
} // namespace shelf::scanner
