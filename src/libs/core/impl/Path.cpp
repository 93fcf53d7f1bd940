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

#include "core/Path.hpp"

#include <algorithm>

#include "core/String.hpp"

namespace shelf::core::pathUtils
{
    bool hasFileAnyExtension(const std::filesystem::path& file, std::span<const std::string_view> supportedExtensions)
    {
        const std::string fileName{ stringUtils::stringToLower(file.filename().string()) };

        return std::any_of(std::cbegin(supportedExtensions), std::cend(supportedExtensions), [&](std::string_view extension) {
            // the extension alone is a hidden file, not a match
            return fileName.size() > extension.size() && stringUtils::stringEndsWith(fileName, stringUtils::stringToLower(extension));
        });
    }

    std::string normalizePath(std::string_view path)
    {
        std::string normalized;
        normalized.reserve(path.size());

        for (const char c : path)
        {
            const char sanitized{ c == '\\' ? '/' : c };
            if (sanitized == '/' && !normalized.empty() && normalized.back() == '/')
                continue;

            normalized.push_back(sanitized);
        }

        if (normalized.size() > 1 && normalized.back() == '/')
            normalized.pop_back();

        return normalized;
    }

    std::filesystem::path getLongestCommonPath(const std::filesystem::path& path1, const std::filesystem::path& path2)
    {
        std::filesystem::path longestCommonPath;

        auto it1{ path1.begin() };
        auto it2{ path2.begin() };

        while (it1 != std::cend(path1) && it2 != std::cend(path2) && *it1 == *it2)
        {
            longestCommonPath /= *it1;
            ++it1;
            ++it2;
        }

        return longestCommonPath;
    }
} // namespace shelf::core::pathUtils
