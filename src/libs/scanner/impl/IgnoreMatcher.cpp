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

#include "scanner/IgnoreMatcher.hpp"

#include <fnmatch.h>

#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "core/String.hpp"

#include "scanner/Exception.hpp"
#include "scanner/IFileSystem.hpp"

namespace shelf::scanner
{
    namespace
    {
        bool globMatch(const std::string& pattern, const std::string& str)
        {
            // no FNM_PATHNAME: '*' crosses separators
            return ::fnmatch(pattern.c_str(), str.c_str(), 0) == 0;
        }
    } // namespace

    std::optional<IgnoreMatcher> IgnoreMatcher::load(const IFileSystem& fileSystem, const std::filesystem::path& folder, std::string_view ignoreFileName)
    {
        const std::filesystem::path ignoreFile{ folder / ignoreFileName };
        if (!fileSystem.isFile(ignoreFile))
            return std::nullopt;

        std::vector<std::string> lines;
        try
        {
            lines = fileSystem.readAllLines(ignoreFile);
        }
        catch (const IOException& e)
        {
            SHELF_LOG(SCANNER, ERROR, "Cannot read ignore file '" << ignoreFile.string() << "': " << e.what());
            return std::nullopt;
        }

        IgnoreMatcher matcher;
        for (std::string_view line : lines)
            matcher.addPattern(line);

        if (matcher.empty())
        {
            SHELF_LOG(SCANNER, WARNING, "Ignore file '" << ignoreFile.string() << "' is empty");
            return std::nullopt;
        }

        SHELF_LOG(SCANNER, DEBUG, "Loaded " << matcher.getPatternCount() << " ignore pattern(s) from '" << ignoreFile.string() << "'");
        return matcher;
    }

    void IgnoreMatcher::addPattern(std::string_view pattern)
    {
        pattern = core::stringUtils::stringTrim(pattern);
        if (pattern.empty() || pattern.front() == '#')
            return;

        _patterns.emplace_back(pattern);
    }

    void IgnoreMatcher::merge(const IgnoreMatcher& other)
    {
        _patterns.insert(std::end(_patterns), std::cbegin(other._patterns), std::cend(other._patterns));
    }

    bool IgnoreMatcher::matches(const std::filesystem::path& path) const
    {
        if (_patterns.empty())
            return false;

        const std::string normalizedPath{ core::pathUtils::normalizePath(path.string()) };
        const std::size_t lastSeparator{ normalizedPath.find_last_of('/') };
        const std::string fileName{ lastSeparator == std::string::npos ? normalizedPath : normalizedPath.substr(lastSeparator + 1) };

        for (const std::string& pattern : _patterns)
        {
            if (globMatch(pattern, normalizedPath) || globMatch(pattern, fileName))
                return true;
        }

        return false;
    }
} // namespace shelf::scanner
