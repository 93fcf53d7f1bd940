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

#include "LocalFileSystem.hpp"

#include <algorithm>
#include <fstream>
#include <functional>

#include "core/ILogger.hpp"
#include "core/Path.hpp"

#include "scanner/Exception.hpp"

namespace shelf::scanner
{
    namespace
    {
        using ExploreCallback = std::function<void(const std::filesystem::directory_entry&)>;

        void exploreDirectory(const std::filesystem::path& directory, bool recursive, const ExploreCallback& cb)
        {
            std::error_code ec;
            std::filesystem::directory_iterator itPath{ directory, std::filesystem::directory_options::follow_directory_symlink, ec };
            if (ec)
            {
                SHELF_LOG(FILESYSTEM, ERROR, "Cannot explore directory '" << directory.string() << "': " << ec.message());
                return;
            }

            const std::filesystem::directory_iterator itEnd;
            while (itPath != itEnd)
            {
                const std::filesystem::directory_entry& entry{ *itPath };

                std::error_code entryEc;
                if (entry.is_directory(entryEc))
                {
                    cb(entry);
                    if (recursive)
                        exploreDirectory(entry.path(), recursive, cb);
                }
                else if (entry.is_regular_file(entryEc))
                    cb(entry);

                if (entryEc)
                    SHELF_LOG(FILESYSTEM, ERROR, "Cannot get status of '" << entry.path().string() << "': " << entryEc.message());

                itPath.increment(ec);
                if (ec)
                {
                    SHELF_LOG(FILESYSTEM, ERROR, "Cannot explore directory '" << directory.string() << "': " << ec.message());
                    break;
                }
            }
        }
    } // namespace

    std::unique_ptr<IFileSystem> createLocalFileSystem()
    {
        return std::make_unique<LocalFileSystem>();
    }

    bool LocalFileSystem::isDirectory(const std::filesystem::path& p) const
    {
        std::error_code ec;
        return std::filesystem::is_directory(p, ec);
    }

    bool LocalFileSystem::isFile(const std::filesystem::path& p) const
    {
        std::error_code ec;
        return std::filesystem::is_regular_file(p, ec);
    }

    std::vector<std::filesystem::path> LocalFileSystem::getDirectories(const std::filesystem::path& directory) const
    {
        std::vector<std::filesystem::path> res;

        exploreDirectory(directory, false, [&](const std::filesystem::directory_entry& entry) {
            std::error_code ec;
            if (entry.is_directory(ec))
                res.push_back(entry.path());
        });

        std::sort(std::begin(res), std::end(res));
        return res;
    }

    std::vector<std::filesystem::path> LocalFileSystem::getFiles(const std::filesystem::path& directory, std::span<const std::string_view> extensions, bool recursive) const
    {
        std::vector<std::filesystem::path> res;

        exploreDirectory(directory, recursive, [&](const std::filesystem::directory_entry& entry) {
            std::error_code ec;
            if (!entry.is_regular_file(ec))
                return;

            if (extensions.empty() || core::pathUtils::hasFileAnyExtension(entry.path(), extensions))
                res.push_back(entry.path());
        });

        std::sort(std::begin(res), std::end(res));
        return res;
    }

    std::vector<std::string> LocalFileSystem::readAllLines(const std::filesystem::path& file) const
    {
        std::ifstream ifs{ file };
        if (!ifs)
            throw IOException{ "Cannot open file '" + file.string() + "'", std::make_error_code(std::errc::no_such_file_or_directory) };

        std::vector<std::string> lines;
        std::string line;
        while (std::getline(ifs, line))
            lines.push_back(std::move(line));

        if (ifs.bad())
            throw IOException{ "Cannot read file '" + file.string() + "'", std::make_error_code(std::errc::io_error) };

        return lines;
    }
} // namespace shelf::scanner
