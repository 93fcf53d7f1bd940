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

#include "TestFileSystem.hpp"

#include "core/Path.hpp"

#include "scanner/Exception.hpp"

namespace shelf::scanner::tests
{
    namespace
    {
        bool isInDirectory(const std::filesystem::path& p, const std::filesystem::path& directory, bool recursive)
        {
            if (!recursive)
                return p.parent_path() == directory;

            for (std::filesystem::path parent{ p.parent_path() }; !parent.empty(); parent = parent.parent_path())
            {
                if (parent == directory)
                    return true;
                if (parent == parent.root_path())
                    break;
            }

            return false;
        }
    } // namespace

    void TestFileSystem::addFile(const std::filesystem::path& file, std::vector<std::string> lines)
    {
        addDirectory(file.parent_path());
        _files[file] = std::move(lines);
    }

    void TestFileSystem::addDirectory(const std::filesystem::path& directory)
    {
        for (std::filesystem::path p{ directory }; !p.empty(); p = p.parent_path())
        {
            _directories.insert(p);
            if (p == p.root_path())
                break;
        }
    }

    void TestFileSystem::removeFile(const std::filesystem::path& file)
    {
        _files.erase(file);
    }

    bool TestFileSystem::isDirectory(const std::filesystem::path& p) const
    {
        return _directories.contains(p);
    }

    bool TestFileSystem::isFile(const std::filesystem::path& p) const
    {
        return _files.contains(p);
    }

    std::vector<std::filesystem::path> TestFileSystem::getDirectories(const std::filesystem::path& directory) const
    {
        std::vector<std::filesystem::path> res;
        for (const std::filesystem::path& p : _directories)
        {
            if (p != directory && isInDirectory(p, directory, false))
                res.push_back(p);
        }

        return res;
    }

    std::vector<std::filesystem::path> TestFileSystem::getFiles(const std::filesystem::path& directory, std::span<const std::string_view> extensions, bool recursive) const
    {
        std::vector<std::filesystem::path> res;
        for (const auto& [file, lines] : _files)
        {
            if (!isInDirectory(file, directory, recursive))
                continue;

            if (extensions.empty() || core::pathUtils::hasFileAnyExtension(file, extensions))
                res.push_back(file);
        }

        return res;
    }

    std::vector<std::string> TestFileSystem::readAllLines(const std::filesystem::path& file) const
    {
        auto it{ _files.find(file) };
        if (it == std::cend(_files))
            throw IOException{ "Cannot open file '" + file.string() + "'", std::make_error_code(std::errc::no_such_file_or_directory) };

        return it->second;
    }
} // namespace shelf::scanner::tests
