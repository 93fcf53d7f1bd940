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
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "scanner/IgnoreMatcher.hpp"

namespace shelf::scanner
{
    class IFileSystem;

    // Enumerates the eligible files of a library, honoring ignore files and
    // skipping OS housekeeping directories and files
    class DirectoryWalker
    {
    public:
        using FolderAction = std::function<void(std::span<const std::filesystem::path> files, const std::filesystem::path& folder)>;
        using FileCallback = std::function<void(const std::filesystem::path& file)>;

        DirectoryWalker(const IFileSystem& fileSystem, std::string_view ignoreFileName, std::size_t threadCount);

        // All supported files under root (recursive), empty if root does not exist
        std::vector<std::filesystem::path> scanFiles(const std::filesystem::path& root, const IgnoreMatcher* matcher = nullptr) const;

        // Library folder: each immediate sub directory is a batch, as well as the files located directly in the folder
        // Otherwise, the whole folder is a single batch
        void processFiles(const std::filesystem::path& folder, bool isLibraryFolder, const FolderAction& folderAction) const;

        // Calls onFile for each file having one of the extensions, using threadCount threads
        // Returns the number of files found
        // Throws RootNotFoundException if root is not a directory
        std::size_t traverseParallel(const std::filesystem::path& root, const FileCallback& onFile, std::span<const std::string_view> extensions) const;

    private:
        void collectFiles(const std::filesystem::path& directory, const IgnoreMatcher& inheritedMatcher, std::span<const std::string_view> extensions, std::vector<std::filesystem::path>& files) const;
        IgnoreMatcher loadMatcher(const std::filesystem::path& directory, const IgnoreMatcher* inheritedMatcher) const;
        bool isSkippedDirectory(const std::filesystem::path& directory, const IgnoreMatcher& matcher) const;

        const IFileSystem& _fileSystem;
        const std::string _ignoreFileName;
        const std::size_t _threadCount;
    };
} // namespace shelf::scanner
