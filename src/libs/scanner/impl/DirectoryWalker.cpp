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

#include "scanner/DirectoryWalker.hpp"

#include <algorithm>

#include "core/ILogger.hpp"

#include "scanner/Exception.hpp"
#include "scanner/FileNameUtils.hpp"
#include "scanner/IFileSystem.hpp"
#include "FileCallbackQueue.hpp"

namespace shelf::scanner
{
    DirectoryWalker::DirectoryWalker(const IFileSystem& fileSystem, std::string_view ignoreFileName, std::size_t threadCount)
        : _fileSystem{ fileSystem }
        , _ignoreFileName{ ignoreFileName }
        , _threadCount{ std::max<std::size_t>(threadCount, 1) }
    {
    }

    std::vector<std::filesystem::path> DirectoryWalker::scanFiles(const std::filesystem::path& root, const IgnoreMatcher* matcher) const
    {
        std::vector<std::filesystem::path> files;
        if (!_fileSystem.isDirectory(root))
            return files;

        collectFiles(root, matcher ? *matcher : IgnoreMatcher{}, fileNameUtils::getSupportedExtensions(), files);
        return files;
    }

    void DirectoryWalker::processFiles(const std::filesystem::path& folder, bool isLibraryFolder, const FolderAction& folderAction) const
    {
        if (!isLibraryFolder)
        {
            const std::vector<std::filesystem::path> files{ scanFiles(folder) };
            folderAction(files, folder);
            return;
        }

        const IgnoreMatcher matcher{ loadMatcher(folder, nullptr) };

        for (const std::filesystem::path& directory : _fileSystem.getDirectories(folder))
        {
            if (isSkippedDirectory(directory, matcher))
                continue;

            const std::vector<std::filesystem::path> files{ scanFiles(directory, &matcher) };
            folderAction(files, directory);
        }

        std::vector<std::filesystem::path> rootFiles;
        for (const std::filesystem::path& file : _fileSystem.getFiles(folder, fileNameUtils::getSupportedExtensions(), false))
        {
            if (!fileNameUtils::isMacOsMetadataFile(file) && !matcher.matches(file))
                rootFiles.push_back(file);
        }

        if (!rootFiles.empty())
            folderAction(rootFiles, folder);
    }

    std::size_t DirectoryWalker::traverseParallel(const std::filesystem::path& root, const FileCallback& onFile, std::span<const std::string_view> extensions) const
    {
        if (!_fileSystem.isDirectory(root))
            throw RootNotFoundException{ root };

        std::vector<std::filesystem::path> files;
        collectFiles(root, IgnoreMatcher{}, extensions, files);

        SHELF_LOG(SCANNER, DEBUG, "Found " << files.size() << " file(s) in '" << root.string() << "'");

        FileCallbackQueue queue{ _threadCount, onFile };
        for (const std::filesystem::path& file : files)
        {
            queue.push(file);
            queue.wait(_threadCount * 2);
        }
        queue.wait();

        if (queue.getFailureCount() > 0)
            SHELF_LOG(SCANNER, ERROR, queue.getFailureCount() << " file(s) could not be processed in '" << root.string() << "'");

        return files.size();
    }

    void DirectoryWalker::collectFiles(const std::filesystem::path& directory, const IgnoreMatcher& inheritedMatcher, std::span<const std::string_view> extensions, std::vector<std::filesystem::path>& files) const
    {
        const IgnoreMatcher matcher{ loadMatcher(directory, &inheritedMatcher) };

        for (const std::filesystem::path& file : _fileSystem.getFiles(directory, extensions, false))
        {
            if (fileNameUtils::isMacOsMetadataFile(file))
                continue;

            if (matcher.matches(file))
            {
                SHELF_LOG(SCANNER, DEBUG, "Ignoring file '" << file.string() << "'");
                continue;
            }

            files.push_back(file);
        }

        for (const std::filesystem::path& subDirectory : _fileSystem.getDirectories(directory))
        {
            if (isSkippedDirectory(subDirectory, matcher))
                continue;

            collectFiles(subDirectory, matcher, extensions, files);
        }
    }

    IgnoreMatcher DirectoryWalker::loadMatcher(const std::filesystem::path& directory, const IgnoreMatcher* inheritedMatcher) const
    {
        IgnoreMatcher matcher;
        if (inheritedMatcher)
            matcher = *inheritedMatcher;

        if (std::optional<IgnoreMatcher> folderMatcher{ IgnoreMatcher::load(_fileSystem, directory, _ignoreFileName) })
            matcher.merge(*folderMatcher);

        return matcher;
    }

    bool DirectoryWalker::isSkippedDirectory(const std::filesystem::path& directory, const IgnoreMatcher& matcher) const
    {
        if (fileNameUtils::isExcludedDirectory(directory))
            return true;

        if (matcher.matches(directory))
        {
            SHELF_LOG(SCANNER, DEBUG, "Ignoring directory '" << directory.string() << "'");
            return true;
        }

        return false;
    }
} // namespace shelf::scanner
