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

#include <algorithm>
#include <array>
#include <map>
#include <mutex>
#include <stdexcept>

#include <gtest/gtest.h>

#include "scanner/DirectoryWalker.hpp"
#include "scanner/Exception.hpp"
#include "scanner/FileNameUtils.hpp"

#include "RecordingLogger.hpp"
#include "TestFileSystem.hpp"

namespace shelf::scanner::tests
{
    namespace
    {
        std::vector<std::filesystem::path> sorted(std::vector<std::filesystem::path> paths)
        {
            std::sort(std::begin(paths), std::end(paths));
            return paths;
        }
    } // namespace

    TEST(DirectoryWalker, scanFiles)
    {
        TestFileSystem fileSystem;
        fileSystem.addFile("/lib/Accel World/Accel World v01.cbz");
        fileSystem.addFile("/lib/Accel World/Accel World v02.cbz");
        fileSystem.addFile("/lib/Accel World/Extras/Accel World SP01.cbz");
        fileSystem.addFile("/lib/Accel World/ComicInfo.xml");
        fileSystem.addFile("/lib/Accel World/._Accel World v01.cbz");
        fileSystem.addFile("/lib/Accel World/@eaDir/Accel World v01.cbz");
        fileSystem.addFile("/lib/Accel World/__MACOSX/Accel World v02.cbz");
        fileSystem.addFile("/lib/Sword Art Online/SAO v01.epub");
        fileSystem.addFile("/lib/Sword Art Online/Deep/Deeper/SAO v02.pdf");
        fileSystem.addFile("/lib/cover.jpg");
        fileSystem.addDirectory("/lib/Empty");

        const DirectoryWalker walker{ fileSystem, ".shelfignore", 1 };

        const std::vector<std::filesystem::path> files{ walker.scanFiles("/lib") };
        const std::vector<std::filesystem::path> expectedFiles{
            "/lib/Accel World/Accel World v01.cbz",
            "/lib/Accel World/Accel World v02.cbz",
            "/lib/Accel World/Extras/Accel World SP01.cbz",
            "/lib/Sword Art Online/Deep/Deeper/SAO v02.pdf",
            "/lib/Sword Art Online/SAO v01.epub",
            "/lib/cover.jpg",
        };
        EXPECT_EQ(sorted(files), expectedFiles);

        EXPECT_EQ(walker.scanFiles("/lib/Empty").size(), 0);
        EXPECT_EQ(walker.scanFiles("/lib/Accel World/Extras").size(), 1);
    }

    TEST(DirectoryWalker, scanFiles_missingRoot)
    {
        TestFileSystem fileSystem;
        fileSystem.addFile("/lib/Accel World/Accel World v01.cbz");

        const DirectoryWalker walker{ fileSystem, ".shelfignore", 1 };
        EXPECT_TRUE(walker.scanFiles("/other").empty());
        EXPECT_TRUE(walker.scanFiles("/lib/Accel World/Accel World v01.cbz").empty());
    }

    TEST(DirectoryWalker, scanFiles_eachFileOnce)
    {
        TestFileSystem fileSystem;

        std::vector<std::filesystem::path> expectedFiles;
        for (std::size_t i{}; i < 5; ++i)
        {
            for (std::size_t j{}; j < 4; ++j)
            {
                const std::filesystem::path file{ "/lib/Series " + std::to_string(i) + "/Sub " + std::to_string(j) + "/v0" + std::to_string(j) + ".cbz" };
                fileSystem.addFile(file);
                expectedFiles.push_back(file);
            }
        }

        const DirectoryWalker walker{ fileSystem, ".shelfignore", 1 };
        const std::vector<std::filesystem::path> files{ walker.scanFiles("/lib") };

        EXPECT_EQ(files.size(), expectedFiles.size());
        EXPECT_EQ(sorted(files), sorted(expectedFiles));
    }

    TEST(DirectoryWalker, scanFiles_ignoreFiles)
    {
        TestFileSystem fileSystem;
        fileSystem.addFile("/lib/.shelfignore", { "Extras", "*.pdf" });
        fileSystem.addFile("/lib/Accel World/Accel World v01.cbz");
        fileSystem.addFile("/lib/Accel World/Accel World v01.pdf");
        fileSystem.addFile("/lib/Accel World/Extras/Accel World SP01.cbz");
        fileSystem.addFile("/lib/Sword Art Online/.shelfignore", { "*.epub" });
        fileSystem.addFile("/lib/Sword Art Online/SAO v01.epub");
        fileSystem.addFile("/lib/Sword Art Online/SAO v01.cbz");
        fileSystem.addFile("/lib/Sword Art Online/Extras/SAO SP01.cbz");
        fileSystem.addFile("/lib/Toradora/Toradora v01.epub");

        const DirectoryWalker walker{ fileSystem, ".shelfignore", 1 };

        const std::vector<std::filesystem::path> expectedFiles{
            "/lib/Accel World/Accel World v01.cbz",
            "/lib/Sword Art Online/SAO v01.cbz",
            "/lib/Toradora/Toradora v01.epub",
        };
        EXPECT_EQ(sorted(walker.scanFiles("/lib")), expectedFiles);

        // Scanning a sub folder directly does not apply the parent ignore file
        const std::vector<std::filesystem::path> expectedSubFolderFiles{
            "/lib/Accel World/Accel World v01.cbz",
            "/lib/Accel World/Accel World v01.pdf",
            "/lib/Accel World/Extras/Accel World SP01.cbz",
        };
        EXPECT_EQ(sorted(walker.scanFiles("/lib/Accel World")), expectedSubFolderFiles);
    }

    TEST(DirectoryWalker, scanFiles_inheritedMatcher)
    {
        TestFileSystem fileSystem;
        fileSystem.addFile("/lib/Accel World/Accel World v01.cbz");
        fileSystem.addFile("/lib/Accel World/Accel World v01.pdf");

        IgnoreMatcher matcher;
        matcher.addPattern("*.pdf");

        const DirectoryWalker walker{ fileSystem, ".shelfignore", 1 };
        const std::vector<std::filesystem::path> files{ walker.scanFiles("/lib/Accel World", &matcher) };
        ASSERT_EQ(files.size(), 1);
        EXPECT_EQ(files.front(), "/lib/Accel World/Accel World v01.cbz");
    }

    TEST(DirectoryWalker, processFiles_libraryFolder)
    {
        TestFileSystem fileSystem;
        fileSystem.addFile("/lib/.shelfignore", { "Ignored" });
        fileSystem.addFile("/lib/Accel World/Accel World v01.cbz");
        fileSystem.addFile("/lib/Accel World/Accel World v02.cbz");
        fileSystem.addFile("/lib/Accel World/Extras/Accel World SP01.cbz");
        fileSystem.addFile("/lib/Sword Art Online/SAO v01.epub");
        fileSystem.addFile("/lib/Ignored/Ignored v01.cbz");
        fileSystem.addFile("/lib/@eaDir/Thumb v01.cbz");
        fileSystem.addFile("/lib/Toradora v01.cbz");
        fileSystem.addDirectory("/lib/Empty");

        const DirectoryWalker walker{ fileSystem, ".shelfignore", 1 };

        std::map<std::filesystem::path, std::vector<std::filesystem::path>> batches;
        walker.processFiles("/lib", true, [&](std::span<const std::filesystem::path> files, const std::filesystem::path& folder) {
            EXPECT_FALSE(batches.contains(folder));
            batches[folder] = sorted(std::vector<std::filesystem::path>(std::cbegin(files), std::cend(files)));
        });

        ASSERT_EQ(batches.size(), 4);

        const std::vector<std::filesystem::path> expectedAccelWorld{
            "/lib/Accel World/Accel World v01.cbz",
            "/lib/Accel World/Accel World v02.cbz",
            "/lib/Accel World/Extras/Accel World SP01.cbz",
        };
        EXPECT_EQ(batches["/lib/Accel World"], expectedAccelWorld);
        EXPECT_EQ(batches["/lib/Sword Art Online"], std::vector<std::filesystem::path>{ "/lib/Sword Art Online/SAO v01.epub" });
        EXPECT_EQ(batches["/lib"], std::vector<std::filesystem::path>{ "/lib/Toradora v01.cbz" });
        EXPECT_TRUE(batches["/lib/Empty"].empty());
    }

    TEST(DirectoryWalker, processFiles_singleFolder)
    {
        TestFileSystem fileSystem;
        fileSystem.addFile("/lib/Accel World/Accel World v01.cbz");
        fileSystem.addFile("/lib/Accel World/Extras/Accel World SP01.cbz");
        fileSystem.addFile("/lib/Sword Art Online/SAO v01.epub");

        const DirectoryWalker walker{ fileSystem, ".shelfignore", 1 };

        std::size_t batchCount{};
        walker.processFiles("/lib/Accel World", false, [&](std::span<const std::filesystem::path> files, const std::filesystem::path& folder) {
            batchCount += 1;
            EXPECT_EQ(folder, "/lib/Accel World");
            EXPECT_EQ(files.size(), 2);
        });

        EXPECT_EQ(batchCount, 1);
    }

    TEST(DirectoryWalker, traverseParallel)
    {
        TestFileSystem fileSystem;
        fileSystem.addFile("/lib/.shelfignore", { "*.pdf" });

        std::vector<std::filesystem::path> expectedFiles;
        for (std::size_t i{}; i < 50; ++i)
        {
            const std::filesystem::path file{ "/lib/Series " + std::to_string(i % 7) + "/v" + std::to_string(i) + ".cbz" };
            fileSystem.addFile(file);
            expectedFiles.push_back(file);
        }
        fileSystem.addFile("/lib/Series 1/v01.pdf");
        fileSystem.addFile("/lib/Series 1/v01.txt");

        const DirectoryWalker walker{ fileSystem, ".shelfignore", 4 };

        std::mutex mutex;
        std::vector<std::filesystem::path> visitedFiles;
        const std::size_t fileCount{ walker.traverseParallel(
            "/lib", [&](const std::filesystem::path& file) {
                std::scoped_lock lock{ mutex };
                visitedFiles.push_back(file);
            },
            fileNameUtils::getSupportedExtensions()) };

        EXPECT_EQ(fileCount, expectedFiles.size());
        EXPECT_EQ(sorted(visitedFiles), sorted(expectedFiles));
    }

    TEST(DirectoryWalker, traverseParallel_extensions)
    {
        TestFileSystem fileSystem;
        fileSystem.addFile("/lib/Accel World/Accel World v01.cbz");
        fileSystem.addFile("/lib/Accel World/Accel World v01.epub");

        const DirectoryWalker walker{ fileSystem, ".shelfignore", 2 };

        constexpr std::array<std::string_view, 1> extensions{ ".epub" };
        std::vector<std::filesystem::path> visitedFiles;
        const std::size_t fileCount{ walker.traverseParallel("/lib", [&](const std::filesystem::path& file) { visitedFiles.push_back(file); }, extensions) };

        EXPECT_EQ(fileCount, 1);
        ASSERT_EQ(visitedFiles.size(), 1);
        EXPECT_EQ(visitedFiles.front(), "/lib/Accel World/Accel World v01.epub");
    }

    TEST(DirectoryWalker, traverseParallel_missingRoot)
    {
        TestFileSystem fileSystem;
        const DirectoryWalker walker{ fileSystem, ".shelfignore", 2 };

        EXPECT_THROW(walker.traverseParallel("/lib", [](const std::filesystem::path&) {}, fileNameUtils::getSupportedExtensions()), RootNotFoundException);
    }

    TEST(DirectoryWalker, traverseParallel_callbackError)
    {
        ScopedRecordingLogger logger;

        TestFileSystem fileSystem;
        for (std::size_t i{}; i < 10; ++i)
            fileSystem.addFile("/lib/Series/v" + std::to_string(i) + ".cbz");

        const DirectoryWalker walker{ fileSystem, ".shelfignore", 3 };

        std::mutex mutex;
        std::size_t successCount{};
        const std::size_t fileCount{ walker.traverseParallel(
            "/lib", [&](const std::filesystem::path& file) {
                if (file.filename() == "v3.cbz")
                    throw std::runtime_error{ "cannot read" };

                std::scoped_lock lock{ mutex };
                successCount += 1;
            },
            fileNameUtils::getSupportedExtensions()) };

        EXPECT_EQ(fileCount, 10);
        EXPECT_EQ(successCount, 9);
        EXPECT_EQ(logger->getCount(core::logging::Severity::ERROR), 2); // failed file + summary
    }

    TEST(DirectoryWalker, traverseParallel_callbackNonStandardError)
    {
        ScopedRecordingLogger logger;

        TestFileSystem fileSystem;
        for (std::size_t i{}; i < 5; ++i)
            fileSystem.addFile("/lib/Series/v" + std::to_string(i) + ".cbz");

        const DirectoryWalker walker{ fileSystem, ".shelfignore", 2 };

        std::mutex mutex;
        std::size_t successCount{};
        const std::size_t fileCount{ walker.traverseParallel(
            "/lib", [&](const std::filesystem::path& file) {
                if (file.filename() == "v1.cbz")
                    throw 42;

                std::scoped_lock lock{ mutex };
                successCount += 1;
            },
            fileNameUtils::getSupportedExtensions()) };

        EXPECT_EQ(fileCount, 5);
        EXPECT_EQ(successCount, 4);
        EXPECT_EQ(logger->getCount(core::logging::Severity::ERROR), 2); // failed file + summary
    }
} // namespace shelf::scanner::tests
