/*
 * Copyright (C) 2019 Emeric Poupon
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

#include <array>

#include <gtest/gtest.h>

#include "core/Path.hpp"

namespace shelf::core::pathUtils::tests
{
    TEST(Path, getLongestCommonPath)
    {
        struct TestCase
        {
            std::filesystem::path path1;
            std::filesystem::path path2;
            std::filesystem::path expectedCommonPath;
        };

        TestCase tests[]{
            { "foo.txt", "/foo/foo.txt", "" },
            { "/", "/file.cbz", "/" },
            { "/manga/Accel World/v01.cbz", "/manga/Accel World/v02.cbz", "/manga/Accel World" },
            { "/manga/Accel World", "/manga/Accel World/Extras", "/manga/Accel World" },
            { "/dir1/file.cbz", "/dir2/file.cbz", "/" },
        };

        for (const TestCase& test : tests)
        {
            EXPECT_EQ(getLongestCommonPath(test.path1, test.path2), test.expectedCommonPath);
        }
    }

    TEST(Path, hasFileAnyExtension)
    {
        constexpr std::array<std::string_view, 3> extensions{ ".cbz", ".tar.gz", ".epub" };

        struct TestCase
        {
            std::filesystem::path file;
            bool expectedResult;
        };

        TestCase tests[]{
            { "/manga/v01.cbz", true },
            { "/manga/v01.CBZ", true },
            { "/manga/v01.tar.gz", true },
            { "/manga/v01.gz", false },
            { "/books/book.epub", true },
            { "/books/book.pdf", false },
            { "/books/.epub", false },
            { "/books/epub", false },
            { "", false },
        };

        for (const TestCase& test : tests)
        {
            EXPECT_EQ(hasFileAnyExtension(test.file, extensions), test.expectedResult) << "File = " << test.file;
        }
    }

    TEST(Path, normalizePath)
    {
        struct TestCase
        {
            std::string_view input;
            std::string_view expectedOutput;
        };

        TestCase tests[]{
            { "", "" },
            { "/", "/" },
            { "/manga/", "/manga" },
            { "C:\\manga\\Accel World\\v01.cbz", "C:/manga/Accel World/v01.cbz" },
            { "/manga//Accel World///v01.cbz", "/manga/Accel World/v01.cbz" },
            { "relative\\path\\", "relative/path" },
        };

        for (const TestCase& test : tests)
        {
            EXPECT_EQ(normalizePath(test.input), test.expectedOutput) << "Input = '" << test.input << "'";
        }
    }
} // namespace shelf::core::pathUtils::tests
