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

#include <gtest/gtest.h>

#include "scanner/IgnoreMatcher.hpp"

#include "RecordingLogger.hpp"
#include "TestFileSystem.hpp"

namespace shelf::scanner::tests
{
    TEST(IgnoreMatcher, load)
    {
        TestFileSystem fileSystem;
        fileSystem.addFile("/lib/.shelfignore", { "# comment", "", "  *.pdf  ", "\tExtras", "   " });
        fileSystem.addDirectory("/lib/Accel World");

        const std::optional<IgnoreMatcher> matcher{ IgnoreMatcher::load(fileSystem, "/lib") };
        ASSERT_TRUE(matcher.has_value());
        EXPECT_EQ(matcher->getPatternCount(), 2);

        EXPECT_FALSE(IgnoreMatcher::load(fileSystem, "/lib/Accel World").has_value());
        EXPECT_FALSE(IgnoreMatcher::load(fileSystem, "/lib", ".otherignore").has_value());
    }

    TEST(IgnoreMatcher, load_customFileName)
    {
        TestFileSystem fileSystem;
        fileSystem.addFile("/lib/.scanignore", { "*.pdf" });

        EXPECT_FALSE(IgnoreMatcher::load(fileSystem, "/lib").has_value());

        const std::optional<IgnoreMatcher> matcher{ IgnoreMatcher::load(fileSystem, "/lib", ".scanignore") };
        ASSERT_TRUE(matcher.has_value());
        EXPECT_TRUE(matcher->matches("/lib/book.pdf"));
    }

    TEST(IgnoreMatcher, load_emptyFile)
    {
        ScopedRecordingLogger logger;

        TestFileSystem fileSystem;
        fileSystem.addFile("/lib/.shelfignore", { "# nothing to ignore", "" });

        EXPECT_FALSE(IgnoreMatcher::load(fileSystem, "/lib").has_value());
        EXPECT_EQ(logger->getCount(core::logging::Severity::WARNING), 1);
    }

    TEST(IgnoreMatcher, matches)
    {
        IgnoreMatcher matcher;
        matcher.addPattern("*.pdf");
        matcher.addPattern("Extras");
        matcher.addPattern("**/Secret/**");
        matcher.addPattern("*/Temp");
        matcher.addPattern("# not a pattern");

        EXPECT_EQ(matcher.getPatternCount(), 4);

        struct TestCase
        {
            std::filesystem::path path;
            bool expectedResult;
        };

        TestCase tests[]{
            { "/lib/book.pdf", true },
            { "/lib/Accel World/book.pdf", true },
            { "/lib/Accel World/v01.cbz", false },
            { "/lib/Accel World/Extras", true },
            { "/lib/Accel World/Extras.cbz", false },
            { "/lib/Secret/v01.cbz", true },
            { "/lib/Accel World/Secret/v01.cbz", true },
            { "/lib/Secret", false },
            { "/lib/Temp", true },
            { "/lib/Accel World/Temp", true },
            { "/lib/Temporary", false },
            { "C:\\lib\\Accel World\\book.pdf", true },
            { "C:\\lib\\Temp", true },
        };

        for (const TestCase& test : tests)
        {
            EXPECT_EQ(matcher.matches(test.path), test.expectedResult) << "Path = " << test.path;
        }
    }

    TEST(IgnoreMatcher, merge)
    {
        IgnoreMatcher parent;
        parent.addPattern("*.pdf");

        IgnoreMatcher child;
        child.addPattern("*.epub");

        EXPECT_FALSE(parent.matches("/lib/book.epub"));

        parent.merge(child);
        EXPECT_EQ(parent.getPatternCount(), 2);
        EXPECT_TRUE(parent.matches("/lib/book.pdf"));
        EXPECT_TRUE(parent.matches("/lib/book.epub"));
    }

    TEST(IgnoreMatcher, empty)
    {
        const IgnoreMatcher matcher;
        EXPECT_TRUE(matcher.empty());
        EXPECT_FALSE(matcher.matches("/lib/book.pdf"));
    }
} // namespace shelf::scanner::tests
