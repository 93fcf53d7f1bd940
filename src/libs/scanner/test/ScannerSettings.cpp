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
#include <map>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "core/IConfig.hpp"
#include "core/String.hpp"

#include "scanner/Exception.hpp"
#include "scanner/ScannerSettings.hpp"

namespace shelf::scanner::tests
{
    namespace
    {
        class TestConfig final : public core::IConfig
        {
        public:
            using Values = std::map<std::string, std::string, std::less<>>;
            using Lists = std::map<std::string, std::vector<std::string>, std::less<>>;

            TestConfig(Values values, Lists lists = {})
                : _values{ std::move(values) }
                , _lists{ std::move(lists) }
            {
            }

        private:
            std::string_view getString(std::string_view setting, std::string_view def) override
            {
                auto it{ _values.find(setting) };
                return it == std::cend(_values) ? def : std::string_view{ it->second };
            }

            void visitStrings(std::string_view setting, std::function<void(std::string_view)> func, std::initializer_list<std::string_view> def) override
            {
                auto it{ _lists.find(setting) };
                if (it == std::cend(_lists))
                {
                    for (std::string_view value : def)
                        func(value);
                    return;
                }

                for (std::string_view value : it->second)
                    func(value);
            }

            std::filesystem::path getPath(std::string_view setting, const std::filesystem::path& def) override
            {
                auto it{ _values.find(setting) };
                return it == std::cend(_values) ? def : std::filesystem::path{ it->second };
            }

            unsigned long getULong(std::string_view setting, unsigned long def) override
            {
                auto it{ _values.find(setting) };
                return it == std::cend(_values) ? def : core::stringUtils::readAs<unsigned long>(it->second).value_or(def);
            }

            bool getBool(std::string_view setting, bool def) override
            {
                auto it{ _values.find(setting) };
                return it == std::cend(_values) ? def : core::stringUtils::readAs<bool>(it->second).value_or(def);
            }

            const Values _values;
            const Lists _lists;
        };
    } // namespace

    TEST(ScannerSettings, defaults)
    {
        TestConfig config{ {} };

        const ScannerSettings settings{ loadScannerSettings(config) };
        EXPECT_EQ(settings.ignoreFileName, ".shelfignore");
        EXPECT_EQ(settings.threadCount, std::max<std::size_t>(std::thread::hardware_concurrency() / 2, 1));

        const LibraryInfo library{ loadLibraryInfo(config) };
        EXPECT_EQ(library.type, LibraryType::Manga);
        EXPECT_TRUE(library.folders.empty());
        EXPECT_FALSE(library.scanByFolder);
    }

    TEST(ScannerSettings, values)
    {
        TestConfig config{
            {
                { "ignore-file-name", ".scanignore" },
                { "scanner-thread-count", "3" },
                { "library-name", "Comics" },
                { "library-type", "Comic" },
                { "library-scan-by-folder", "true" },
            },
            {
                { "library-folders", { "/data/comics", "/data/more-comics" } },
            }
        };

        const ScannerSettings settings{ loadScannerSettings(config) };
        EXPECT_EQ(settings.ignoreFileName, ".scanignore");
        EXPECT_EQ(settings.threadCount, 3);

        const LibraryInfo library{ loadLibraryInfo(config) };
        EXPECT_EQ(library.name, "Comics");
        EXPECT_EQ(library.type, LibraryType::Comic);
        ASSERT_EQ(library.folders.size(), 2);
        EXPECT_EQ(library.folders[0], "/data/comics");
        EXPECT_EQ(library.folders[1], "/data/more-comics");
        EXPECT_TRUE(library.scanByFolder);
    }

    TEST(ScannerSettings, badLibraryType)
    {
        TestConfig config{ { { "library-type", "audiobook" } } };

        EXPECT_THROW(loadLibraryInfo(config), Exception);
    }
} // namespace shelf::scanner::tests
