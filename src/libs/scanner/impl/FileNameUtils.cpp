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

#include "scanner/FileNameUtils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <regex>

#include "core/Path.hpp"
#include "core/String.hpp"

namespace shelf::scanner::fileNameUtils
{
    namespace
    {
        constexpr std::array<std::string_view, 9> archiveExtensions{ ".cbz", ".zip", ".rar", ".cbr", ".tar.gz", ".7zip", ".7z", ".cb7", ".cbt" };
        constexpr std::array<std::string_view, 2> bookExtensions{ ".epub", ".pdf" };
        constexpr std::array<std::string_view, 5> imageExtensions{ ".png", ".jpeg", ".jpg", ".webp", ".gif" };

        constexpr auto supportedExtensions{ [] {
            std::array<std::string_view, archiveExtensions.size() + bookExtensions.size() + imageExtensions.size()> res{};
            std::size_t i{};
            for (std::string_view ext : archiveExtensions)
                res[i++] = ext;
            for (std::string_view ext : bookExtensions)
                res[i++] = ext;
            for (std::string_view ext : imageExtensions)
                res[i++] = ext;
            return res;
        }() };

        constexpr std::array<std::string_view, 5> excludedDirectoryNames{ "@eaDir", ".DS_Store", ".qpkg", "__MACOSX", "@Recently-Snapshot" };

        constexpr auto regexFlags{ std::regex::ECMAScript | std::regex::icase };

        bool isWordChar(char c)
        {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        }

        std::string removeLeadingZeroes(std::string_view value)
        {
            std::string res;
            for (std::string_view part : core::stringUtils::splitString(value, '-'))
            {
                part = core::stringUtils::stringTrim(part);

                const std::size_t firstNonZero{ part.find_first_not_of('0') };
                if (firstNonZero == std::string_view::npos)
                    part = part.empty() ? part : "0";
                else if (part[firstNonZero] == '.')
                    part = part.substr(firstNonZero - 1);
                else
                    part = part.substr(firstNonZero);

                if (!res.empty())
                    res += '-';
                res += part;
            }

            return res;
        }

        std::string removeBracketedGroups(std::string_view str)
        {
            static const std::regex bracketRegex{ R"(\[[^\]]*\]|\([^\)]*\)|\{[^\}]*\})" };
            return std::regex_replace(std::string{ str }, bracketRegex, " ");
        }

        std::optional<std::string> searchFirstGroup(std::string_view str, std::span<const std::regex> regexes)
        {
            const std::string input{ str };
            for (const std::regex& regex : regexes)
            {
                std::smatch match;
                if (std::regex_search(input, match, regex))
                    return removeLeadingZeroes(match[1].str());
            }

            return std::nullopt;
        }
    } // namespace

    std::span<const std::string_view> getSupportedExtensions()
    {
        return supportedExtensions;
    }

    bool isArchive(const std::filesystem::path& file)
    {
        return core::pathUtils::hasFileAnyExtension(file, archiveExtensions);
    }

    bool isEpub(const std::filesystem::path& file)
    {
        return core::pathUtils::hasFileAnyExtension(file, std::array<std::string_view, 1>{ ".epub" });
    }

    bool isPdf(const std::filesystem::path& file)
    {
        return core::pathUtils::hasFileAnyExtension(file, std::array<std::string_view, 1>{ ".pdf" });
    }

    bool isImage(const std::filesystem::path& file)
    {
        return core::pathUtils::hasFileAnyExtension(file, imageExtensions);
    }

    bool isSupported(const std::filesystem::path& file)
    {
        return core::pathUtils::hasFileAnyExtension(file, supportedExtensions);
    }

    bool isCoverImage(const std::filesystem::path& file)
    {
        if (!isImage(file))
            return false;

        const std::string stem{ core::stringUtils::stringToLower(file.stem().string()) };
        for (std::string_view word : { std::string_view{ "cover" }, std::string_view{ "folder" } })
        {
            std::size_t pos{};
            while ((pos = stem.find(word, pos)) != std::string::npos)
            {
                const std::size_t end{ pos + word.size() };
                const bool startsWord{ pos == 0 || !std::isalpha(static_cast<unsigned char>(stem[pos - 1])) };
                const bool endsWord{ end == stem.size() || !isWordChar(stem[end]) };

                if (startsWord && endsWord)
                    return true;

                pos = end;
            }
        }

        return false;
    }

    bool isMacOsMetadataFile(const std::filesystem::path& file)
    {
        return file.filename().string().starts_with("._");
    }

    bool isExcludedDirectory(const std::filesystem::path& directory)
    {
        const std::string name{ directory.filename().string() };
        return std::any_of(std::cbegin(excludedDirectoryNames), std::cend(excludedDirectoryNames), [&](std::string_view excluded) { return core::stringUtils::stringCaseInsensitiveEqual(name, excluded); });
    }

    bool hasSpecialFormatMarker(std::string_view format)
    {
        static const std::regex specialRegex{ R"((?:^|[^a-z0-9])(?:specials?|one-?shot|one shot|omake|extras?|annual|bonus|tpb|preview|side[\s-]stor(?:y|ies))(?![a-z0-9]))", regexFlags };

        return std::regex_search(std::string{ format }, specialRegex);
    }

    SeriesFormat getSeriesFormat(const std::filesystem::path& file)
    {
        if (isArchive(file))
            return SeriesFormat::Archive;
        if (isEpub(file))
            return SeriesFormat::Epub;
        if (isPdf(file))
            return SeriesFormat::Pdf;
        if (isImage(file))
            return SeriesFormat::Image;

        return SeriesFormat::Unknown;
    }

    std::string parseVolume(std::string_view str)
    {
        static const std::array<std::regex, 4> volumeRegexes{
            std::regex{ R"((?:^|[^a-z0-9])(?:vol(?:ume)?\.?\s*|v)(\d+(?:\.\d+)?(?:\s?-\s?\d+(?:\.\d+)?)?)(?![a-z0-9]))", regexFlags },
            std::regex{ R"((?:^|[^a-z0-9])(?:tome|livre|band)\s*(\d+(?:\.\d+)?))", regexFlags },
            std::regex{ "\xE7\xAC\xAC(\\d+)(?:\xE5\xB7\xBB|\xE5\x8D\xB7|\xE5\x86\x8C)" }, // 第N巻, 第N卷, 第N册
            std::regex{ "(\\d+)(?:\xE5\xB7\xBB|\xEA\xB6\x8C)" },                           // N巻, N권
        };

        if (const std::optional<std::string> volume{ searchFirstGroup(str, volumeRegexes) })
            return *volume;

        return std::string{ defaultVolume };
    }

    std::string parseChapter(std::string_view str)
    {
        static const std::array<std::regex, 2> chapterRegexes{
            std::regex{ R"((?:^|[^a-z0-9])(?:ch(?:apter)?\.?\s*|c|#)(\d+(?:\.\d+)?(?:-\d+(?:\.\d+)?)?)(?![a-z0-9]))", regexFlags },
            std::regex{ "\xE7\xAC\xAC(\\d+)(?:\xE8\xAF\x9D|\xE8\xA9\xB1)" }, // 第N话, 第N話
        };

        if (const std::optional<std::string> chapter{ searchFirstGroup(str, chapterRegexes) })
            return *chapter;

        // "Series Name 012 (Digital)": trailing number not preceded by a volume marker
        static const std::regex trailingNumberRegex{ R"(^(.*\S)\s+-?\s*(\d+(?:\.\d+)?)\s*$)" };
        static const std::regex volumeMarkerRegex{ R"((?:^|[^a-z0-9])(?:vol(?:ume)?\.?|tome)$)", regexFlags };

        const std::string stripped{ core::stringUtils::stringTrim(removeBracketedGroups(str)) };
        std::smatch match;
        if (std::regex_match(stripped, match, trailingNumberRegex) && !std::regex_search(match[1].str(), volumeMarkerRegex))
            return removeLeadingZeroes(match[2].str());

        return std::string{ defaultChapter };
    }

    std::string parseSeries(std::string_view str)
    {
        static const std::regex designatorRegex{ R"((?:^|[\s\-])(?:vol(?:ume)?\.?\s*\d|v\d|tome\s*\d|ch(?:apter)?\.?\s*\d|c\d|#\d|\d+(?:\.\d+)?\s*$))", regexFlags };

        std::string series{ removeBracketedGroups(core::stringUtils::replaceInString(str, "_", " ")) };

        std::smatch match;
        if (std::regex_search(series, match, designatorRegex))
            series.resize(static_cast<std::size_t>(match.position(0)));

        std::string_view trimmed{ core::stringUtils::stringTrim(series, " \t-.,") };
        return std::string{ trimmed };
    }
} // namespace shelf::scanner::fileNameUtils
