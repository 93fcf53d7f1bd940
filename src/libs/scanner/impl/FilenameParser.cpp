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

#include "FilenameParser.hpp"

#include "core/ILogger.hpp"
#include "core/String.hpp"

#include "scanner/Exception.hpp"
#include "scanner/FileNameUtils.hpp"
#include "scanner/IFileSystem.hpp"

namespace shelf::scanner
{
    namespace
    {
        // file name without its supported extension (".tar.gz" handled)
        std::string getFileStem(const std::filesystem::path& file)
        {
            const std::string fileName{ file.filename().string() };
            for (std::string_view extension : fileNameUtils::getSupportedExtensions())
            {
                if (fileName.size() > extension.size() && core::stringUtils::stringCaseInsensitiveEqual(std::string_view{ fileName }.substr(fileName.size() - extension.size()), extension))
                    return fileName.substr(0, fileName.size() - extension.size());
            }

            return file.stem().string();
        }

        // Name of the folder containing the file, if it is located below the scan root
        std::string getParentFolderName(const std::filesystem::path& file, const std::filesystem::path& scanRoot)
        {
            const std::filesystem::path parent{ file.parent_path() };
            if (parent.empty() || parent == scanRoot || parent.lexically_normal() == scanRoot.lexically_normal())
                return {};

            return parent.filename().string();
        }
    } // namespace

    std::unique_ptr<IFileParser> createFilenameParser(const IFileSystem& fileSystem)
    {
        return std::make_unique<FilenameParser>(fileSystem);
    }

    FilenameParser::FilenameParser(const IFileSystem& fileSystem)
        : _fileSystem{ fileSystem }
    {
    }

    std::unique_ptr<ParsedRecord> FilenameParser::parse(const std::filesystem::path& file, const std::filesystem::path& scanRoot, LibraryType libraryType)
    {
        if (!_fileSystem.isFile(file))
            throw FileNotFoundException{ file };

        const SeriesFormat format{ fileNameUtils::getSeriesFormat(file) };
        if (format == SeriesFormat::Unknown)
            return nullptr;
        if (format == SeriesFormat::Image && libraryType != LibraryType::Image)
            return nullptr;

        const std::string stem{ getFileStem(file) };

        auto record{ std::make_unique<ParsedRecord>() };
        record->filename = file.filename().string();
        record->fullFilePath = file;
        record->format = format;
        record->title = stem;

        record->series = fileNameUtils::parseSeries(stem);
        if (record->series.empty() || format == SeriesFormat::Image)
            record->series = fileNameUtils::parseSeries(getParentFolderName(file, scanRoot));
        if (record->series.empty())
            record->series = stem;

        if (libraryType != LibraryType::Book)
        {
            record->volumes = fileNameUtils::parseVolume(stem);
            record->chapters = fileNameUtils::parseChapter(stem);
        }

        if (fileNameUtils::hasSpecialFormatMarker(stem))
        {
            record->isSpecial = true;
            record->volumes = defaultVolume;
            record->chapters = defaultChapter;
        }

        SHELF_LOG(PARSER, DEBUG, "Parsed '" << file.string() << "': series = '" << record->series << "', volumes = '" << record->volumes << "', chapters = '" << record->chapters << "'");

        return record;
    }

    std::optional<EmbeddedMetadata> FilenameParser::getEmbeddedMetadata(const std::filesystem::path&)
    {
        return std::nullopt;
    }
} // namespace shelf::scanner
