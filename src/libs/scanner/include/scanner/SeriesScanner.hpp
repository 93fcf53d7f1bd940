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
#include <memory>
#include <span>
#include <string_view>

#include "scanner/ScannerSettings.hpp"
#include "scanner/Types.hpp"

namespace shelf::scanner
{
    class IFileParser;
    class IFileSystem;
    class IProgressEventSink;

    // Walks library folders, parses their files and aggregates the resulting records into series
    // Each scan call uses its own aggregation map
    class SeriesScanner
    {
    public:
        using FolderRecordsCallback = std::function<void(std::span<const std::shared_ptr<ParsedRecord>> records)>;

        SeriesScanner(const IFileSystem& fileSystem, IFileParser& parser, IProgressEventSink& eventSink, const ScannerSettings& settings);
        SeriesScanner(const SeriesScanner&) = delete;
        SeriesScanner& operator=(const SeriesScanner&) = delete;

        // Parses the file and applies its embedded metadata, the record is not tracked
        // nullptr if the file cannot be parsed
        // Throws FileNotFoundException if the file does not exist
        std::shared_ptr<ParsedRecord> processFile(const std::filesystem::path& file, const std::filesystem::path& rootFolder, LibraryType libraryType);

        // Files of each folder are processed in parallel and tracked as they are parsed
        SeriesMap scanLibrariesForSeries(LibraryType libraryType, std::span<const std::filesystem::path> folders, std::string_view libraryName);

        // Files are processed by folder batches (see DirectoryWalker::processFiles)
        // Each batch is reconciled, tracked and then passed to onFolderRecords if not empty
        SeriesMap scanLibrariesForSeriesByFolder(LibraryType libraryType, std::span<const std::filesystem::path> folders, std::string_view libraryName, bool isLibraryScan, const FolderRecordsCallback& onFolderRecords = {});

    private:
        void applyEmbeddedMetadata(ParsedRecord& record, const EmbeddedMetadata& metadata) const;

        const IFileSystem& _fileSystem;
        IFileParser& _parser;
        IProgressEventSink& _eventSink;
        const ScannerSettings _settings;
    };
} // namespace shelf::scanner
