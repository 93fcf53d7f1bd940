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

#include "scanner/SeriesScanner.hpp"

#include <mutex>
#include <string>
#include <vector>

#include <Wt/WDateTime.h>

#include "core/ILogger.hpp"
#include "core/String.hpp"

#include "scanner/DirectoryWalker.hpp"
#include "scanner/Exception.hpp"
#include "scanner/FileNameUtils.hpp"
#include "scanner/IFileParser.hpp"
#include "scanner/IFileSystem.hpp"
#include "scanner/IProgressEventSink.hpp"
#include "scanner/LocalizedSeriesReconciler.hpp"
#include "scanner/SeriesTracker.hpp"

namespace shelf::scanner
{
    namespace
    {
        // Publishes the progress events of one scan
        class ProgressNotifier
        {
        public:
            ProgressNotifier(IProgressEventSink& eventSink, std::string_view libraryName)
                : _eventSink{ eventSink }
                , _libraryName{ libraryName }
            {
            }
            ProgressNotifier(const ProgressNotifier&) = delete;
            ProgressNotifier& operator=(const ProgressNotifier&) = delete;

            void notifyStarted() { publish(ProgressEventType::Started, {}); }
            void notifyEnded() { publish(ProgressEventType::Ended, {}); }

            void notifyFileProcessed(const std::filesystem::path& file)
            {
                std::scoped_lock lock{ _mutex };

                _processedFileCount += 1;
                publishNoLock(ProgressEventType::Updated, file);
            }

        private:
            void publish(ProgressEventType type, const std::filesystem::path& path)
            {
                std::scoped_lock lock{ _mutex };
                publishNoLock(type, path);
            }

            void publishNoLock(ProgressEventType type, const std::filesystem::path& path)
            {
                FileScanProgressEvent event;
                event.path = path;
                event.libraryName = _libraryName;
                event.eventType = type;
                event.processedFileCount = _processedFileCount;
                event.eventTime = Wt::WDateTime::currentDateTime();

                _eventSink.publish(notificationProgressEventName, event);
            }

            IProgressEventSink& _eventSink;
            const std::string _libraryName;

            std::mutex _mutex;
            std::size_t _processedFileCount{};
        };

        void trackRecord(SeriesTracker& tracker, const std::shared_ptr<ParsedRecord>& record)
        {
            switch (tracker.track(record))
            {
            case TrackResult::Added:
                break;
            case TrackResult::AlreadyTracked:
                SHELF_LOG(SCANNER, DEBUG, "File '" << record->fullFilePath.string() << "' already tracked");
                break;
            case TrackResult::Ignored:
                SHELF_LOG(SCANNER, DEBUG, "File '" << record->fullFilePath.string() << "' has no series, skipping");
                break;
            case TrackResult::Conflict:
                SHELF_LOG(SCANNER, DEBUG, "File '" << record->fullFilePath.string() << "' skipped");
                break;
            }
        }
    } // namespace

    SeriesScanner::SeriesScanner(const IFileSystem& fileSystem, IFileParser& parser, IProgressEventSink& eventSink, const ScannerSettings& settings)
        : _fileSystem{ fileSystem }
        , _parser{ parser }
        , _eventSink{ eventSink }
        , _settings{ settings }
    {
    }

    std::shared_ptr<ParsedRecord> SeriesScanner::processFile(const std::filesystem::path& file, const std::filesystem::path& rootFolder, LibraryType libraryType)
    {
        std::unique_ptr<ParsedRecord> record{ _parser.parse(file, rootFolder, libraryType) };
        if (!record)
        {
            if (!fileNameUtils::isCoverImage(file))
                SHELF_LOG(SCANNER, WARNING, "Could not parse series from '" << file.string() << "'");

            return nullptr;
        }

        // Manga/Comic library containing epubs whose series name looks like a volume
        if (fileNameUtils::isEpub(file) && fileNameUtils::parseVolume(record->series) != defaultVolume)
        {
            if (std::unique_ptr<ParsedRecord> bookRecord{ _parser.parse(file, rootFolder, LibraryType::Book) })
            {
                if (const std::unique_ptr<ParsedRecord> libraryRecord{ _parser.parse(file, rootFolder, libraryType) })
                    bookRecord->merge(*libraryRecord);

                record = std::move(bookRecord);
            }
        }

        if (const std::optional<EmbeddedMetadata> metadata{ _parser.getEmbeddedMetadata(file) })
        {
            applyEmbeddedMetadata(*record, *metadata);
            record->embeddedMetadata = metadata;
        }

        return record;
    }

    SeriesMap SeriesScanner::scanLibrariesForSeries(LibraryType libraryType, std::span<const std::filesystem::path> folders, std::string_view libraryName)
    {
        SeriesTracker tracker;
        const DirectoryWalker walker{ _fileSystem, _settings.ignoreFileName, _settings.threadCount };

        ProgressNotifier notifier{ _eventSink, libraryName };
        notifier.notifyStarted();

        for (const std::filesystem::path& folder : folders)
        {
            try
            {
                const std::size_t fileCount{ walker.traverseParallel(
                    folder, [&](const std::filesystem::path& file) {
                        try
                        {
                            if (const std::shared_ptr<ParsedRecord> record{ processFile(file, folder, libraryType) })
                                trackRecord(tracker, record);

                            notifier.notifyFileProcessed(file);
                        }
                        catch (const FileNotFoundException&)
                        {
                            SHELF_LOG(SCANNER, ERROR, "The file '" << file.string() << "' could not be found");
                        }
                        catch (const std::exception& e)
                        {
                            SHELF_LOG(SCANNER, ERROR, "Exception while processing '" << file.string() << "': " << e.what() << ". Skipping this file");
                        }
                    },
                    fileNameUtils::getSupportedExtensions()) };

                SHELF_LOG(SCANNER, DEBUG, "Processed " << fileCount << " file(s) in '" << folder.string() << "'");
            }
            catch (const RootNotFoundException& e)
            {
                SHELF_LOG(SCANNER, ERROR, e.what());
            }
        }

        notifier.notifyEnded();

        SeriesMap series{ tracker.getSeriesWithRecords() };
        SHELF_LOG(SCANNER, INFO, "Library '" << libraryName << "': found " << series.size() << " series");

        return series;
    }

    SeriesMap SeriesScanner::scanLibrariesForSeriesByFolder(LibraryType libraryType, std::span<const std::filesystem::path> folders, std::string_view libraryName, bool isLibraryScan, const FolderRecordsCallback& onFolderRecords)
    {
        SeriesTracker tracker;
        const DirectoryWalker walker{ _fileSystem, _settings.ignoreFileName, _settings.threadCount };

        ProgressNotifier notifier{ _eventSink, libraryName };
        notifier.notifyStarted();

        for (const std::filesystem::path& folder : folders)
        {
            if (!_fileSystem.isDirectory(folder))
            {
                SHELF_LOG(SCANNER, ERROR, "The directory '" << folder.string() << "' does not exist");
                continue;
            }

            walker.processFiles(folder, isLibraryScan, [&](std::span<const std::filesystem::path> files, const std::filesystem::path& batchFolder) {
                SHELF_LOG(SCANNER, DEBUG, "Processing " << files.size() << " file(s) in '" << batchFolder.string() << "'");

                std::vector<std::shared_ptr<ParsedRecord>> records;
                for (const std::filesystem::path& file : files)
                {
                    try
                    {
                        if (std::shared_ptr<ParsedRecord> record{ processFile(file, folder, libraryType) })
                            records.push_back(std::move(record));

                        notifier.notifyFileProcessed(file);
                    }
                    catch (const FileNotFoundException&)
                    {
                        SHELF_LOG(SCANNER, ERROR, "The file '" << file.string() << "' could not be found");
                    }
                    catch (const std::exception& e)
                    {
                        SHELF_LOG(SCANNER, ERROR, "Exception while processing '" << file.string() << "': " << e.what() << ". Skipping this file");
                    }
                }

                reconcileLocalizedSeries(records);

                for (const std::shared_ptr<ParsedRecord>& record : records)
                    trackRecord(tracker, record);

                if (!records.empty() && onFolderRecords)
                    onFolderRecords(records);
            });
        }

        notifier.notifyEnded();

        SeriesMap series{ tracker.getSeriesWithRecords() };
        SHELF_LOG(SCANNER, INFO, "Library '" << libraryName << "': found " << series.size() << " series");

        return series;
    }

    void SeriesScanner::applyEmbeddedMetadata(ParsedRecord& record, const EmbeddedMetadata& metadata) const
    {
        if (!metadata.volume.empty())
            record.volumes = metadata.volume;
        if (!metadata.series.empty())
            record.series = core::stringUtils::stringTrim(metadata.series);
        if (!metadata.number.empty())
            record.chapters = metadata.number;
        if (!metadata.titleSort.empty())
            record.seriesSort = core::stringUtils::stringTrim(metadata.titleSort);
        if (!metadata.format.empty() && fileNameUtils::hasSpecialFormatMarker(metadata.format))
        {
            record.isSpecial = true;
            record.chapters = defaultChapter;
            record.volumes = defaultVolume;
        }
        if (!metadata.seriesSort.empty())
            record.seriesSort = core::stringUtils::stringTrim(metadata.seriesSort);
        if (!metadata.localizedSeries.empty())
            record.localizedSeries = core::stringUtils::stringTrim(metadata.localizedSeries);
    }
} // namespace shelf::scanner
