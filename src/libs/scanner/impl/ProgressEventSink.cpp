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

#include "scanner/IProgressEventSink.hpp"

#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace shelf::scanner
{
    namespace
    {
        class LoggingProgressEventSink final : public IProgressEventSink
        {
        private:
            void publish(std::string_view eventName, const FileScanProgressEvent& event) override
            {
                switch (event.eventType)
                {
                case ProgressEventType::Started:
                case ProgressEventType::Ended:
                    SHELF_LOG(SCANNER, INFO, "[" << eventName << "] " << event.libraryName << ": scan " << toString(event.eventType) << " (" << event.processedFileCount << " file(s) processed) at " << core::stringUtils::toISO8601String(event.eventTime));
                    break;

                case ProgressEventType::Updated:
                    SHELF_LOG(SCANNER, DEBUG, "[" << eventName << "] " << event.libraryName << ": #" << event.processedFileCount << " '" << event.path.string() << "'");
                    break;
                }
            }
        };
    } // namespace

    const char* toString(ProgressEventType type)
    {
        switch (type)
        {
        case ProgressEventType::Started:
            return "started";
        case ProgressEventType::Updated:
            return "updated";
        case ProgressEventType::Ended:
            return "ended";
        }
        return "";
    }

    std::unique_ptr<IProgressEventSink> createLoggingProgressEventSink()
    {
        return std::make_unique<LoggingProgressEventSink>();
    }
} // namespace shelf::scanner
