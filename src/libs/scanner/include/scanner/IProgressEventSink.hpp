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
#include <memory>
#include <string>
#include <string_view>

#include <Wt/WDateTime.h>

namespace shelf::scanner
{
    enum class ProgressEventType
    {
        Started,
        Updated,
        Ended,
    };

    const char* toString(ProgressEventType type);

    struct FileScanProgressEvent
    {
        std::filesystem::path path; // empty for Started and Ended events
        std::string libraryName;
        ProgressEventType eventType{ ProgressEventType::Updated };
        std::size_t processedFileCount{};
        Wt::WDateTime eventTime;
    };

    inline constexpr std::string_view notificationProgressEventName{ "NotificationProgress" };

    // Implementations must be thread safe
    class IProgressEventSink
    {
    public:
        virtual ~IProgressEventSink() = default;

        virtual void publish(std::string_view eventName, const FileScanProgressEvent& event) = 0;
    };

    // Reports events through the logger
    std::unique_ptr<IProgressEventSink> createLoggingProgressEventSink();
} // namespace shelf::scanner
