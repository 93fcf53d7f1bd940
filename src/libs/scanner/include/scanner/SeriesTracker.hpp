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

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "scanner/Types.hpp"

namespace shelf::scanner
{
    enum class TrackResult
    {
        Added,          // appended to an existing series or created a new one
        AlreadyTracked, // this very record was already tracked
        Ignored,        // no series name
        Conflict,       // several series match the record
    };

    // Aggregates records into series, thread safe
    class SeriesTracker
    {
    public:
        SeriesTracker() = default;
        SeriesTracker(const SeriesTracker&) = delete;
        SeriesTracker& operator=(const SeriesTracker&) = delete;

        // May rewrite the series name of the record to the name of the series it is merged into
        TrackResult track(const std::shared_ptr<ParsedRecord>& record);

        // Name of the tracked series matching the series or localized series of the record,
        // the record's own series name if none matches, nullopt if several series match
        std::optional<std::string> mergeName(const ParsedRecord& record) const;

        SeriesMap getSeriesWithRecords() const;
        std::size_t getSeriesCount() const;

    private:
        std::optional<std::string> mergeNameNoLock(const ParsedRecord& record) const;

        mutable std::mutex _mutex;
        SeriesMap _series;
    };

    struct SeriesQuery
    {
        std::string name;
        std::string localizedName;
        std::string originalName;
        SeriesFormat format{ SeriesFormat::Unknown }; // Unknown matches any format
    };

    // Records of the series matching any of the query names
    RecordList getRecordsByName(const SeriesMap& series, const SeriesQuery& query);
} // namespace shelf::scanner
