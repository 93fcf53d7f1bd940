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

#include "scanner/SeriesTracker.hpp"

#include <algorithm>
#include <initializer_list>
#include <vector>

#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "core/String.hpp"

#include "scanner/NameNormalizer.hpp"

namespace shelf::scanner
{
    namespace
    {
        bool isMatchingName(const SeriesIdentity& identity, std::initializer_list<std::string_view> normalizedNames)
        {
            const std::string identityName{ normalize(identity.normalizedName) };
            return std::any_of(std::cbegin(normalizedNames), std::cend(normalizedNames), [&](std::string_view name) { return !name.empty() && name == identityName; });
        }

        std::vector<SeriesMap::iterator> findMatchingSeries(SeriesMap& series, SeriesFormat format, std::initializer_list<std::string_view> normalizedNames)
        {
            std::vector<SeriesMap::iterator> res;
            for (auto it{ std::begin(series) }; it != std::end(series); ++it)
            {
                if (it->first.format == format && isMatchingName(it->first, normalizedNames))
                    res.push_back(it);
            }
            return res;
        }

        template<typename Iterator>
        std::string getSeriesNames(const std::vector<Iterator>& matches)
        {
            std::vector<std::string> names;
            for (const Iterator& it : matches)
                names.push_back("'" + it->first.name + "'");

            return core::stringUtils::joinStrings(names, ", ");
        }
    } // namespace

    TrackResult SeriesTracker::track(const std::shared_ptr<ParsedRecord>& record)
    {
        if (core::stringUtils::stringTrim(record->series).empty())
            return TrackResult::Ignored;

        std::scoped_lock lock{ _mutex };

        const std::optional<std::string> mergedName{ mergeNameNoLock(*record) };
        if (!mergedName)
            return TrackResult::Conflict;

        record->series = *mergedName;

        const std::string normalizedSeries{ normalize(record->series) };
        const std::string normalizedSortSeries{ normalize(record->seriesSort) };
        const std::string normalizedLocalizedSeries{ normalize(record->localizedSeries) };

        const std::vector<SeriesMap::iterator> matches{ findMatchingSeries(_series, record->format, { normalizedSeries, normalizedSortSeries, normalizedLocalizedSeries }) };
        if (matches.size() > 1)
        {
            SHELF_LOG(SCANNER, CRITICAL, "Multiple series detected for '" << record->series << "' ('" << record->fullFilePath.string() << "'): " << getSeriesNames(matches) << ". This can be caused by different series having the same localized name");
            return TrackResult::Conflict;
        }

        const std::filesystem::path folder{ record->fullFilePath.parent_path() };

        if (matches.empty())
        {
            SeriesIdentity identity;
            identity.name = record->series;
            identity.normalizedName = normalizedSeries;
            identity.format = record->format;
            identity.folderPath = folder;

            _series.emplace(std::move(identity), RecordList{ record });
            return TrackResult::Added;
        }

        const SeriesMap::iterator it{ matches.front() };
        RecordList& records{ it->second };
        if (std::find(std::cbegin(records), std::cend(records), record) != std::cend(records))
            return TrackResult::AlreadyTracked;

        records.push_back(record);

        if (it->first.folderPath != folder)
        {
            // folderPath does not take part in the ordering
            auto node{ _series.extract(it) };
            node.key().folderPath = core::pathUtils::getLongestCommonPath(node.key().folderPath, folder);
            _series.insert(std::move(node));
        }

        return TrackResult::Added;
    }

    std::optional<std::string> SeriesTracker::mergeName(const ParsedRecord& record) const
    {
        std::scoped_lock lock{ _mutex };
        return mergeNameNoLock(record);
    }

    std::optional<std::string> SeriesTracker::mergeNameNoLock(const ParsedRecord& record) const
    {
        const std::string normalizedSeries{ normalize(record.series) };
        const std::string normalizedLocalizedSeries{ normalize(record.localizedSeries) };

        std::vector<SeriesMap::const_iterator> matches;
        for (auto it{ std::cbegin(_series) }; it != std::cend(_series); ++it)
        {
            if (it->first.format == record.format && isMatchingName(it->first, { normalizedSeries, normalizedLocalizedSeries }))
                matches.push_back(it);
        }

        if (matches.size() > 1)
        {
            SHELF_LOG(SCANNER, CRITICAL, "Multiple series detected for '" << record.series << "' ('" << record.fullFilePath.string() << "'): " << getSeriesNames(matches) << ". This can be caused by different series having the same localized name");
            return std::nullopt;
        }

        if (matches.size() == 1 && !matches.front()->first.name.empty())
            return matches.front()->first.name;

        return record.series;
    }

    SeriesMap SeriesTracker::getSeriesWithRecords() const
    {
        SeriesMap res;

        std::scoped_lock lock{ _mutex };
        for (const auto& [identity, records] : _series)
        {
            if (!records.empty())
                res.emplace(identity, records);
        }

        return res;
    }

    std::size_t SeriesTracker::getSeriesCount() const
    {
        std::scoped_lock lock{ _mutex };
        return _series.size();
    }

    RecordList getRecordsByName(const SeriesMap& series, const SeriesQuery& query)
    {
        const std::string normalizedName{ normalize(query.name) };
        const std::string normalizedLocalizedName{ normalize(query.localizedName) };
        const std::string normalizedOriginalName{ normalize(query.originalName) };

        RecordList res;
        for (const auto& [identity, records] : series)
        {
            if (query.format != SeriesFormat::Unknown && identity.format != query.format)
                continue;

            if (isMatchingName(identity, { normalizedName, normalizedLocalizedName, normalizedOriginalName }))
                res.insert(std::end(res), std::cbegin(records), std::cend(records));
        }

        return res;
    }
} // namespace shelf::scanner
