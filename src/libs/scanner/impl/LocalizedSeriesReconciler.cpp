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

#include "scanner/LocalizedSeriesReconciler.hpp"

#include <algorithm>

#include "core/ILogger.hpp"

#include "scanner/NameNormalizer.hpp"

namespace shelf::scanner
{
    void reconcileLocalizedSeries(std::span<const std::shared_ptr<ParsedRecord>> records)
    {
        const auto itLocalized{ std::find_if(std::cbegin(records), std::cend(records), [](const std::shared_ptr<ParsedRecord>& record) { return !record->localizedSeries.empty(); }) };
        if (itLocalized == std::cend(records))
            return;

        const std::string localizedSeries{ (*itLocalized)->localizedSeries };

        const auto itSeries{ std::find_if(std::cbegin(records), std::cend(records), [&](const std::shared_ptr<ParsedRecord>& record) { return record->series != localizedSeries; }) };
        if (itSeries == std::cend(records))
            return;

        const std::string series{ (*itSeries)->series };
        const std::string normalizedSeries{ normalize(series) };

        for (const std::shared_ptr<ParsedRecord>& record : records)
        {
            if (normalize(record->series) == normalizedSeries)
                continue;

            SHELF_LOG(SCANNER, DEBUG, "Remapping '" << record->fullFilePath.string() << "' from series '" << record->series << "' to '" << series << "' (localized = '" << localizedSeries << "')");
            record->series = series;
            record->localizedSeries = localizedSeries;
        }
    }
} // namespace shelf::scanner
