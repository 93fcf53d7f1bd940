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
#include <span>

#include "scanner/Types.hpp"

namespace shelf::scanner
{
    // Some records of a folder may use the localized name of the series as their series name.
    // Picks the first localized name and the first series name that differs from it, and
    // rewrites the records of the batch that do not use that series name accordingly.
    // No-op if no record has a localized name, or if no other series name can be found.
    void reconcileLocalizedSeries(std::span<const std::shared_ptr<ParsedRecord>> records);
} // namespace shelf::scanner
