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

#include <string>
#include <string_view>

namespace shelf::scanner
{
    // Canonical comparison key of a series title (UTF-8)
    // Only letters, ASCII digits, '+' and '!' are kept, letters being lower cased.
    // If nothing remains, the title is returned as is.
    // normalize(normalize(str)) == normalize(str)
    [[nodiscard]] std::string normalize(std::string_view name);
} // namespace shelf::scanner
