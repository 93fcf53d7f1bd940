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
#include <string_view>
#include <system_error>

#include "core/Exception.hpp"

namespace shelf::scanner
{
    class Exception : public core::ShelfException
    {
    public:
        using ShelfException::ShelfException;
    };

    class IOException : public Exception
    {
    public:
        IOException(std::string_view message, std::error_code err)
            : Exception{ std::string{ message } + ": " + err.message() }
            , _err{ err }
        {
        }

        std::error_code getErrorCode() const { return _err; }

    private:
        std::error_code _err;
    };

    // File vanished between enumeration and read
    class FileNotFoundException : public Exception
    {
    public:
        FileNotFoundException(const std::filesystem::path& p)
            : Exception{ "File '" + p.string() + "' not found" }
            , _path{ p }
        {
        }

        const std::filesystem::path& getPath() const { return _path; }

    private:
        std::filesystem::path _path;
    };

    class RootNotFoundException : public Exception
    {
    public:
        RootNotFoundException(const std::filesystem::path& p)
            : Exception{ "Directory '" + p.string() + "' does not exist" }
            , _path{ p }
        {
        }

        const std::filesystem::path& getPath() const { return _path; }

    private:
        std::filesystem::path _path;
    };
} // namespace shelf::scanner
