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

#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

#include "scanner/Exception.hpp"
#include "scanner/IFileParser.hpp"
#include "scanner/IFileSystem.hpp"

namespace shelf::scanner::tests
{
    // Returns the records it has been given, per file and optionally per library type
    class TestFileParser final : public IFileParser
    {
    public:
        TestFileParser(const IFileSystem& fileSystem)
            : _fileSystem{ fileSystem }
        {
        }
        ~TestFileParser() override = default;
        TestFileParser(const TestFileParser&) = delete;
        TestFileParser& operator=(const TestFileParser&) = delete;

        void setRecord(const std::filesystem::path& file, ParsedRecord record)
        {
            record.fullFilePath = file;
            record.filename = file.filename().string();
            _records[file] = std::move(record);
        }

        void setRecord(const std::filesystem::path& file, LibraryType libraryType, ParsedRecord record)
        {
            record.fullFilePath = file;
            record.filename = file.filename().string();
            _recordsByType[{ file, libraryType }] = std::move(record);
        }

        void setEmbeddedMetadata(const std::filesystem::path& file, EmbeddedMetadata metadata)
        {
            _metadata[file] = std::move(metadata);
        }

        void setThrowing(const std::filesystem::path& file)
        {
            _throwingFile = file;
        }

        // Simulates a file removed after enumeration
        void setMissing(const std::filesystem::path& file)
        {
            _missingFile = file;
        }

        std::size_t getParseCount() const
        {
            std::scoped_lock lock{ _mutex };
            return _parseCount;
        }

        std::unique_ptr<ParsedRecord> parse(const std::filesystem::path& file, const std::filesystem::path& /*scanRoot*/, LibraryType libraryType) override
        {
            {
                std::scoped_lock lock{ _mutex };
                _parseCount += 1;
            }

            if (!_fileSystem.isFile(file) || _missingFile == file)
                throw FileNotFoundException{ file };

            if (_throwingFile == file)
                throw std::runtime_error{ "corrupted file" };

            if (auto it{ _recordsByType.find({ file, libraryType }) }; it != std::cend(_recordsByType))
                return std::make_unique<ParsedRecord>(it->second);

            if (auto it{ _records.find(file) }; it != std::cend(_records))
                return std::make_unique<ParsedRecord>(it->second);

            return nullptr;
        }

        std::optional<EmbeddedMetadata> getEmbeddedMetadata(const std::filesystem::path& file) override
        {
            if (auto it{ _metadata.find(file) }; it != std::cend(_metadata))
                return it->second;

            return std::nullopt;
        }

    private:
        const IFileSystem& _fileSystem;
        std::map<std::filesystem::path, ParsedRecord> _records;
        std::map<std::pair<std::filesystem::path, LibraryType>, ParsedRecord> _recordsByType;
        std::map<std::filesystem::path, EmbeddedMetadata> _metadata;
        std::optional<std::filesystem::path> _throwingFile;
        std::optional<std::filesystem::path> _missingFile;

        mutable std::mutex _mutex;
        std::size_t _parseCount{};
    };
} // namespace shelf::scanner::tests
