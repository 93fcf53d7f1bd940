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

#include "scanner/NameNormalizer.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace shelf::scanner
{
    namespace
    {
        struct DecodedCodePoint
        {
            char32_t value;
            std::size_t length;
        };

        bool isContinuationByte(unsigned char c)
        {
            return (c & 0xC0) == 0x80;
        }

        // nullopt on invalid sequence, the caller skips one byte
        std::optional<DecodedCodePoint> decodeUtf8(std::string_view str, std::size_t pos)
        {
            const unsigned char lead{ static_cast<unsigned char>(str[pos]) };
            if (lead < 0x80)
                return DecodedCodePoint{ lead, 1 };

            std::size_t length{};
            char32_t value{};
            if (lead >= 0xC2 && lead <= 0xDF)
            {
                length = 2;
                value = lead & 0x1F;
            }
            else if (lead >= 0xE0 && lead <= 0xEF)
            {
                length = 3;
                value = lead & 0x0F;
            }
            else if (lead >= 0xF0 && lead <= 0xF4)
            {
                length = 4;
                value = lead & 0x07;
            }
            else
                return std::nullopt;

            if (pos + length > str.size())
                return std::nullopt;

            for (std::size_t i{ 1 }; i < length; ++i)
            {
                const unsigned char c{ static_cast<unsigned char>(str[pos + i]) };
                if (!isContinuationByte(c))
                    return std::nullopt;

                value = (value << 6) | (c & 0x3F);
            }

            // overlong forms, surrogates and out of range values
            if ((length == 3 && value < 0x800) || (length == 4 && (value < 0x10000 || value > 0x10FFFF)) || (value >= 0xD800 && value <= 0xDFFF))
                return std::nullopt;

            return DecodedCodePoint{ value, length };
        }

        void encodeUtf8(char32_t value, std::string& output)
        {
            if (value < 0x80)
            {
                output.push_back(static_cast<char>(value));
            }
            else if (value < 0x800)
            {
                output.push_back(static_cast<char>(0xC0 | (value >> 6)));
                output.push_back(static_cast<char>(0x80 | (value & 0x3F)));
            }
            else if (value < 0x10000)
            {
                output.push_back(static_cast<char>(0xE0 | (value >> 12)));
                output.push_back(static_cast<char>(0x80 | ((value >> 6) & 0x3F)));
                output.push_back(static_cast<char>(0x80 | (value & 0x3F)));
            }
            else
            {
                output.push_back(static_cast<char>(0xF0 | (value >> 18)));
                output.push_back(static_cast<char>(0x80 | ((value >> 12) & 0x3F)));
                output.push_back(static_cast<char>(0x80 | ((value >> 6) & 0x3F)));
                output.push_back(static_cast<char>(0x80 | (value & 0x3F)));
            }
        }

        constexpr std::pair<char32_t, char32_t> removedRanges[]{
            { 0x0080, 0x00A9 }, // Latin-1 controls, punctuation and symbols
            { 0x00AB, 0x00B4 },
            { 0x00B6, 0x00B9 },
            { 0x00BB, 0x00BF },
            { 0x00D7, 0x00D7 },
            { 0x00F7, 0x00F7 },
            { 0x0300, 0x036F }, // combining diacritical marks
            { 0x2000, 0x206F }, // general punctuation
            { 0x2190, 0x2BFF }, // arrows, math operators, technical, box drawing, shapes, dingbats
            { 0x2E00, 0x2E7F }, // supplemental punctuation
            { 0x3000, 0x3004 }, // CJK symbols and punctuation
            { 0x3007, 0x3030 },
            { 0x3036, 0x303A },
            { 0x303D, 0x303F },
            { 0xFE30, 0xFE6F }, // CJK compatibility and small forms
            { 0xFF01, 0xFF20 }, // fullwidth punctuation and digits
            { 0xFF3B, 0xFF40 },
            { 0xFF5B, 0xFF65 },
            { 0x1F000, 0x1FAFF }, // emoji and pictographs
        };

        bool isKept(char32_t c)
        {
            if (c < 0x80)
            {
                return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '+' || c == '!';
            }

            return std::none_of(std::cbegin(removedRanges), std::cend(removedRanges), [c](const auto& range) { return c >= range.first && c <= range.second; });
        }

        char32_t toLower(char32_t c)
        {
            if (c >= 'A' && c <= 'Z')
                return c + 0x20;

            // Latin-1
            if (c >= 0xC0 && c <= 0xDE && c != 0xD7)
                return c + 0x20;

            // Latin Extended-A
            if ((c >= 0x100 && c <= 0x137) || (c >= 0x14A && c <= 0x177))
                return (c % 2 == 0) ? c + 1 : c;
            if ((c >= 0x139 && c <= 0x148) || (c >= 0x179 && c <= 0x17E))
                return (c % 2 == 1) ? c + 1 : c;
            if (c == 0x178)
                return 0xFF;

            // Greek
            if (c >= 0x391 && c <= 0x3A9 && c != 0x3A2)
                return c + 0x20;

            // Cyrillic
            if (c >= 0x400 && c <= 0x40F)
                return c + 0x50;
            if (c >= 0x410 && c <= 0x42F)
                return c + 0x20;

            // Fullwidth Latin
            if (c >= 0xFF21 && c <= 0xFF3A)
                return c + 0x20;

            return c;
        }
    } // namespace

    std::string normalize(std::string_view name)
    {
        std::string normalized;
        normalized.reserve(name.size());

        std::size_t pos{};
        while (pos < name.size())
        {
            const std::optional<DecodedCodePoint> codePoint{ decodeUtf8(name, pos) };
            if (!codePoint)
            {
                ++pos;
                continue;
            }

            if (isKept(codePoint->value))
                encodeUtf8(toLower(codePoint->value), normalized);

            pos += codePoint->length;
        }

        if (normalized.empty())
            return std::string{ name };

        return normalized;
    }
} // namespace shelf::scanner
