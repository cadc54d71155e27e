/*
 * Copyright 2023 Patrick Goldinger
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef __SPELLKIT_CORE_STRING_H__
#define __SPELLKIT_CORE_STRING_H__

#include <string>
#include <string_view>
#include <vector>

namespace sk {

using u8char = char;
using u8str = std::basic_string<u8char>;
using u8str_view = std::basic_string_view<u8char>;

namespace str {

void lowercase(u8str& str) noexcept;

void uppercase(u8str& str) noexcept;

u8str to_lowercase(const u8str& str) noexcept;

void trim(u8str& src) noexcept;

void split(const u8str& src, u8char delim, std::vector<u8str>& dst) noexcept;

// True for the 26 unaccented Roman letters in either case. Anything else, including accented letters, is not.
constexpr bool isRomanLetter(u8char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

constexpr bool isRomanUppercase(u8char c) noexcept {
    return c >= 'A' && c <= 'Z';
}

constexpr u8char toRomanLowercase(u8char c) noexcept {
    return isRomanUppercase(c) ? static_cast<u8char>(c - 'A' + 'a') : c;
}

constexpr u8char toRomanUppercase(u8char c) noexcept {
    return (c >= 'a' && c <= 'z') ? static_cast<u8char>(c - 'a' + 'A') : c;
}

/**
 * Finds every occurrence of `needle` in `haystack`, comparing Roman letters case-insensitively and every other
 * byte exactly. Occurrences are non-overlapping and reported left to right as byte offsets into `haystack`.
 */
std::vector<std::size_t> findAllIgnoreCase(u8str_view haystack, u8str_view needle) noexcept;

} // namespace str

} // namespace sk

#endif
