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

#include "spellkit/string.hpp"

#include <unicode/localpointer.h>
#include <unicode/ucasemap.h>
#include <unicode/uchar.h>
#include <unicode/utypes.h>

#include <algorithm>
#include <functional>

namespace {

using CasemapperT = std::function<int32_t(const UCaseMap*, char*, int32_t, const char*, int32_t, UErrorCode*)>;

void applyCasemap(sk::u8str& str, const CasemapperT& casemapper) noexcept {
    if (str.empty()) return;

    // Set up case mapper
    UErrorCode status = U_ZERO_ERROR;
    icu::LocalUCaseMapPointer csm(ucasemap_open("", U_FOLD_CASE_DEFAULT, &status));
    if (csm.isNull() || U_FAILURE(status)) return;

    // Calculate length of dst
    const auto src_length = static_cast<int32_t>(str.size());
    int32_t dst_length = casemapper(csm.getAlias(), nullptr, 0, str.data(), src_length, &status);
    if (U_FAILURE(status) && status != U_BUFFER_OVERFLOW_ERROR) return; // Ignoring buffer overflow error on purpose
    status = U_ZERO_ERROR;

    // Apply case mapping
    sk::u8str dst(dst_length, '\0');
    int32_t dst_length_actually_written =
        casemapper(csm.getAlias(), dst.data(), dst_length, str.data(), src_length, &status);
    if (dst_length_actually_written != dst_length || U_FAILURE(status)) return;
    str = std::move(dst);
}

bool isWhitespace(sk::u8char c) noexcept {
    // Bytes >= 0x80 are parts of multi-byte sequences, never whitespace on their own
    auto byte = static_cast<unsigned char>(c);
    return byte < 0x80 && u_isWhitespace(byte);
}

} // namespace

void sk::str::lowercase(u8str& str) noexcept {
    applyCasemap(str, ucasemap_utf8ToLower);
}

void sk::str::uppercase(u8str& str) noexcept {
    applyCasemap(str, ucasemap_utf8ToUpper);
}

sk::u8str sk::str::to_lowercase(const u8str& str) noexcept {
    u8str dst(str);
    lowercase(dst);
    return dst;
}

void sk::str::trim(u8str& src) noexcept {
    src.erase(std::find_if_not(src.rbegin(), src.rend(), isWhitespace).base(), src.end());
    src.erase(src.begin(), std::find_if_not(src.begin(), src.end(), isWhitespace));
}

void sk::str::split(const u8str& src, u8char delim, std::vector<u8str>& dst) noexcept {
    dst.clear();
    size_t last = 0;
    size_t next = 0;
    while ((next = src.find(delim, last)) != u8str::npos) {
        dst.push_back(src.substr(last, next - last));
        last = next + 1;
    }
    dst.push_back(src.substr(last));
}

std::vector<std::size_t> sk::str::findAllIgnoreCase(u8str_view haystack, u8str_view needle) noexcept {
    std::vector<std::size_t> positions;
    if (needle.empty() || needle.size() > haystack.size()) return positions;

    auto equalsIgnoreCase = [](u8char a, u8char b) { return toRomanLowercase(a) == toRomanLowercase(b); };
    auto pos = haystack.begin();
    while (true) {
        pos = std::search(pos, haystack.end(), needle.begin(), needle.end(), equalsIgnoreCase);
        if (pos == haystack.end()) break;
        positions.push_back(static_cast<std::size_t>(pos - haystack.begin()));
        pos += static_cast<std::ptrdiff_t>(needle.size());
    }
    return positions;
}
