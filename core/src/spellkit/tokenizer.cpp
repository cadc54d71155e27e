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

#include "spellkit/tokenizer.hpp"

#include <unicode/utext.h>
#include <unicode/utypes.h>

#include <functional>
#include <stdexcept>

namespace sk::spell {

namespace {

bool isRomanLetter(UChar32 cp) noexcept {
    return cp < 0x80 && sk::str::isRomanLetter(static_cast<sk::u8char>(cp));
}

void forEachRun(sk::u8str_view text, const std::function<void(std::size_t, std::size_t)>& on_run) {
    if (text.empty()) return;

    UErrorCode status = U_ZERO_ERROR;
    UText* ut = utext_openUTF8(nullptr, text.data(), static_cast<int64_t>(text.size()), &status);
    if (U_FAILURE(status)) {
        utext_close(ut);
        throw std::runtime_error("Failed to open text for tokenization!");
    }

    int64_t run_begin = -1;
    int64_t index = utext_getNativeIndex(ut);
    UChar32 cp;
    while ((cp = utext_next32(ut)) != U_SENTINEL) {
        if (isRomanLetter(cp)) {
            if (run_begin < 0) run_begin = index;
        } else if (run_begin >= 0) {
            on_run(static_cast<std::size_t>(run_begin), static_cast<std::size_t>(index));
            run_begin = -1;
        }
        index = utext_getNativeIndex(ut);
    }
    if (run_begin >= 0) {
        on_run(static_cast<std::size_t>(run_begin), static_cast<std::size_t>(index));
    }

    utext_close(ut);
}

sk::u8str lowercaseRun(sk::u8str_view text, std::size_t begin, std::size_t end) {
    sk::u8str word(text.substr(begin, end - begin));
    for (auto& c : word) {
        c = sk::str::toRomanLowercase(c);
    }
    return word;
}

} // namespace

std::vector<sk::u8str> Tokenizer::extractWords(sk::u8str_view text) {
    std::vector<sk::u8str> words;
    forEachRun(text, [&](std::size_t begin, std::size_t end) {
        words.push_back(lowercaseRun(text, begin, end));
    });
    return words;
}

std::vector<Token> Tokenizer::extractTokens(sk::u8str_view text) {
    std::vector<Token> tokens;
    forEachRun(text, [&](std::size_t begin, std::size_t end) {
        tokens.push_back({lowercaseRun(text, begin, end), begin, end});
    });
    return tokens;
}

} // namespace sk::spell
