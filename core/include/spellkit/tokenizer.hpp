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

#ifndef __SPELLKIT_CORE_TOKENIZER_H__
#define __SPELLKIT_CORE_TOKENIZER_H__

#include "spellkit/string.hpp"

#include <cstddef>
#include <vector>

namespace sk::spell {

struct Token {
    // Lowercase form of the run.
    sk::u8str word;
    // Byte span [begin, end) of the run in the scanned text.
    std::size_t begin;
    std::size_t end;
};

/**
 * Splits UTF-8 text into words. A word is a maximal run of the unaccented Roman letters A-Z / a-z; every other
 * code point (digits, punctuation, accented letters, invalid byte sequences) separates words and is dropped.
 * Words are reported lowercase, in order of appearance and without deduplication.
 */
class Tokenizer {
  public:
    static std::vector<sk::u8str> extractWords(sk::u8str_view text);

    static std::vector<Token> extractTokens(sk::u8str_view text);
};

} // namespace sk::spell

#endif
