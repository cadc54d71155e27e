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

#include "spellkit/auto_corrector.hpp"

#include "spellkit/tokenizer.hpp"

namespace sk::spell {

namespace {

// Replaces `length` bytes at each of the ascending, non-overlapping `positions` with `replacement`, restoring an
// uppercase first letter where the replaced occurrence had one.
//
// Capitalization is applied at the positions of the replaced occurrences only. The rewritten text is
// deliberately not searched again for the replacement word, so an occurrence of that word already present in the
// text keeps its casing: "the Teh" becomes "the The", not "The the".
void replaceOccurrences(
    sk::u8str& text, const std::vector<std::size_t>& positions, std::size_t length, const sk::u8str& replacement
) {
    if (positions.empty()) return;

    sk::u8str rewritten;
    rewritten.reserve(text.size() + positions.size() * replacement.size());
    std::size_t last = 0;
    for (auto pos : positions) {
        rewritten.append(text, last, pos - last);
        auto replacement_start = rewritten.size();
        rewritten.append(replacement);
        if (!replacement.empty() && sk::str::isRomanUppercase(text[pos])) {
            rewritten[replacement_start] = sk::str::toRomanUppercase(rewritten[replacement_start]);
        }
        last = pos + length;
    }
    rewritten.append(text, last);
    text = std::move(rewritten);
}

} // namespace

sk::u8str AutoCorrector::autoCorrect(sk::u8str_view text) const {
    auto items = checker_.check(text);

    sk::u8str corrected(text);
    for (auto& item : items) {
        if (!item.hasSuggestions()) continue;
        auto positions = findOccurrences(corrected, item.suspected_word);
        replaceOccurrences(corrected, positions, item.suspected_word.size(), item.suggested_alternatives.front());
    }
    return corrected;
}

std::vector<std::size_t> AutoCorrector::findOccurrences(sk::u8str_view text, const sk::u8str& word) const {
    if (match_mode_ == MatchMode::Substring) {
        return sk::str::findAllIgnoreCase(text, word);
    }

    std::vector<std::size_t> positions;
    for (auto& token : Tokenizer::extractTokens(text)) {
        if (token.word == word) {
            positions.push_back(token.begin);
        }
    }
    return positions;
}

} // namespace sk::spell
