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

#ifndef __SPELLKIT_CORE_AUTO_CORRECTOR_H__
#define __SPELLKIT_CORE_AUTO_CORRECTOR_H__

#include "spellkit/common.hpp"
#include "spellkit/string.hpp"
#include "spellkit/text_checker.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <vector>

namespace sk::spell {

// Decides which occurrences of a suspected word get rewritten.
enum class MatchMode {
    // Every case-insensitive substring match, also inside longer words.
    Substring,
    // Only whole words as produced by the Tokenizer.
    Word,
};

NLOHMANN_JSON_SERIALIZE_ENUM(MatchMode, {
    {MatchMode::Substring, "substring"},
    {MatchMode::Word, "word"},
})

/**
 * Rewrites a text by replacing every unknown word with its best ranked suggestion.
 *
 * The set and order of corrections is fixed by checking the original text once. Corrections are then applied one
 * after the other, each on the text as already rewritten by the previous ones. Replacements are inserted in lower
 * case; if the replaced occurrence started with an uppercase letter, so does its replacement. Unknown words
 * without any suggestion are left untouched.
 *
 * In MatchMode::Substring a suspected word is matched case-insensitively anywhere in the text, so "teh" is also
 * rewritten inside "tehran". MatchMode::Word restricts matches to whole words.
 */
class AutoCorrector {
  public:
    AutoCorrector() = delete;
    AutoCorrector(const TextChecker& checker, MatchMode match_mode = MatchMode::Substring)
        : checker_(checker), match_mode_(match_mode) {}
    ~AutoCorrector() = default;

    sk::u8str autoCorrect(sk::u8str_view text) const;

    MatchMode matchMode() const noexcept {
        return match_mode_;
    }

  private:
    const TextChecker& checker_;
    MatchMode match_mode_;

    std::vector<std::size_t> findOccurrences(sk::u8str_view text, const sk::u8str& word) const;
};

} // namespace sk::spell

#endif
