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

#ifndef __SPELLKIT_CORE_CANDIDATE_GENERATOR_H__
#define __SPELLKIT_CORE_CANDIDATE_GENERATOR_H__

#include "spellkit/common.hpp"
#include "spellkit/string.hpp"

#include <functional>
#include <vector>

namespace sk::spell {

/**
 * Produces every string one edit away from a word, where an edit is a single deletion, a swap of two adjacent
 * characters, a substitution by an alphabet letter or an insertion of an alphabet letter.
 *
 * For each split of the word into `left + right` (split index 0 up to and including the word length) the
 * candidates are generated as
 *  - deletion:      `left + right[1:]`                        if right is not empty
 *  - transposition: `left + right[1] + right[0] + right[2:]`  if right has at least 2 characters
 *  - substitution:  `left + c + right[1:]`                    for every alphabet letter c, if right is not empty
 *  - insertion:     `left + c + right`                        for every alphabet letter c
 *
 * The emission order is fixed: all deletions, then transpositions, substitutions and insertions, each by
 * ascending split index and then alphabet order.
 *
 * Positions and lengths count UTF-8 code points, not bytes, so an edit always removes, moves or replaces a whole
 * character and every candidate of a well-formed word is well-formed UTF-8.
 */
class CandidateGenerator {
  public:
    using CandidateAction = std::function<void(const sk::u8str&)>;

    CandidateGenerator() : CandidateGenerator(DEFAULT_ALPHABET) {};
    // Throws std::invalid_argument if the alphabet is not a non-empty set of distinct letters a-z.
    explicit CandidateGenerator(const sk::u8str& alphabet);
    ~CandidateGenerator() = default;

    [[nodiscard]]
    const sk::u8str& alphabet() const noexcept {
        return alphabet_;
    }

    // Deduplicated candidates in emission order, keeping the first occurrence of each string.
    std::vector<sk::u8str> generate(const sk::u8str& word) const;

    // Calls action for every candidate in emission order, duplicates included.
    void forEachCandidate(const sk::u8str& word, const CandidateAction& action) const;

    static bool isValidAlphabet(const sk::u8str& alphabet) noexcept;

  private:
    sk::u8str alphabet_;
};

} // namespace sk::spell

#endif
