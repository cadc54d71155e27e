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

#include "spellkit/candidate_generator.hpp"

#include <unicode/utf8.h>
#include <unicode/utypes.h>

#include <array>
#include <stdexcept>
#include <unordered_set>
#include <vector>

namespace sk::spell {

namespace {

// Ill-formed sequences count as one character per maximal invalid subsequence, as U8_NEXT steps over them.
std::vector<std::size_t> codePointBounds(const sk::u8str& word) {
    std::vector<std::size_t> bounds;
    bounds.reserve(word.size() + 1);
    const auto length = static_cast<int32_t>(word.size());
    int32_t index = 0;
    while (index < length) {
        bounds.push_back(static_cast<std::size_t>(index));
        UChar32 cp;
        U8_NEXT(word.data(), index, length, cp);
    }
    bounds.push_back(word.size());
    return bounds;
}

} // namespace

CandidateGenerator::CandidateGenerator(const sk::u8str& alphabet) : alphabet_(alphabet) {
    if (!isValidAlphabet(alphabet_)) {
        throw std::invalid_argument("Alphabet must be a non-empty set of distinct letters a-z!");
    }
}

bool CandidateGenerator::isValidAlphabet(const sk::u8str& alphabet) noexcept {
    if (alphabet.empty()) return false;
    std::array<bool, 26> seen {};
    for (auto c : alphabet) {
        if (c < 'a' || c > 'z') return false;
        auto& is_seen = seen[c - 'a'];
        if (is_seen) return false;
        is_seen = true;
    }
    return true;
}

void CandidateGenerator::forEachCandidate(const sk::u8str& word, const CandidateAction& action) const {
    // Byte offsets of every code point boundary, so edits never split a multi-byte character
    auto bounds = codePointBounds(word);
    const std::size_t length = bounds.size() - 1;
    sk::u8str candidate;
    candidate.reserve(word.size() + 1);

    // Deletions
    for (std::size_t i = 0; i < length; i++) {
        candidate.assign(word, 0, bounds[i]);
        candidate.append(word, bounds[i + 1]);
        action(candidate);
    }

    // Transpositions
    for (std::size_t i = 0; i + 1 < length; i++) {
        candidate.assign(word, 0, bounds[i]);
        candidate.append(word, bounds[i + 1], bounds[i + 2] - bounds[i + 1]);
        candidate.append(word, bounds[i], bounds[i + 1] - bounds[i]);
        candidate.append(word, bounds[i + 2]);
        action(candidate);
    }

    // Substitutions
    for (std::size_t i = 0; i < length; i++) {
        for (auto c : alphabet_) {
            candidate.assign(word, 0, bounds[i]);
            candidate.push_back(c);
            candidate.append(word, bounds[i + 1]);
            action(candidate);
        }
    }

    // Insertions, including after the last character
    for (std::size_t i = 0; i <= length; i++) {
        for (auto c : alphabet_) {
            candidate.assign(word, 0, bounds[i]);
            candidate.push_back(c);
            candidate.append(word, bounds[i]);
            action(candidate);
        }
    }
}

std::vector<sk::u8str> CandidateGenerator::generate(const sk::u8str& word) const {
    std::vector<sk::u8str> candidates;
    std::unordered_set<sk::u8str> seen;
    forEachCandidate(word, [&](const sk::u8str& candidate) {
        if (seen.insert(candidate).second) {
            candidates.push_back(candidate);
        }
    });
    return candidates;
}

} // namespace sk::spell
