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

#include "spellkit/suggestion_search.hpp"

#include <algorithm>
#include <unordered_set>

namespace sk::spell {

std::vector<sk::u8str> SuggestionSearch::suggest(const sk::u8str& word) const {
    auto snapshot = model_.snapshot();
    return suggest(*snapshot, word);
}

std::vector<sk::u8str> SuggestionSearch::suggest(const FrequencySnapshot& snapshot, const sk::u8str& word) const {
    auto lower_word = sk::str::to_lowercase(word);
    if (snapshot.contains(lower_word)) {
        return {lower_word};
    }
    if (options_.max_word_length > 0 && lower_word.size() > options_.max_word_length) {
        return {};
    }

    // First generation
    auto first_generation = generator_.generate(lower_word);
    auto candidates = filterWords(snapshot, first_generation, true);

    // Second generation, expanding every first generation candidate
    if (candidates.empty()) {
        std::unordered_set<sk::u8str> seen;
        for (auto& first_candidate : first_generation) {
            generator_.forEachCandidate(first_candidate, [&](const sk::u8str& candidate) {
                if (snapshot.contains(candidate) && seen.insert(candidate).second) {
                    candidates.push_back(candidate);
                }
            });
        }
    }

    rank(snapshot, candidates);
    if (options_.max_suggestions > 0 && candidates.size() > options_.max_suggestions) {
        candidates.resize(options_.max_suggestions);
    }
    return candidates;
}

void SuggestionSearch::rank(const FrequencySnapshot& snapshot, std::vector<sk::u8str>& candidates) const {
    std::sort(candidates.begin(), candidates.end(), [&](const sk::u8str& a, const sk::u8str& b) {
        auto count_a = snapshot.countOf(a);
        auto count_b = snapshot.countOf(b);
        if (count_a == count_b) {
            return a < b;
        }
        return count_a > count_b;
    });
}

} // namespace sk::spell
