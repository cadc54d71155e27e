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

#ifndef __SPELLKIT_CORE_SUGGESTION_SEARCH_H__
#define __SPELLKIT_CORE_SUGGESTION_SEARCH_H__

#include "spellkit/candidate_generator.hpp"
#include "spellkit/common.hpp"
#include "spellkit/frequency_model.hpp"
#include "spellkit/string.hpp"

#include <cstddef>
#include <vector>

namespace sk::spell {

struct SearchOptions {
    // Maximum number of suggestions returned, 0 means unlimited.
    std::size_t max_suggestions = 0;
    // Unknown words longer than this get no suggestions, 0 means unlimited. The second generation costs
    // O((alphabet_size * length)^2) lookups, so callers handling untrusted input should set this.
    std::size_t max_word_length = 0;
};

/**
 * Finds the known words nearest to a given word. Candidates one edit away are tried first; only if none of them
 * is known, every candidate of the first generation (known or not) is expanded once more and the known words of
 * that second generation are returned. Results are ranked by descending corpus frequency, equal frequencies in
 * ascending lexicographic order. A known input word is returned as is, lowercased.
 */
class SuggestionSearch {
  public:
    SuggestionSearch() = delete;
    SuggestionSearch(const FrequencyModel& model, CandidateGenerator generator, SearchOptions options = {})
        : model_(model), generator_(std::move(generator)), options_(options) {}
    ~SuggestionSearch() = default;

    // Throws NotInitializedError if the model has not been built.
    std::vector<sk::u8str> suggest(const sk::u8str& word) const;

    // Same as suggest(), but reads from the given snapshot instead of fetching the model's current one.
    std::vector<sk::u8str> suggest(const FrequencySnapshot& snapshot, const sk::u8str& word) const;

    const SearchOptions& options() const noexcept {
        return options_;
    }

  private:
    const FrequencyModel& model_;
    CandidateGenerator generator_;
    SearchOptions options_;

    void rank(const FrequencySnapshot& snapshot, std::vector<sk::u8str>& candidates) const;
};

} // namespace sk::spell

#endif
