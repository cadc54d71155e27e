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

#include "spellkit/frequency_model.hpp"

#include "spellkit/assert.hpp"
#include "spellkit/tokenizer.hpp"

#include <algorithm>
#include <mutex>
#include <unordered_set>

namespace sk::spell {

// ----- FrequencySnapshot ----- //

FrequencySnapshot::FrequencySnapshot(MapT&& counts) : counts_(std::move(counts)) {
    for (auto& [word, count] : counts_) {
        total_count_ += count;
    }
}

FrequencySnapshot FrequencySnapshot::fromText(sk::u8str_view text) {
    MapT counts;
    for (auto& word : Tokenizer::extractWords(text)) {
        counts[std::move(word)]++;
    }
    return FrequencySnapshot(std::move(counts));
}

count_t FrequencySnapshot::countOf(const sk::u8str& lower_word) const noexcept {
    auto it = counts_.find(lower_word);
    return it != counts_.end() ? it->second : 0;
}

FrequencyStats FrequencySnapshot::stats(std::size_t top_n) const {
    FrequencyStats stats;
    stats.vocab_size = counts_.size();
    stats.total_count = total_count_;

    std::vector<WordCount> all_words;
    all_words.reserve(counts_.size());
    for (auto& [word, count] : counts_) {
        all_words.push_back({word, count});
    }
    auto n = std::min(top_n, all_words.size());
    std::partial_sort(all_words.begin(), all_words.begin() + n, all_words.end(), [](auto& a, auto& b) {
        return a.count != b.count ? a.count > b.count : a.word < b.word;
    });
    all_words.resize(n);
    stats.top_words = std::move(all_words);
    return stats;
}

std::vector<sk::u8str> filterWords(const FrequencySnapshot& snapshot, std::span<const sk::u8str> words, bool known) {
    std::vector<sk::u8str> result;
    std::unordered_set<sk::u8str> seen;
    for (auto& word : words) {
        auto lower_word = sk::str::to_lowercase(word);
        if (snapshot.contains(lower_word) != known) continue;
        if (seen.insert(lower_word).second) {
            result.push_back(std::move(lower_word));
        }
    }
    return result;
}

// ----- FrequencyModel ----- //

void FrequencyModel::build(sk::u8str_view text) {
    SnapshotPtr new_snapshot = std::make_shared<FrequencySnapshot>(FrequencySnapshot::fromText(text));
    std::scoped_lock<std::shared_mutex> lock(mutex_);
    snapshot_ = std::move(new_snapshot);
}

bool FrequencyModel::isBuilt() const noexcept {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return snapshot_ != nullptr;
}

FrequencyModel::SnapshotPtr FrequencyModel::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (snapshot_ == nullptr) {
        throw NotInitializedError();
    }
    return snapshot_;
}

bool FrequencyModel::isKnown(const sk::u8str& word) const {
    return snapshot()->contains(sk::str::to_lowercase(word));
}

count_t FrequencyModel::frequency(const sk::u8str& word) const {
    auto count = snapshot()->countOf(sk::str::to_lowercase(word));
    sk::require(count >= COUNT_MIN, "Requested frequency of a word which is not in the model!");
    return count;
}

std::vector<sk::u8str> FrequencyModel::filterKnown(std::span<const sk::u8str> words) const {
    return filterWords(*snapshot(), words, true);
}

std::vector<sk::u8str> FrequencyModel::filterUnknown(std::span<const sk::u8str> words) const {
    return filterWords(*snapshot(), words, false);
}

FrequencyStats FrequencyModel::stats(std::size_t top_n) const {
    return snapshot()->stats(top_n);
}

} // namespace sk::spell
