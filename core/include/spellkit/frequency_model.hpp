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

#ifndef __SPELLKIT_CORE_FREQUENCY_MODEL_H__
#define __SPELLKIT_CORE_FREQUENCY_MODEL_H__

#include "spellkit/common.hpp"
#include "spellkit/string.hpp"

#include <memory>
#include <shared_mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace sk::spell {

/**
 * Immutable word -> occurrence count mapping. Keys are lowercase runs of a-z, every count is >= 1. Once
 * published by a FrequencyModel a snapshot is never mutated, so it can be read from any thread without locking.
 */
class FrequencySnapshot {
  public:
    using MapT = std::unordered_map<sk::u8str, count_t>;

    FrequencySnapshot() = default;
    explicit FrequencySnapshot(MapT&& counts);
    FrequencySnapshot(const FrequencySnapshot&) = delete;
    FrequencySnapshot(FrequencySnapshot&&) = default;
    ~FrequencySnapshot() = default;

    static FrequencySnapshot fromText(sk::u8str_view text);

    // Expects an already lowercase key.
    bool contains(const sk::u8str& lower_word) const noexcept {
        return counts_.contains(lower_word);
    }

    // Returns 0 for words not in the snapshot.
    count_t countOf(const sk::u8str& lower_word) const noexcept;

    const MapT& entries() const noexcept {
        return counts_;
    }

    std::size_t vocabSize() const noexcept {
        return counts_.size();
    }

    count_t totalCount() const noexcept {
        return total_count_;
    }

    FrequencyStats stats(std::size_t top_n) const;

  private:
    MapT counts_;
    count_t total_count_ = 0;
};

class FrequencyModel {
  public:
    using SnapshotPtr = std::shared_ptr<const FrequencySnapshot>;

    FrequencyModel() = default;
    FrequencyModel(const FrequencyModel&) = delete;
    FrequencyModel(FrequencyModel&&) = delete;
    ~FrequencyModel() = default;

    FrequencyModel& operator=(const FrequencyModel&) = delete;
    FrequencyModel& operator=(FrequencyModel&&) = delete;

    // Tokenizes the text, counts every word and replaces the current snapshot wholesale. If tokenizing throws the
    // current snapshot is left untouched.
    void build(sk::u8str_view text);

    [[nodiscard]]
    bool isBuilt() const noexcept;

    // Throws NotInitializedError if build() never succeeded.
    [[nodiscard]]
    SnapshotPtr snapshot() const;

    bool isKnown(const sk::u8str& word) const;

    // The word must be known, see isKnown().
    count_t frequency(const sk::u8str& word) const;

    std::vector<sk::u8str> filterKnown(std::span<const sk::u8str> words) const;

    std::vector<sk::u8str> filterUnknown(std::span<const sk::u8str> words) const;

    FrequencyStats stats(std::size_t top_n) const;

  private:
    // Guards the pointer swap only, snapshots themselves are immutable.
    mutable std::shared_mutex mutex_;
    SnapshotPtr snapshot_ = nullptr;
};

// Distinct lowercase forms of `words` that are (or are not) known to `snapshot`, in first-occurrence order.
std::vector<sk::u8str> filterWords(const FrequencySnapshot& snapshot, std::span<const sk::u8str> words, bool known);

} // namespace sk::spell

#endif
