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

#ifndef __SPELLKIT_CORE_COMMON_H__
#define __SPELLKIT_CORE_COMMON_H__

#include "spellkit/string.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace sk::spell {

// Occurrence count of a word in the corpus. A word present in a model always has a count >= 1.
using count_t = uint64_t;
static const count_t COUNT_MIN = 1;

static const sk::u8str DEFAULT_ALPHABET = "abcdefghijklmnopqrstuvwxyz";

// ----- Errors ----- //

class NotInitializedError : public std::runtime_error {
  public:
    NotInitializedError()
        : std::runtime_error("Frequency model has not been built. Build the corpus before querying it!") {};
    ~NotInitializedError() = default;
};

class SessionConfigError : public std::runtime_error {
  public:
    explicit SessionConfigError(const std::string& msg) : std::runtime_error(msg) {};
    ~SessionConfigError() = default;
};

// ----- SpellCheckItem ----- //

struct SpellCheckItem {
    const sk::u8str suspected_word;
    // Sorted by descending corpus frequency, may be empty.
    const std::vector<sk::u8str> suggested_alternatives;

    bool hasSuggestions() const noexcept {
        return !suggested_alternatives.empty();
    }

    bool operator==(const SpellCheckItem& other) const = default;
};

void to_json(nlohmann::json& j, const SpellCheckItem& item);

// ----- FrequencyStats ----- //

struct WordCount {
    sk::u8str word;
    count_t count;

    bool operator==(const WordCount& other) const = default;
};

struct FrequencyStats {
    std::size_t vocab_size = 0;
    count_t total_count = 0;
    std::vector<WordCount> top_words;
};

void to_json(nlohmann::json& j, const FrequencyStats& stats);

} // namespace sk::spell

#endif
