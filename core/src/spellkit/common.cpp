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

#include "spellkit/common.hpp"

namespace sk::spell {

void to_json(nlohmann::json& j, const SpellCheckItem& item) {
    j = nlohmann::json {
        {"suspectedWord", item.suspected_word},
        {"suggestedAlternatives", item.suggested_alternatives}};
}

void to_json(nlohmann::json& j, const FrequencyStats& stats) {
    auto top_words = nlohmann::json::array();
    for (auto& entry : stats.top_words) {
        top_words.push_back({{"word", entry.word}, {"count", entry.count}});
    }
    j = nlohmann::json {
        {"vocabSize", stats.vocab_size},
        {"totalCount", stats.total_count},
        {"topWords", top_words}};
}

} // namespace sk::spell
