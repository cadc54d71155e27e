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

#include "spellkit/text_checker.hpp"

#include "spellkit/tokenizer.hpp"

namespace sk::spell {

std::vector<SpellCheckItem> TextChecker::check(sk::u8str_view text) const {
    // All lookups of one check read the same snapshot, even if the model is rebuilt meanwhile
    auto snapshot = model_.snapshot();

    auto words = Tokenizer::extractWords(text);
    std::vector<SpellCheckItem> items;
    for (auto& unknown_word : filterWords(*snapshot, words, false)) {
        auto suggestions = search_.suggest(*snapshot, unknown_word);
        items.push_back({std::move(unknown_word), std::move(suggestions)});
    }
    return items;
}

} // namespace sk::spell
