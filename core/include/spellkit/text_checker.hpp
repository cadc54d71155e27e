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

#ifndef __SPELLKIT_CORE_TEXT_CHECKER_H__
#define __SPELLKIT_CORE_TEXT_CHECKER_H__

#include "spellkit/common.hpp"
#include "spellkit/frequency_model.hpp"
#include "spellkit/suggestion_search.hpp"

#include <vector>

namespace sk::spell {

class TextChecker {
  public:
    TextChecker() = delete;
    TextChecker(const FrequencyModel& model, const SuggestionSearch& search) : model_(model), search_(search) {}
    ~TextChecker() = default;

    // One item per distinct unknown word of the text, in order of first occurrence.
    std::vector<SpellCheckItem> check(sk::u8str_view text) const;

  private:
    const FrequencyModel& model_;
    const SuggestionSearch& search_;
};

} // namespace sk::spell

#endif
