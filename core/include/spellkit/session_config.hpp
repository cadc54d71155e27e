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

#ifndef __SPELLKIT_CORE_SESSION_CONFIG_H__
#define __SPELLKIT_CORE_SESSION_CONFIG_H__

#include "spellkit/auto_corrector.hpp"
#include "spellkit/common.hpp"
#include "spellkit/suggestion_search.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace sk::spell {

using json = nlohmann::json;

struct SessionConfig {
    std::vector<std::string> corpus_paths;
    sk::u8str alphabet = DEFAULT_ALPHABET;
    std::size_t max_suggestions = 0;
    // 0 means unlimited. Front ends handling untrusted input set a bound here.
    std::size_t max_word_length = 0;
    MatchMode match_mode = MatchMode::Substring;

    SearchOptions searchOptions() const noexcept {
        return {max_suggestions, max_word_length};
    }

    // Corpus paths with relative entries resolved against base_dir.
    std::vector<std::filesystem::path> resolveCorpusPaths(const std::filesystem::path& base_dir) const;
};

void to_json(json& j, const SessionConfig& config);

// Throws SessionConfigError for semantically invalid values and nlohmann::json::exception for missing keys or
// mismatching types.
void from_json(const json& j, SessionConfig& config);

} // namespace sk::spell

#endif
