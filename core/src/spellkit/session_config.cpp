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

#include "spellkit/session_config.hpp"

#include "spellkit/candidate_generator.hpp"

namespace sk::spell {

std::vector<std::filesystem::path> SessionConfig::resolveCorpusPaths(const std::filesystem::path& base_dir) const {
    std::vector<std::filesystem::path> paths;
    for (auto& raw_path : corpus_paths) {
        std::filesystem::path path(raw_path);
        paths.push_back(path.is_relative() ? base_dir / path : path);
    }
    return paths;
}

void to_json(json& j, const SessionConfig& config) {
    j = json {
        {"corpusPaths", config.corpus_paths},
        {"alphabet", config.alphabet},
        {"maxSuggestions", config.max_suggestions},
        {"maxWordLength", config.max_word_length},
        {"matchMode", config.match_mode}};
}

void from_json(const json& j, SessionConfig& config) {
    j.at("corpusPaths").get_to(config.corpus_paths);
    if (j.contains("alphabet")) {
        j.at("alphabet").get_to(config.alphabet);
    }
    if (j.contains("maxSuggestions")) {
        j.at("maxSuggestions").get_to(config.max_suggestions);
    }
    if (j.contains("maxWordLength")) {
        j.at("maxWordLength").get_to(config.max_word_length);
    }
    if (j.contains("matchMode")) {
        auto& raw_mode = j.at("matchMode");
        if (!raw_mode.is_string() || (raw_mode != "substring" && raw_mode != "word")) {
            throw SessionConfigError("Invalid match mode " + raw_mode.dump() + ", expected \"substring\" or \"word\"!");
        }
        raw_mode.get_to(config.match_mode);
    }

    if (config.corpus_paths.empty()) {
        throw SessionConfigError("At least one corpus path must be specified!");
    }
    if (!CandidateGenerator::isValidAlphabet(config.alphabet)) {
        throw SessionConfigError("Alphabet must be a non-empty set of distinct letters a-z!");
    }
}

} // namespace sk::spell
