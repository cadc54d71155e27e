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

#include "spellkit/spell_session.hpp"

#include "spellkit/candidate_generator.hpp"
#include "spellkit/corpus_loader.hpp"

#include <fstream>
#include <stdexcept>

namespace sk::spell {

SpellSession::SpellSession() : SpellSession(SessionConfig {}) {}

SpellSession::SpellSession(const SessionConfig& config) : config_(config) {
    initComponents();
}

void SpellSession::initComponents() {
    // Order matters, the checker and corrector hold references to the previous component
    corrector_.reset();
    checker_.reset();
    search_ = std::make_unique<SuggestionSearch>(
        model_, CandidateGenerator(config_.alphabet), config_.searchOptions()
    );
    checker_ = std::make_unique<TextChecker>(model_, *search_);
    corrector_ = std::make_unique<AutoCorrector>(*checker_, config_.match_mode);
}

void SpellSession::loadConfigFromFile(const std::filesystem::path& config_path) {
    std::ifstream config_file(config_path);
    if (!config_file.is_open()) {
        throw SessionConfigError("Cannot open config file at '" + config_path.string() + "'!");
    }
    auto json_config = nlohmann::json::parse(config_file);
    config_file.close();
    SessionConfig new_config;
    json_config.get_to(new_config);

    // Read everything before touching the session, so a failing corpus file keeps the current state
    auto corpus_paths = new_config.resolveCorpusPaths(config_path.parent_path());
    auto corpus_text = CorpusLoader::readFiles(corpus_paths);

    config_ = std::move(new_config);
    initComponents();
    model_.build(corpus_text);
}

void SpellSession::buildCorpus(sk::u8str_view text) {
    model_.build(text);
}

void SpellSession::loadCorpusFromFile(const std::filesystem::path& corpus_path) {
    model_.build(CorpusLoader::readFile(corpus_path));
}

void SpellSession::loadCorpusFromFiles(const std::vector<std::filesystem::path>& corpus_paths) {
    model_.build(CorpusLoader::readFiles(corpus_paths));
}

std::vector<sk::u8str> SpellSession::findKnownWords(std::span<const sk::u8str> words) const {
    return model_.filterKnown(words);
}

std::vector<sk::u8str> SpellSession::findUnknownWords(std::span<const sk::u8str> words) const {
    return model_.filterUnknown(words);
}

std::vector<sk::u8str> SpellSession::suggestAlternatives(const sk::u8str& word) const {
    return search_->suggest(word);
}

std::vector<SpellCheckItem> SpellSession::check(sk::u8str_view text) const {
    return checker_->check(text);
}

sk::u8str SpellSession::autoCorrect(sk::u8str_view text) const {
    return corrector_->autoCorrect(text);
}

FrequencyStats SpellSession::stats(std::size_t top_n) const {
    return model_.stats(top_n);
}

} // namespace sk::spell
