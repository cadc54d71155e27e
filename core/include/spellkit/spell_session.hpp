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

#ifndef __SPELLKIT_CORE_SPELL_SESSION_H__
#define __SPELLKIT_CORE_SPELL_SESSION_H__

#include "spellkit/auto_corrector.hpp"
#include "spellkit/common.hpp"
#include "spellkit/frequency_model.hpp"
#include "spellkit/session_config.hpp"
#include "spellkit/string.hpp"
#include "spellkit/suggestion_search.hpp"
#include "spellkit/text_checker.hpp"

#include <filesystem>
#include <memory>
#include <span>
#include <vector>

namespace sk::spell {

/**
 * Owns one frequency model together with the components querying it. Sessions are independent of each other, so
 * e.g. one session per language can coexist in a process.
 *
 * Every query throws NotInitializedError until a corpus has been built. Once built, all const members may be
 * called concurrently, also while buildCorpus() or loadCorpusFromFile(s)() rebuilds the model; such a rebuild is
 * observed either completely or not at all. loadConfigFromFile() replaces the query components themselves and
 * must not run concurrently with any other member.
 */
class SpellSession {
  public:
    SpellSession();
    explicit SpellSession(const SessionConfig& config);
    SpellSession(const SpellSession&) = delete;
    SpellSession(SpellSession&&) = delete;
    ~SpellSession() = default;

    SpellSession& operator=(const SpellSession&) = delete;
    SpellSession& operator=(SpellSession&&) = delete;

    // Reads a JSON session config, then builds the model from its corpus files. Relative corpus paths are
    // resolved against the config file's directory. On failure the session is left as it was. Requires exclusive
    // access to the session.
    void loadConfigFromFile(const std::filesystem::path& config_path);

    void buildCorpus(sk::u8str_view text);

    // Throws CorpusLoadError if the file cannot be read, keeping the previous model.
    void loadCorpusFromFile(const std::filesystem::path& corpus_path);

    void loadCorpusFromFiles(const std::vector<std::filesystem::path>& corpus_paths);

    [[nodiscard]]
    bool isCorpusBuilt() const noexcept {
        return model_.isBuilt();
    }

    std::vector<sk::u8str> findKnownWords(std::span<const sk::u8str> words) const;

    std::vector<sk::u8str> findUnknownWords(std::span<const sk::u8str> words) const;

    std::vector<sk::u8str> suggestAlternatives(const sk::u8str& word) const;

    std::vector<SpellCheckItem> check(sk::u8str_view text) const;

    sk::u8str autoCorrect(sk::u8str_view text) const;

    FrequencyStats stats(std::size_t top_n) const;

    const SessionConfig& config() const noexcept {
        return config_;
    }

    const FrequencyModel& model() const noexcept {
        return model_;
    }

  private:
    SessionConfig config_;
    FrequencyModel model_;
    std::unique_ptr<SuggestionSearch> search_;
    std::unique_ptr<TextChecker> checker_;
    std::unique_ptr<AutoCorrector> corrector_;

    void initComponents();
};

} // namespace sk::spell

#endif
