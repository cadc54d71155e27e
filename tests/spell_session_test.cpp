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

#include "spellkit/corpus_loader.hpp"
#include "spellkit/spell_session.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <thread>
#include <vector>

namespace {

using namespace sk::spell;
using Words = std::vector<sk::u8str>;

TEST(SpellSessionTest, EndToEndOnSmallCorpus) {
    SpellSession session;
    session.buildCorpus("the quick brown fox the the");
    EXPECT_TRUE(session.isCorpusBuilt());

    EXPECT_EQ(session.suggestAlternatives("teh"), (Words {"the"}));
    EXPECT_EQ(session.autoCorrect("I saw teh fox"), "I saw the fox");
    EXPECT_EQ(session.autoCorrect("Teh fox"), "The fox");
    EXPECT_EQ(session.autoCorrect("xzqvt fox"), "xzqvt fox");

    Words words = {"The", "teh", "FOX", "the"};
    EXPECT_EQ(session.findKnownWords(words), (Words {"the", "fox"}));
    EXPECT_EQ(session.findUnknownWords(words), (Words {"teh"}));
}

TEST(SpellSessionTest, CheckReportsSingleMisspelling) {
    SpellSession session;
    session.buildCorpus("i saw the quick brown fox the the");
    auto items = session.check("I saw teh fox");
    ASSERT_EQ(items.size(), 1);
    EXPECT_EQ(items[0], (SpellCheckItem {"teh", {"the"}}));
}

TEST(SpellSessionTest, QueriesBeforeBuildThrow) {
    SpellSession session;
    Words words = {"the"};
    EXPECT_FALSE(session.isCorpusBuilt());
    EXPECT_THROW(session.suggestAlternatives("teh"), NotInitializedError);
    EXPECT_THROW(session.findKnownWords(words), NotInitializedError);
    EXPECT_THROW(session.findUnknownWords(words), NotInitializedError);
    EXPECT_THROW(session.check("teh"), NotInitializedError);
    EXPECT_THROW(session.autoCorrect("teh"), NotInitializedError);
    EXPECT_THROW(session.stats(10), NotInitializedError);
}

TEST(SpellSessionTest, EverySessionOwnsItsModel) {
    SpellSession first;
    SpellSession second;
    first.buildCorpus("alpha");
    second.buildCorpus("beta");
    EXPECT_EQ(first.findKnownWords(Words {"alpha", "beta"}), (Words {"alpha"}));
    EXPECT_EQ(second.findKnownWords(Words {"alpha", "beta"}), (Words {"beta"}));
}

TEST(SpellSessionTest, ConfigOptionsAreApplied) {
    SessionConfig config;
    config.max_suggestions = 1;
    config.match_mode = MatchMode::Word;
    SpellSession session(config);
    session.buildCorpus("cat cat bat hat");
    EXPECT_EQ(session.suggestAlternatives("zat"), (Words {"cat"}));
    EXPECT_EQ(session.autoCorrect("zat zatty"), "cat zatty");
}

TEST(SpellSessionTest, DefaultSessionCorrectsWordsOfAnyLength) {
    const sk::u8str word = "pneumonoultramicroscopicsilicovolcanoconiosis";
    const sk::u8str typo = "penumonoultramicroscopicsilicovolcanoconiosis";
    ASSERT_GT(typo.size(), 32);

    SpellSession session;
    EXPECT_EQ(session.config().max_word_length, 0);
    session.buildCorpus(word);
    EXPECT_EQ(session.suggestAlternatives(typo), (Words {word}));
    EXPECT_EQ(session.autoCorrect("a " + typo + " case"), "a " + word + " case");
}

TEST(SpellSessionTest, ConfiguredWordLengthBoundIsApplied) {
    SessionConfig config;
    config.max_word_length = 32;
    SpellSession session(config);
    session.buildCorpus("pneumonoultramicroscopicsilicovolcanoconiosis");
    EXPECT_TRUE(session.suggestAlternatives("penumonoultramicroscopicsilicovolcanoconiosis").empty());
}

TEST(SpellSessionTest, ChecksDuringRebuildSeeOneModel) {
    SpellSession session;
    session.buildCorpus("the quick brown fox");

    std::atomic<bool> done = false;
    std::atomic<bool> consistent = true;
    std::thread reader([&]() {
        while (!done) {
            // "teh" is corrected to "the" by the first model and to "ten" by the second, never anything else
            auto items = session.check("teh");
            if (items.size() != 1) {
                consistent = false;
                continue;
            }
            auto& alternatives = items[0].suggested_alternatives;
            if (alternatives != Words {"the"} && alternatives != Words {"ten"}) consistent = false;
        }
    });
    for (int i = 0; i < 50; i++) {
        session.buildCorpus(i % 2 == 0 ? "ten quick brown fox" : "the quick brown fox");
    }
    done = true;
    reader.join();
    EXPECT_TRUE(consistent);
}

class SpellSessionFileTest : public test::TempDirTest {};

TEST_F(SpellSessionFileTest, LoadsCorpusFromFiles) {
    auto first = writeFile("a.txt", "the quick");
    auto second = writeFile("b.txt", "brown fox the");
    SpellSession session;
    session.loadCorpusFromFiles({first, second});
    EXPECT_EQ(session.model().frequency("the"), 2);
    EXPECT_EQ(session.stats(0).vocab_size, 4);

    session.loadCorpusFromFile(first);
    EXPECT_EQ(session.stats(0).vocab_size, 2);
}

TEST_F(SpellSessionFileTest, FailedLoadKeepsPreviousModel) {
    SpellSession session;
    session.buildCorpus("the quick brown fox the the");
    EXPECT_THROW(session.loadCorpusFromFile(temp_dir / "missing.txt"), CorpusLoadError);

    EXPECT_TRUE(session.isCorpusBuilt());
    EXPECT_EQ(session.model().frequency("the"), 3);
    EXPECT_EQ(session.suggestAlternatives("teh"), (Words {"the"}));
}

TEST_F(SpellSessionFileTest, LoadsConfigWithRelativeCorpusPaths) {
    writeFile("corpora/main.txt", "cat cat bat hat");
    auto config_path = writeFile("session.json", R"({
        "corpusPaths": ["corpora/main.txt"],
        "maxSuggestions": 2,
        "matchMode": "word"
    })");

    SpellSession session;
    session.loadConfigFromFile(config_path);
    EXPECT_TRUE(session.isCorpusBuilt());
    EXPECT_EQ(session.config().max_suggestions, 2);
    EXPECT_EQ(session.config().match_mode, MatchMode::Word);
    EXPECT_EQ(session.suggestAlternatives("zat"), (Words {"cat", "bat"}));
}

TEST_F(SpellSessionFileTest, FailedConfigLoadKeepsSession) {
    auto config_path = writeFile("session.json", R"({"corpusPaths": ["missing.txt"], "maxSuggestions": 1})");

    SpellSession session;
    session.buildCorpus("cat bat hat");
    EXPECT_THROW(session.loadConfigFromFile(config_path), CorpusLoadError);
    EXPECT_EQ(session.config().max_suggestions, 0);
    EXPECT_EQ(session.suggestAlternatives("zat"), (Words {"bat", "cat", "hat"}));

    EXPECT_THROW(session.loadConfigFromFile(temp_dir / "missing.json"), SessionConfigError);
    auto broken_path = writeFile("broken.json", "{ not json");
    EXPECT_THROW(session.loadConfigFromFile(broken_path), nlohmann::json::exception);
    EXPECT_TRUE(session.isCorpusBuilt());
}

} // namespace
