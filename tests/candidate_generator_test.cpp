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

#include "spellkit/candidate_generator.hpp"

#include <gtest/gtest.h>
#include <unicode/utf8.h>

#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include <vector>

namespace {

using sk::spell::CandidateGenerator;
using Words = std::vector<sk::u8str>;

// Damerau style distance restricted to a single edit: true if b is reachable from a with at most one deletion,
// insertion, substitution or adjacent transposition.
bool isWithinOneEdit(const sk::u8str& a, const sk::u8str& b) {
    if (a == b) return true;
    auto len_a = a.size();
    auto len_b = b.size();
    if (len_a == len_b) {
        std::size_t first = 0;
        while (a[first] == b[first]) first++;
        if (a.substr(first + 1) == b.substr(first + 1)) return true;
        return first + 1 < len_a && a[first] == b[first + 1] && a[first + 1] == b[first]
            && a.substr(first + 2) == b.substr(first + 2);
    }
    if (len_a + 1 == len_b) return isWithinOneEdit(b, a);
    if (len_a != len_b + 1) return false;
    std::size_t first = 0;
    while (first < len_b && a[first] == b[first]) first++;
    return a.substr(first + 1) == b.substr(first);
}

bool isWellFormedUtf8(const sk::u8str& str) {
    const auto length = static_cast<int32_t>(str.size());
    int32_t index = 0;
    while (index < length) {
        UChar32 cp;
        U8_NEXT(str.data(), index, length, cp);
        if (cp < 0) return false;
    }
    return true;
}

bool contains(const Words& words, const sk::u8str& word) {
    return std::find(words.begin(), words.end(), word) != words.end();
}

TEST(CandidateGeneratorTest, EveryCandidateIsOneEditAway) {
    CandidateGenerator generator;
    for (const sk::u8str word : {"teh", "fox", "a", "quick", "speling"}) {
        for (auto& candidate : generator.generate(word)) {
            EXPECT_LE(std::max(candidate.size(), word.size()) - std::min(candidate.size(), word.size()), 1)
                << word << " -> " << candidate;
            EXPECT_TRUE(isWithinOneEdit(word, candidate)) << word << " -> " << candidate;
        }
    }
}

TEST(CandidateGeneratorTest, ContainsEveryKindOfEdit) {
    CandidateGenerator generator;
    auto candidates = generator.generate("teh");
    EXPECT_TRUE(contains(candidates, "eh"));   // deletion
    EXPECT_TRUE(contains(candidates, "the"));  // transposition
    EXPECT_TRUE(contains(candidates, "ten"));  // substitution
    EXPECT_TRUE(contains(candidates, "tech")); // insertion
}

TEST(CandidateGeneratorTest, UsesFullAlphabet) {
    CandidateGenerator generator;
    auto candidates = generator.generate("fox");
    EXPECT_TRUE(contains(candidates, "foz"));
    EXPECT_TRUE(contains(candidates, "zfox"));
}

TEST(CandidateGeneratorTest, InsertsAfterLastCharacter) {
    CandidateGenerator generator;
    auto candidates = generator.generate("fo");
    EXPECT_TRUE(contains(candidates, "fox"));
    EXPECT_TRUE(contains(candidates, "foa"));
}

TEST(CandidateGeneratorTest, CandidatesAreDistinct) {
    CandidateGenerator generator;
    auto candidates = generator.generate("aab");
    std::unordered_set<sk::u8str> unique(candidates.begin(), candidates.end());
    EXPECT_EQ(unique.size(), candidates.size());
}

TEST(CandidateGeneratorTest, EmitsInFixedOrder) {
    CandidateGenerator generator("ab");
    Words expected = {
        // deletions
        "y", "x",
        // transpositions
        "yx",
        // substitutions
        "ay", "by", "xa", "xb",
        // insertions
        "axy", "bxy", "xay", "xby", "xya", "xyb",
    };
    EXPECT_EQ(generator.generate("xy"), expected);
    EXPECT_EQ(generator.generate("xy"), generator.generate("xy"));
}

TEST(CandidateGeneratorTest, ForEachCandidateKeepsDuplicates) {
    CandidateGenerator generator("a");
    Words all;
    generator.forEachCandidate("aa", [&](const sk::u8str& candidate) { all.push_back(candidate); });
    // 2 deletions, 1 transposition, 2 substitutions, 3 insertions
    EXPECT_EQ(all.size(), 8);
    EXPECT_EQ(generator.generate("aa"), (Words {"a", "aa", "aaa"}));
}

TEST(CandidateGeneratorTest, EmptyWordOnlyHasInsertions) {
    CandidateGenerator generator("abc");
    EXPECT_EQ(generator.generate(""), (Words {"a", "b", "c"}));
}

TEST(CandidateGeneratorTest, EditsWholeMultiByteCharacters) {
    CandidateGenerator generator;
    const sk::u8str word = "caf\xC3\xA9";
    auto candidates = generator.generate(word);
    EXPECT_TRUE(contains(candidates, "caf"));             // deletion
    EXPECT_TRUE(contains(candidates, "ca\xC3\xA9" "f")); // transposition
    EXPECT_TRUE(contains(candidates, "cafe"));            // substitution
    EXPECT_TRUE(contains(candidates, "caf\xC3\xA9s"));    // insertion
    for (auto& candidate : candidates) {
        EXPECT_TRUE(isWellFormedUtf8(candidate)) << candidate;
    }

    std::size_t raw_count = 0;
    generator.forEachCandidate(word, [&](const sk::u8str&) { raw_count++; });
    // 4 characters: 4 deletions, 3 transpositions, 4 * 26 substitutions, 5 * 26 insertions
    EXPECT_EQ(raw_count, 4 + 3 + 4 * 26 + 5 * 26);
}

TEST(CandidateGeneratorTest, RejectsInvalidAlphabets) {
    EXPECT_THROW(CandidateGenerator(""), std::invalid_argument);
    EXPECT_THROW(CandidateGenerator("abA"), std::invalid_argument);
    EXPECT_THROW(CandidateGenerator("aba"), std::invalid_argument);
    EXPECT_THROW(CandidateGenerator("a1"), std::invalid_argument);
    EXPECT_TRUE(CandidateGenerator::isValidAlphabet("zyx"));
    EXPECT_EQ(CandidateGenerator().alphabet(), sk::spell::DEFAULT_ALPHABET);
}

} // namespace
