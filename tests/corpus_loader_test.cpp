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
#include "spellkit/tokenizer.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

namespace {

using namespace sk::spell;

class CorpusLoaderTest : public test::TempDirTest {};

TEST_F(CorpusLoaderTest, ReadsFileAsBytes) {
    auto path = writeFile("corpus.txt", "the quick\r\nbrown \xC3\xA9 fox\n");
    EXPECT_EQ(CorpusLoader::readFile(path), "the quick\r\nbrown \xC3\xA9 fox\n");
}

TEST_F(CorpusLoaderTest, MissingFileRaisesLoadError) {
    auto path = temp_dir / "missing.txt";
    try {
        CorpusLoader::readFile(path);
        FAIL() << "Expected CorpusLoadError";
    } catch (const CorpusLoadError& err) {
        EXPECT_EQ(err.path(), path);
        EXPECT_FALSE(err.cause().empty());
        EXPECT_NE(std::string(err.what()).find(path.string()), std::string::npos);
    }
}

TEST_F(CorpusLoaderTest, DirectoryRaisesLoadError) {
    EXPECT_THROW(CorpusLoader::readFile(temp_dir), CorpusLoadError);
}

TEST_F(CorpusLoaderTest, MultipleFilesDoNotMergeWords) {
    auto first = writeFile("a.txt", "quick");
    auto second = writeFile("b.txt", "fox");
    auto content = CorpusLoader::readFiles({first, second});
    EXPECT_EQ(Tokenizer::extractWords(content), (std::vector<sk::u8str> {"quick", "fox"}));
}

TEST_F(CorpusLoaderTest, AnyFailingFileAbortsRead) {
    auto first = writeFile("a.txt", "quick");
    EXPECT_THROW(CorpusLoader::readFiles({first, temp_dir / "missing.txt"}), CorpusLoadError);
}

TEST(CorpusLoaderStreamTest, ReadsWholeStream) {
    std::istringstream stream("line one\nline two");
    EXPECT_EQ(CorpusLoader::readStream(stream), "line one\nline two");
}

} // namespace
