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

#ifndef __SPELLKIT_CORE_CORPUS_LOADER_H__
#define __SPELLKIT_CORE_CORPUS_LOADER_H__

#include "spellkit/string.hpp"

#include <filesystem>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace sk::spell {

class CorpusLoadError : public std::runtime_error {
  public:
    CorpusLoadError(const std::filesystem::path& path, const std::string& cause)
        : std::runtime_error("Could not load corpus file '" + path.string() + "': " + cause), path_(path),
          cause_(cause) {};
    ~CorpusLoadError() = default;

    const std::filesystem::path& path() const noexcept {
        return path_;
    }

    const std::string& cause() const noexcept {
        return cause_;
    }

  private:
    const std::filesystem::path path_;
    const std::string cause_;
};

// Reads corpus sources as opaque bytes. Decoding is left to the Tokenizer, which expects UTF-8.
class CorpusLoader {
  public:
    static sk::u8str readFile(const std::filesystem::path& path);

    // Files are joined with a newline so words never merge across file boundaries. Any failing file aborts the
    // whole read.
    static sk::u8str readFiles(const std::vector<std::filesystem::path>& paths);

    static sk::u8str readStream(std::istream& istream);
};

} // namespace sk::spell

#endif
