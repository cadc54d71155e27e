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

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

namespace sk::spell {

sk::u8str CorpusLoader::readFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw CorpusLoadError(path, "path is a directory");
    }

    errno = 0;
    std::ifstream corpus_file(path, std::ios::in | std::ios::binary);
    if (!corpus_file.is_open()) {
        throw CorpusLoadError(path, errno != 0 ? std::strerror(errno) : "file cannot be opened");
    }

    try {
        corpus_file.exceptions(std::ios::badbit);
        return readStream(corpus_file);
    } catch (const std::ios_base::failure& err) {
        throw CorpusLoadError(path, err.what());
    }
}

sk::u8str CorpusLoader::readFiles(const std::vector<std::filesystem::path>& paths) {
    sk::u8str content;
    for (auto& path : paths) {
        if (!content.empty()) {
            content.push_back('\n');
        }
        content.append(readFile(path));
    }
    return content;
}

sk::u8str CorpusLoader::readStream(std::istream& istream) {
    return sk::u8str(std::istreambuf_iterator<char>(istream), {});
}

} // namespace sk::spell
