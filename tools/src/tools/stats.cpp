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
#include "tools/actions.hpp"
#include "tools/common/session_args_utils.hpp"

#include <fmt/core.h>

#include <stdexcept>
#include <string>

namespace sk::spell::tools {

const auto ARG_TOP = "--top";

void StatsActionConfig::initArgumentConfig(argparse::ArgumentParser& arg_parser) {
    SessionArgsUtils::initArgumentConfig(arg_parser);
    arg_parser.add_argument(ARG_TOP)
        .metavar("N")
        .default_value(std::string("10"))
        .help("number of most frequent words to list");
}

int StatsActionConfig::runAction(argparse::ArgumentParser& arg_parser) {
    auto top_str = arg_parser.get<std::string>(ARG_TOP);
    std::size_t top_n = 0;
    try {
        if (top_str.empty() || top_str.front() == '-') {
            throw std::invalid_argument(top_str);
        }
        top_n = std::stoull(top_str);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid value '" + top_str + "' for --top, expected a non-negative number!");
    }

    auto session = SessionArgsUtils::readArgumentsAndLoadSession(arg_parser);

    auto stats = session->stats(top_n);
    fmt::print("Vocabulary size: {}\n", stats.vocab_size);
    fmt::print("Total words: {}\n", stats.total_count);
    if (!stats.top_words.empty()) {
        fmt::print("Top {} words:\n", stats.top_words.size());
        for (auto& entry : stats.top_words) {
            fmt::print("  {:<20} {}\n", entry.word, entry.count);
        }
    }
    return 0;
}

} // namespace sk::spell::tools
