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
#include <fmt/ranges.h>

#include <string>
#include <vector>

namespace sk::spell::tools {

const auto ARG_WORDS = "words";

void SuggestActionConfig::initArgumentConfig(argparse::ArgumentParser& arg_parser) {
    SessionArgsUtils::initArgumentConfig(arg_parser);
    arg_parser.add_argument(ARG_WORDS)
        .metavar("WORD")
        .nargs(argparse::nargs_pattern::at_least_one)
        .help("the words to look up");
}

int SuggestActionConfig::runAction(argparse::ArgumentParser& arg_parser) {
    auto words = arg_parser.get<std::vector<std::string>>(ARG_WORDS);

    auto session = SessionArgsUtils::readArgumentsAndLoadSession(arg_parser);

    auto& model = session->model();
    for (auto& word : words) {
        if (model.isKnown(word)) {
            fmt::print("{}: known word\n", word);
            continue;
        }
        auto suggestions = session->suggestAlternatives(word);
        if (suggestions.empty()) {
            fmt::print("{}: (no suggestions)\n", word);
        } else {
            fmt::print("{}: {}\n", word, fmt::join(suggestions, ", "));
        }
    }
    return 0;
}

} // namespace sk::spell::tools
