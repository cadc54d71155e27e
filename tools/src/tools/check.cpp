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
#include "tools/common/stopwatch.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

#include <vector>

namespace sk::spell::tools {

const auto ARG_JSON = "--json";

void CheckActionConfig::initArgumentConfig(argparse::ArgumentParser& arg_parser) {
    SessionArgsUtils::initArgumentConfig(arg_parser);
    SessionArgsUtils::initTextArgumentConfig(arg_parser);
    arg_parser.add_argument(ARG_JSON)
        .default_value(false)
        .implicit_value(true)
        .help("print the result as a JSON array");
}

int CheckActionConfig::runAction(argparse::ArgumentParser& arg_parser) {
    auto text = SessionArgsUtils::readTextArgument(arg_parser);
    auto as_json = arg_parser.get<bool>(ARG_JSON);

    auto session = SessionArgsUtils::readArgumentsAndLoadSession(arg_parser);

    std::vector<SpellCheckItem> items;
    runTimedStep("Checking text", [&]() { items = session->check(text); });

    if (as_json) {
        nlohmann::json j = items;
        fmt::print("{}\n", j.dump(2));
        return 0;
    }
    for (auto& item : items) {
        if (item.hasSuggestions()) {
            fmt::print("{} -> {}\n", item.suspected_word, fmt::join(item.suggested_alternatives, ", "));
        } else {
            fmt::print("{} -> (no suggestions)\n", item.suspected_word);
        }
    }
    return 0;
}

} // namespace sk::spell::tools
