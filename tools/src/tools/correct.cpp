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

namespace sk::spell::tools {

void CorrectActionConfig::initArgumentConfig(argparse::ArgumentParser& arg_parser) {
    SessionArgsUtils::initArgumentConfig(arg_parser);
    SessionArgsUtils::initTextArgumentConfig(arg_parser);
}

int CorrectActionConfig::runAction(argparse::ArgumentParser& arg_parser) {
    auto text = SessionArgsUtils::readTextArgument(arg_parser);

    auto session = SessionArgsUtils::readArgumentsAndLoadSession(arg_parser);

    sk::u8str corrected;
    runTimedStep("Correcting text", [&]() { corrected = session->autoCorrect(text); });
    fmt::print("{}\n", corrected);
    return 0;
}

} // namespace sk::spell::tools
