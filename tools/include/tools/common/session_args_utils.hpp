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

#ifndef __SPELLKIT_TOOLS_COMMON_SESSION_ARGS_UTILS_H__
#define __SPELLKIT_TOOLS_COMMON_SESSION_ARGS_UTILS_H__

#include "spellkit/spell_session.hpp"
#include "spellkit/string.hpp"

#include <argparse/argparse.hpp>

#include <cstddef>
#include <memory>

namespace sk::spell::tools {

extern const char* const ARG_SESSION_CONFIG_PATH;
extern const char* const ARG_CORPUS_PATH;
extern const char* const ARG_TEXT;
extern const char* const ARG_TXT_FILE;

// Word length bound for sessions built straight from --corpus. A session config file sets its own.
static const std::size_t CORPUS_MAX_WORD_LENGTH = 32;

class SessionArgsUtils {
  public:
    // Adds the mutually exclusive model sources --session-config and --corpus.
    static void initArgumentConfig(argparse::ArgumentParser& arg_parser);

    // Creates and loads a session from whichever model source was given, reporting progress on stderr.
    static std::unique_ptr<SpellSession> readArgumentsAndLoadSession(argparse::ArgumentParser& arg_parser);

    // Adds the mutually exclusive text sources --text and --txt-file.
    static void initTextArgumentConfig(argparse::ArgumentParser& arg_parser);

    static sk::u8str readTextArgument(argparse::ArgumentParser& arg_parser);
};

} // namespace sk::spell::tools

#endif
