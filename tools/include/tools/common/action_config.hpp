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

#ifndef __SPELLKIT_TOOLS_COMMON_ACTION_CONFIG_H__
#define __SPELLKIT_TOOLS_COMMON_ACTION_CONFIG_H__

#include <argparse/argparse.hpp>

#include <string>

namespace sk::spell::tools {

// One subcommand of the spellkit tool. The parser is created with the subcommand's name and description, the
// action adds its own arguments in initArgumentConfig().
class ActionConfig {
  public:
    const std::string name;
    argparse::ArgumentParser arg_parser;

    ActionConfig() = delete;
    ActionConfig(const std::string& name, const std::string& description)
        : name(name), arg_parser(name, "", argparse::default_arguments::none) {
        arg_parser.add_description(description);
    };
    ActionConfig(const ActionConfig&) = delete;
    virtual ~ActionConfig() = default;

    virtual void initArgumentConfig(argparse::ArgumentParser& arg_parser) = 0;
    // Returns the process exit code. Errors are thrown and reported by Program::run().
    virtual int runAction(argparse::ArgumentParser& arg_parser) = 0;
};

} // namespace sk::spell::tools

#endif
