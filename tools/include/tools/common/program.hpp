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

#ifndef __SPELLKIT_TOOLS_COMMON_PROGRAM_H__
#define __SPELLKIT_TOOLS_COMMON_PROGRAM_H__

#include "tools/common/action_config.hpp"

#include <argparse/argparse.hpp>

#include <memory>
#include <string>
#include <vector>

namespace sk::spell::tools {

// Top level parser of the spellkit tool. Owns the registered actions and dispatches to the one selected on the
// command line.
class Program {
  private:
    std::string version_;
    argparse::ArgumentParser arg_parser_;
    std::vector<std::unique_ptr<ActionConfig>> actions_;

    void printVersion() const;
    void initDefaultArgumentsConfig(argparse::ArgumentParser& arg_parser) const;

  public:
    Program() = delete;
    Program(const std::string& name, const std::string& version);
    Program(const Program&) = delete;
    ~Program() = default;

    template<typename ActionT>
    void addAction() {
        auto& action = actions_.emplace_back(std::make_unique<ActionT>());
        action->initArgumentConfig(action->arg_parser);
        initDefaultArgumentsConfig(action->arg_parser);
        arg_parser_.add_subparser(action->arg_parser);
    }

    // Parses the arguments and runs the selected action. Any exception escaping the action is printed as
    // "Fatal: <what> Aborting." to stderr and yields exit code 1.
    int run(int argc, char** argv);
};

} // namespace sk::spell::tools

#endif
