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

#include "tools/common/program.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>

namespace sk::spell::tools {

Program::Program(const std::string& name, const std::string& version)
    : version_(version), arg_parser_(name, version, argparse::default_arguments::none) {
    initDefaultArgumentsConfig(arg_parser_);
}

void Program::printVersion() const {
    std::cout << "SpellKit Tools v" << version_ << "\n";
}

// Replaces argparse's own -h/-v handling so both print the version banner first.
void Program::initDefaultArgumentsConfig(argparse::ArgumentParser& arg_parser) const {
    arg_parser.add_argument("-h", "--help")
        .action([this, &arg_parser](const auto&) {
            printVersion();
            std::cout << "\n" << arg_parser.help().str();
            std::exit(0);
        })
        .default_value(false)
        .implicit_value(true)
        .help("Shows this help message and exits")
        .nargs(0);

    arg_parser.add_argument("-v", "--version")
        .action([this](const auto&) {
            printVersion();
            std::exit(0);
        })
        .default_value(false)
        .implicit_value(true)
        .help("Prints version information and exits")
        .nargs(0);
}

int Program::run(int argc, char** argv) {
    if (argc <= 1) {
        printVersion();
        std::cout << "\n" << arg_parser_.help().str();
        return 0;
    }

    try {
        arg_parser_.parse_args(argc, argv);
        for (auto& action : actions_) {
            if (arg_parser_.is_subcommand_used(action->name)) {
                return action->runAction(action->arg_parser);
            }
        }
    } catch (const std::exception& err) {
        std::cerr << "Fatal: " << err.what() << " Aborting." << std::endl;
        return 1;
    }

    std::cerr << "Fatal: No action specified. Aborting.\n";
    return 1;
}

} // namespace sk::spell::tools
