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

#include "tools/common/session_args_utils.hpp"

#include "spellkit/corpus_loader.hpp"
#include "tools/common/stopwatch.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace sk::spell::tools {

const char* const ARG_SESSION_CONFIG_PATH = "--session-config";
const char* const ARG_CORPUS_PATH = "--corpus";
const char* const ARG_TEXT = "--text";
const char* const ARG_TXT_FILE = "--txt-file";

void SessionArgsUtils::initArgumentConfig(argparse::ArgumentParser& arg_parser) {
    arg_parser.add_argument(ARG_SESSION_CONFIG_PATH)
        .metavar("PATH")
        .help("Path of the session config file to load");
    arg_parser.add_argument(ARG_CORPUS_PATH)
        .metavar("PATH")
        .append()
        .help("Path of a corpus text file to build the model from, may be repeated");
}

std::unique_ptr<SpellSession> SessionArgsUtils::readArgumentsAndLoadSession(argparse::ArgumentParser& arg_parser) {
    auto has_config = arg_parser.is_used(ARG_SESSION_CONFIG_PATH);
    auto has_corpus = arg_parser.is_used(ARG_CORPUS_PATH);
    if (has_config == has_corpus) {
        throw std::runtime_error("Exactly one of --session-config or --corpus must be specified!");
    }

    if (has_config) {
        std::string session_config_path = arg_parser.get<std::string>(ARG_SESSION_CONFIG_PATH);
        sk::str::trim(session_config_path);
        if (session_config_path.empty()) {
            throw std::runtime_error("Specified session config path is empty!");
        }
        if (!std::filesystem::exists(session_config_path)) {
            throw std::runtime_error("Specified session config path does not exist!");
        }
        auto session = std::make_unique<SpellSession>();
        runTimedStep("Loading session config and building frequency model", [&]() {
            session->loadConfigFromFile(session_config_path);
        });
        return session;
    }

    auto raw_paths = arg_parser.get<std::vector<std::string>>(ARG_CORPUS_PATH);
    std::vector<std::filesystem::path> corpus_paths(raw_paths.begin(), raw_paths.end());
    SessionConfig config;
    config.max_word_length = CORPUS_MAX_WORD_LENGTH;
    auto session = std::make_unique<SpellSession>(config);
    runTimedStep("Building frequency model from corpus", [&]() {
        session->loadCorpusFromFiles(corpus_paths);
    });
    return session;
}

void SessionArgsUtils::initTextArgumentConfig(argparse::ArgumentParser& arg_parser) {
    arg_parser.add_argument(ARG_TEXT).metavar("TEXT").help("the text to process");
    arg_parser.add_argument(ARG_TXT_FILE).metavar("PATH").help("the text file to read the text to process from");
}

sk::u8str SessionArgsUtils::readTextArgument(argparse::ArgumentParser& arg_parser) {
    auto has_text = arg_parser.is_used(ARG_TEXT);
    auto has_txt_file = arg_parser.is_used(ARG_TXT_FILE);
    if (has_text == has_txt_file) {
        throw std::runtime_error("Exactly one of --text or --txt-file must be specified!");
    }

    if (has_text) {
        return arg_parser.get<std::string>(ARG_TEXT);
    }
    std::string txt_file_path = arg_parser.get<std::string>(ARG_TXT_FILE);
    std::ifstream txt_file(txt_file_path, std::ios::in | std::ios::binary);
    if (!txt_file.is_open()) {
        throw std::runtime_error("Cannot open text file at '" + txt_file_path + "'!");
    }
    return CorpusLoader::readStream(txt_file);
}

} // namespace sk::spell::tools
