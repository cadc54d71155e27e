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

#ifndef __SPELLKIT_TOOLS_ACTIONS_H__
#define __SPELLKIT_TOOLS_ACTIONS_H__

#include "tools/common/action_config.hpp"

#include <argparse/argparse.hpp>

namespace sk::spell::tools {

class CheckActionConfig : public ActionConfig {
  public:
    CheckActionConfig()
        : ActionConfig("check", "Report the unknown words of a text together with suggested alternatives") {};

    void initArgumentConfig(argparse::ArgumentParser& arg_parser) override;
    int runAction(argparse::ArgumentParser& arg_parser) override;
};

class CorrectActionConfig : public ActionConfig {
  public:
    CorrectActionConfig()
        : ActionConfig("correct", "Replace every unknown word of a text with its best suggestion") {};

    void initArgumentConfig(argparse::ArgumentParser& arg_parser) override;
    int runAction(argparse::ArgumentParser& arg_parser) override;
};

class SuggestActionConfig : public ActionConfig {
  public:
    SuggestActionConfig()
        : ActionConfig("suggest", "Print ranked spelling suggestions for each given word") {};

    void initArgumentConfig(argparse::ArgumentParser& arg_parser) override;
    int runAction(argparse::ArgumentParser& arg_parser) override;
};

class StatsActionConfig : public ActionConfig {
  public:
    StatsActionConfig()
        : ActionConfig("stats", "Print vocabulary statistics of the frequency model") {};

    void initArgumentConfig(argparse::ArgumentParser& arg_parser) override;
    int runAction(argparse::ArgumentParser& arg_parser) override;
};

} // namespace sk::spell::tools

#endif
