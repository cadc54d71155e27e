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

#include "tools/actions.hpp"
#include "tools/common/program.hpp"

int main(int argc, char** argv) {
    sk::spell::tools::Program program(PROGRAM_NAME, PROGRAM_VERSION);
    program.addAction<sk::spell::tools::CheckActionConfig>();
    program.addAction<sk::spell::tools::CorrectActionConfig>();
    program.addAction<sk::spell::tools::SuggestActionConfig>();
    program.addAction<sk::spell::tools::StatsActionConfig>();
    return program.run(argc, argv);
}
