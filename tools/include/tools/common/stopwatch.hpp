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

#ifndef __SPELLKIT_TOOLS_COMMON_STOPWATCH_H__
#define __SPELLKIT_TOOLS_COMMON_STOPWATCH_H__

#include <fmt/core.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <string>

namespace sk::spell::tools {

// Measures from construction until lap(). Each lap() restarts the measurement.
class Stopwatch {
  private:
    using ClockT = std::chrono::steady_clock;

    ClockT::time_point start_time_ = ClockT::now();

  public:
    [[nodiscard]]
    std::int64_t lap() noexcept {
        auto now = ClockT::now();
        auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time_).count();
        start_time_ = now;
        return elapsed_ms;
    }
};

// Prints "<description>... Done in <n>ms." to stderr around the given step, keeping stdout for results. If the step
// throws, the line is left open and the exception propagates to the caller's fatal handler.
inline void runTimedStep(const std::string& description, const std::function<void()>& step) {
    fmt::print(stderr, "{}... ", description);
    std::fflush(stderr);
    Stopwatch stopwatch;
    step();
    fmt::print(stderr, "Done in {}ms.\n", stopwatch.lap());
}

} // namespace sk::spell::tools

#endif
