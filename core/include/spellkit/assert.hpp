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

#ifndef __SPELLKIT_CORE_ASSERT_H__
#define __SPELLKIT_CORE_ASSERT_H__

#include <stdexcept>
#include <string>

namespace sk {

// Thrown when an API is used in a way its contract forbids, e.g. asking for the frequency of a word the model
// does not know. Not meant to be caught by regular callers.
class assertion_error : public std::logic_error {
  public:
    explicit assertion_error(const std::string& msg) : std::logic_error(msg) {};
    ~assertion_error() = default;
};

// Named `require` instead of `assert` so it never collides with the <cassert> macro. Takes a literal so the
// success path does not build a message.
inline void require(bool condition, const char* msg) {
    if (!condition) throw assertion_error(msg);
}

} // namespace sk

#endif
