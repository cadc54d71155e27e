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

#ifndef __SPELLKIT_TESTS_TEST_UTILS_H__
#define __SPELLKIT_TESTS_TEST_UTILS_H__

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace sk::spell::test {

// Fixture owning a fresh scratch directory per test, removed again on tear down.
class TempDirTest : public ::testing::Test {
  protected:
    std::filesystem::path temp_dir;

    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        temp_dir = std::filesystem::temp_directory_path() / "spellkit-tests"
            / (std::string(info->test_suite_name()) + "." + info->name());
        std::filesystem::remove_all(temp_dir);
        std::filesystem::create_directories(temp_dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(temp_dir, ec);
    }

    std::filesystem::path writeFile(const std::string& name, const std::string& content) {
        auto path = temp_dir / name;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::out | std::ios::binary);
        file << content;
        return path;
    }
};

} // namespace sk::spell::test

#endif
