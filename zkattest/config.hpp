// Copyright 2025 Fidesinnova.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// config.hpp
// Tool configuration, read from a JSON file (default zkattest_config.json):
//
//   {
//     "key_dir": "keys",
//     "staleness_bound_sec": 3600,
//     "deployer": "0xdeployer",
//     "journal": "zkattest_registry.jsonl",
//     "debug": false
//   }
//
// Every key is optional. A missing file yields the defaults unless the path
// was given explicitly.

#pragma once
#include <cstdint>
#include <string>

namespace zkattest {

constexpr const char* kDefaultConfigPath = "zkattest_config.json";

struct Config {
    std::string key_dir = "keys";
    uint64_t staleness_bound_sec = 3600;
    std::string deployer = "0xdeployer";
    std::string journal = "zkattest_registry.jsonl";
    bool debug = false;
};

// Throws InvalidInput on malformed JSON or mistyped values, and on a missing
// file when required is set.
Config load_config(const std::string& path, bool required);

} // namespace zkattest
