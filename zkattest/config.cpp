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

#include "config.hpp"
#include "error.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

namespace zkattest {

Config load_config(const std::string& path, bool required){
    Config cfg;
    std::ifstream f(path);
    if(!f){
        if(required) throw Error(ErrorCode::InvalidInput, "cannot open config " + path);
        dbg("no config at " + path + ", using defaults");
        return cfg;
    }
    nlohmann::json j;
    try{
        f >> j;
        if(!j.is_object()) throw Error(ErrorCode::InvalidInput, path + ": config must be a JSON object");
        if(j.contains("key_dir")) cfg.key_dir = j.at("key_dir").get<std::string>();
        if(j.contains("staleness_bound_sec")) cfg.staleness_bound_sec = j.at("staleness_bound_sec").get<uint64_t>();
        if(j.contains("deployer")) cfg.deployer = j.at("deployer").get<std::string>();
        if(j.contains("journal")) cfg.journal = j.at("journal").get<std::string>();
        if(j.contains("debug")) cfg.debug = j.at("debug").get<bool>();
    }catch(const nlohmann::json::exception& e){
        throw Error(ErrorCode::InvalidInput, path + ": " + e.what());
    }
    dbg("config " + path + ": key_dir=" + cfg.key_dir + " staleness=" + std::to_string(cfg.staleness_bound_sec)
        + " journal=" + cfg.journal);
    return cfg;
}

} // namespace zkattest
