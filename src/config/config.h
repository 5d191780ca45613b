// Copyright 2026 The didpoop Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

// =====================================================================
// c++ std
// =====================================================================

#include <cstdint>
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"

// CLI11
#include "CLI/CLI.hpp"

// json
#include "nlohmann/json.hpp"

namespace didpoop::config {

class Config {
   public:
    // RocksDB directory. One process at a time, RocksDB locks it.
    std::string data_dir = "./data";

    // spdlog level name: trace, debug, info, warn, err, critical, off
    std::string log_level = "info";

    // Guard id generation against clock regression and sequence exhaustion.
    // Off by default: ids then match the id_gen() SQL function bit for bit.
    bool strict_ids = false;

    // Sequence values reserved per synced write.
    int64_t sequence_cache = 64;

    // Random UUID of this process, generated on construction.
    std::string instance_id;

    Config();
};

void to_json(nlohmann::json& j, const Config& config);

// Registers the options on the app. Every option falls back to an
// environment variable: DIDPOOP_DATA_DIR, DIDPOOP_LOG_LEVEL,
// DIDPOOP_STRICT_IDS, DIDPOOP_SEQUENCE_CACHE.
void add_options(CLI::App& app, Config& config);

// InvalidArgument for an unknown level name.
absl::Status init_logging(const std::string& log_level);

}  // namespace didpoop::config
