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

// =====================================================================
// c++ std
// =====================================================================

#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// spdlog
#include "spdlog/spdlog.h"

// uuid
#include "uuid/uuid.h"

// =====================================================================
// self header
// =====================================================================

#include "src/config/config.h"

namespace didpoop::config {

Config::Config() {
    uuid_t uuid;
    uuid_generate(uuid);
    char str[37];
    uuid_unparse(uuid, str);
    this->instance_id = std::string(str);
}

void to_json(nlohmann::json& j, const Config& config) {
    j = nlohmann::json{
        {"instance_id", config.instance_id},
        {"data_dir", config.data_dir},
        {"log_level", config.log_level},
        {"strict_ids", config.strict_ids},
        {"sequence_cache", config.sequence_cache},
    };
}

void add_options(CLI::App& app, Config& config) {
    app.add_option("--data-dir", config.data_dir, "Data directory")
        ->envname("DIDPOOP_DATA_DIR")
        ->capture_default_str();

    app.add_option("--log-level", config.log_level, "Log level")
        ->envname("DIDPOOP_LOG_LEVEL")
        ->check(CLI::IsMember(
            {"trace", "debug", "info", "warn", "err", "critical", "off"}))
        ->capture_default_str();

    app.add_flag("--strict-ids", config.strict_ids,
                 "Fail id generation on clock regression or sequence "
                 "exhaustion")
        ->envname("DIDPOOP_STRICT_IDS");

    app.add_option("--sequence-cache", config.sequence_cache,
                   "Sequence values reserved per synced write")
        ->envname("DIDPOOP_SEQUENCE_CACHE")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
}

absl::Status init_logging(const std::string& log_level) {
    auto level = spdlog::level::from_str(log_level);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && log_level != "off") {
        return absl::InvalidArgumentError("unknown log level: " + log_level);
    }
    spdlog::set_level(level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
    return absl::OkStatus();
}

}  // namespace didpoop::config
