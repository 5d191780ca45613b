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

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"
#include "absl/strings/match.h"

// spdlog
#include "spdlog/spdlog.h"

// CLI11
#include "CLI/CLI.hpp"

// json
#include "nlohmann/json.hpp"

// =====================================================================
// local libraries
// =====================================================================

#include "src/config/config.h"
#include "src/database/database.h"
#include "src/id/generator.h"
#include "src/model/model.h"
#include "src/repository/repository.h"

namespace {

using didpoop::database::Database;
using didpoop::repository::Repository;

void print(const nlohmann::json& j) {
    std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
}

int fail(const absl::Status& status) {
    SPDLOG_ERROR("{}", status.ToString());
    std::cerr << status.ToString() << std::endl;
    return 1;
}

template <typename T>
int print_or_fail(const absl::StatusOr<T>& result) {
    if (!result.ok()) {
        return fail(result.status());
    }
    print(nlohmann::json(result.value()));
    return 0;
}

nlohmann::json decode_id(int64_t id) {
    auto parts = didpoop::id::Decompose(id);
    return nlohmann::json{
        {"id", std::to_string(id)},
        {"timestamp_millis", parts.timestamp_millis},
        {"sequence", parts.sequence},
    };
}

// prints every pair of every column family whose key starts with prefix
int scan(Database& db, const std::string& prefix) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& cf_name : db.store().ColumnFamilies()) {
        auto kv_pairs = db.store().GetAllKV(cf_name);
        if (!kv_pairs.ok()) {
            return fail(kv_pairs.status());
        }
        nlohmann::json cf = nlohmann::json::object();
        for (const auto& [key, value] : kv_pairs.value()) {
            if (absl::StartsWith(key, prefix)) {
                cf[key] = value;
            }
        }
        out[cf_name] = cf;
    }
    print(out);
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"didpoop"};
    app.require_subcommand(1);

    didpoop::config::Config config;
    didpoop::config::add_options(app, config);

    // init
    auto init_cmd = app.add_subcommand("init", "Create the application tables");

    // next-id
    auto next_id_cmd = app.add_subcommand("next-id", "Generate ids");
    int count = 1;
    next_id_cmd->add_option("--count", count, "Number of ids")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    // decode
    auto decode_cmd =
        app.add_subcommand("decode", "Split an id into timestamp and sequence");
    int64_t decode_arg = 0;
    decode_cmd->add_option("id", decode_arg, "Id")->required();

    // user
    auto user_cmd = app.add_subcommand("user", "Users");
    user_cmd->require_subcommand(1);

    auto user_create_cmd = user_cmd->add_subcommand("create", "Create a user");
    std::string email;
    std::string name;
    std::string pw_salt;
    std::string pw_hash;
    user_create_cmd->add_option("--email", email, "Email")->required();
    user_create_cmd->add_option("--name", name, "Name")->required();
    user_create_cmd->add_option("--pw-salt", pw_salt, "Password salt, hex");
    user_create_cmd->add_option("--pw-hash", pw_hash, "Password hash, hex");

    auto user_get_cmd = user_cmd->add_subcommand("get", "Get a user");
    int64_t user_id = 0;
    auto user_id_opt = user_get_cmd->add_option("--id", user_id, "User id");
    user_get_cmd->add_option("--email", email, "Email")->excludes(user_id_opt);

    // creature
    auto creature_cmd = app.add_subcommand("creature", "Creatures");
    creature_cmd->require_subcommand(1);

    auto creature_create_cmd =
        creature_cmd->add_subcommand("create", "Create a creature");
    int64_t creator_id = 0;
    creature_create_cmd->add_option("--creator", creator_id, "Creator id")
        ->required();
    creature_create_cmd->add_option("--name", name, "Name")->required();

    auto creature_list_cmd =
        creature_cmd->add_subcommand("list", "Creatures of a user");
    creature_list_cmd->add_option("--user", user_id, "User id")->required();

    auto creature_grant_cmd =
        creature_cmd->add_subcommand("grant", "Grant access to a creature");
    int64_t creature_id = 0;
    std::string kind = "reader";
    creature_grant_cmd->add_option("--creature", creature_id, "Creature id")
        ->required();
    creature_grant_cmd->add_option("--user", user_id, "User id")->required();
    creature_grant_cmd->add_option("--creator", creator_id, "Granting user id")
        ->required();
    creature_grant_cmd->add_option("--kind", kind, "Access kind")
        ->check(CLI::IsMember({"creator", "pooper", "reader"}))
        ->capture_default_str();

    // poop
    auto poop_cmd = app.add_subcommand("poop", "Poops");
    poop_cmd->require_subcommand(1);

    auto poop_record_cmd = poop_cmd->add_subcommand("record", "Record a poop");
    poop_record_cmd->add_option("--creator", creator_id, "User id")
        ->required();
    poop_record_cmd->add_option("--creature", creature_id, "Creature id")
        ->required();

    auto poop_list_cmd = poop_cmd->add_subcommand("list", "List poops");
    auto poop_creature_opt =
        poop_list_cmd->add_option("--creature", creature_id, "Creature id");
    auto poop_creator_opt =
        poop_list_cmd->add_option("--creator", creator_id, "User id");
    poop_creature_opt->excludes(poop_creator_opt);

    // scan
    auto scan_cmd = app.add_subcommand("scan", "Dump the raw key-values");
    std::string prefix;
    scan_cmd->add_option("--prefix", prefix, "Key prefix");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    auto status = didpoop::config::init_logging(config.log_level);
    if (!status.ok()) {
        return fail(status);
    }

    if (*decode_cmd) {
        print(decode_id(decode_arg));
        return 0;
    }

    auto db = Database::Open(config);
    if (!db.ok()) {
        return fail(db.status());
    }
    Database& database = *db.value();

    status = database.Bootstrap();
    if (!status.ok()) {
        return fail(status);
    }

    if (*init_cmd) {
        print(nlohmann::json{
            {"instance_id", database.instance_id()},
            {"tables", database.catalog().ListTables()},
        });
        return 0;
    }

    if (*next_id_cmd) {
        nlohmann::json ids = nlohmann::json::array();
        for (int i = 0; i < count; i++) {
            auto id = database.NextId();
            if (!id.ok()) {
                return fail(id.status());
            }
            ids.push_back(decode_id(id.value()));
        }
        print(ids);
        return 0;
    }

    if (*scan_cmd) {
        return scan(database, prefix);
    }

    Repository repo(&database);

    if (*user_create_cmd) {
        return print_or_fail(repo.CreateUser(email, name, pw_salt, pw_hash));
    }
    if (*user_get_cmd) {
        if (!email.empty()) {
            return print_or_fail(repo.FindUserByEmail(email));
        }
        return print_or_fail(repo.GetUser(user_id));
    }

    if (*creature_create_cmd) {
        return print_or_fail(repo.CreateCreature(creator_id, name));
    }
    if (*creature_list_cmd) {
        return print_or_fail(repo.ListCreaturesForUser(user_id));
    }
    if (*creature_grant_cmd) {
        auto access_kind = didpoop::model::access_kind_from_string(kind);
        if (!access_kind.ok()) {
            return fail(access_kind.status());
        }
        return print_or_fail(repo.GrantAccess(creature_id, user_id, creator_id,
                                              access_kind.value()));
    }

    if (*poop_record_cmd) {
        return print_or_fail(repo.RecordPoop(creator_id, creature_id));
    }
    if (*poop_list_cmd) {
        if (poop_creator_opt->count() > 0) {
            return print_or_fail(repo.ListPoopsByCreator(creator_id));
        }
        return print_or_fail(repo.ListPoopsForCreature(creature_id));
    }

    return 0;
}
