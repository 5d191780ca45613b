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
#include "absl/status/statusor.h"

// json
#include "nlohmann/json.hpp"

// =====================================================================
// local libraries
// =====================================================================

#include "src/type/type.h"

namespace didpoop::model {

// Rows of creature_access_kind.
enum class AccessKind {
    Creator,
    Pooper,
    Reader,
};

// creator, pooper, reader
std::string to_string(AccessKind kind);

absl::StatusOr<AccessKind> access_kind_from_string(const std::string& name);

// Timestamps are milliseconds since the unix epoch.

class User {
   public:
    int64_t id = 0;
    std::string email;
    std::string name;
    std::string pw_salt;
    std::string pw_hash;
    bool deleted = false;
    int64_t created = 0;
    int64_t modified = 0;

    static absl::StatusOr<User> FromRow(const didpoop::type::Row& row);
};

// The public part of a user.
class SimpleUser {
   public:
    int64_t id = 0;
    std::string name;

    explicit SimpleUser(const User& user);
};

class AuthToken {
   public:
    int64_t id = 0;
    int64_t user_id = 0;
    std::string hash;
    int64_t expires = 0;
    bool deleted = false;
    int64_t created = 0;
    int64_t modified = 0;

    static absl::StatusOr<AuthToken> FromRow(const didpoop::type::Row& row);
};

class Creature {
   public:
    int64_t id = 0;
    int64_t creator_id = 0;
    std::string name;
    bool deleted = false;
    int64_t created = 0;
    int64_t modified = 0;

    static absl::StatusOr<Creature> FromRow(const didpoop::type::Row& row);
};

class CreatureAccess {
   public:
    int64_t id = 0;
    int64_t creature_id = 0;
    int64_t user_id = 0;
    int64_t creator_id = 0;
    AccessKind kind = AccessKind::Reader;
    bool deleted = false;
    int64_t created = 0;
    int64_t modified = 0;

    static absl::StatusOr<CreatureAccess> FromRow(
        const didpoop::type::Row& row);
};

// A creature as seen by one user: the creature joined with the user's grant.
class CreatureRelation {
   public:
    // the creature id
    int64_t id = 0;
    int64_t user_id = 0;
    AccessKind kind = AccessKind::Reader;
    int64_t creator_id = 0;
    std::string name;
    bool deleted = false;
    int64_t created = 0;
    int64_t modified = 0;

    CreatureRelation() = default;
    CreatureRelation(const Creature& creature, const CreatureAccess& access);
};

class Poop {
   public:
    int64_t id = 0;
    int64_t creator_id = 0;
    int64_t creature_id = 0;
    bool deleted = false;
    int64_t created = 0;
    int64_t modified = 0;

    static absl::StatusOr<Poop> FromRow(const didpoop::type::Row& row);
};

// ids are rendered as strings, they don't fit a javascript number
void to_json(nlohmann::json& j, const User& user);
void to_json(nlohmann::json& j, const SimpleUser& user);
void to_json(nlohmann::json& j, const AuthToken& token);
void to_json(nlohmann::json& j, const CreatureAccess& access);
void to_json(nlohmann::json& j, const CreatureRelation& relation);
void to_json(nlohmann::json& j, const Poop& poop);

}  // namespace didpoop::model
