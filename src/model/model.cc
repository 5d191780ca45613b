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
#include <string>
#include <variant>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/strings/ascii.h"
#include "absl/strings/str_format.h"

// magic_enum
#include "magic_enum/magic_enum.hpp"

// =====================================================================
// self header
// =====================================================================

#include "src/model/model.h"

namespace didpoop::model {

namespace {

template <typename T>
absl::Status read(const didpoop::type::Row& row, const std::string& column,
                  T* out) {
    auto it = row.find(column);
    if (it == row.end()) {
        return absl::DataLossError("missing column " + column);
    }
    if (!std::holds_alternative<T>(it->second)) {
        return absl::DataLossError(
            absl::StrFormat("unexpected value %s in column %s",
                            didpoop::type::debug_string(it->second), column));
    }
    *out = std::get<T>(it->second);
    return absl::OkStatus();
}

// reads the bookkeeping columns shared by every table
template <typename M>
absl::Status read_bookkeeping(const didpoop::type::Row& row, M* m) {
    auto status = read(row, "id", &m->id);
    if (status.ok()) status = read(row, "deleted", &m->deleted);
    if (status.ok()) status = read(row, "created", &m->created);
    if (status.ok()) status = read(row, "modified", &m->modified);
    return status;
}

}  // namespace

std::string to_string(AccessKind kind) {
    return absl::AsciiStrToLower(magic_enum::enum_name(kind));
}

absl::StatusOr<AccessKind> access_kind_from_string(const std::string& name) {
    auto kind = magic_enum::enum_cast<AccessKind>(name, [](char a, char b) {
        return absl::ascii_tolower(a) == absl::ascii_tolower(b);
    });
    if (!kind.has_value()) {
        return absl::InvalidArgumentError("unknown access kind: " + name);
    }
    return kind.value();
}

absl::StatusOr<User> User::FromRow(const didpoop::type::Row& row) {
    User user;
    auto status = read_bookkeeping(row, &user);
    if (status.ok()) status = read(row, "email", &user.email);
    if (status.ok()) status = read(row, "name", &user.name);
    if (status.ok()) status = read(row, "pw_salt", &user.pw_salt);
    if (status.ok()) status = read(row, "pw_hash", &user.pw_hash);
    if (!status.ok()) {
        return status;
    }
    return user;
}

SimpleUser::SimpleUser(const User& user) : id(user.id), name(user.name) {}

absl::StatusOr<AuthToken> AuthToken::FromRow(const didpoop::type::Row& row) {
    AuthToken token;
    auto status = read_bookkeeping(row, &token);
    if (status.ok()) status = read(row, "user_id", &token.user_id);
    if (status.ok()) status = read(row, "hash", &token.hash);
    if (status.ok()) status = read(row, "expires", &token.expires);
    if (!status.ok()) {
        return status;
    }
    return token;
}

absl::StatusOr<Creature> Creature::FromRow(const didpoop::type::Row& row) {
    Creature creature;
    auto status = read_bookkeeping(row, &creature);
    if (status.ok()) status = read(row, "creator_id", &creature.creator_id);
    if (status.ok()) status = read(row, "name", &creature.name);
    if (!status.ok()) {
        return status;
    }
    return creature;
}

absl::StatusOr<CreatureAccess> CreatureAccess::FromRow(
    const didpoop::type::Row& row) {
    CreatureAccess access;
    std::string kind;
    auto status = read_bookkeeping(row, &access);
    if (status.ok()) status = read(row, "creature_id", &access.creature_id);
    if (status.ok()) status = read(row, "user_id", &access.user_id);
    if (status.ok()) status = read(row, "creator_id", &access.creator_id);
    if (status.ok()) status = read(row, "kind", &kind);
    if (!status.ok()) {
        return status;
    }
    auto parsed = access_kind_from_string(kind);
    if (!parsed.ok()) {
        return absl::DataLossError(parsed.status().message());
    }
    access.kind = parsed.value();
    return access;
}

CreatureRelation::CreatureRelation(const Creature& creature,
                                   const CreatureAccess& access)
    : id(creature.id),
      user_id(access.user_id),
      kind(access.kind),
      creator_id(creature.creator_id),
      name(creature.name),
      deleted(creature.deleted),
      created(creature.created),
      modified(creature.modified) {}

absl::StatusOr<Poop> Poop::FromRow(const didpoop::type::Row& row) {
    Poop poop;
    auto status = read_bookkeeping(row, &poop);
    if (status.ok()) status = read(row, "creator_id", &poop.creator_id);
    if (status.ok()) status = read(row, "creature_id", &poop.creature_id);
    if (!status.ok()) {
        return status;
    }
    return poop;
}

void to_json(nlohmann::json& j, const User& user) {
    j = nlohmann::json{
        {"id", std::to_string(user.id)},
        {"email", user.email},
        {"name", user.name},
        {"created", user.created},
        {"modified", user.modified},
    };
}

void to_json(nlohmann::json& j, const SimpleUser& user) {
    j = nlohmann::json{
        {"id", std::to_string(user.id)},
        {"name", user.name},
    };
}

void to_json(nlohmann::json& j, const AuthToken& token) {
    j = nlohmann::json{
        {"id", std::to_string(token.id)},
        {"user_id", std::to_string(token.user_id)},
        {"expires", token.expires},
        {"created", token.created},
    };
}

void to_json(nlohmann::json& j, const CreatureAccess& access) {
    j = nlohmann::json{
        {"id", std::to_string(access.id)},
        {"creature_id", std::to_string(access.creature_id)},
        {"user_id", std::to_string(access.user_id)},
        {"creator_id", std::to_string(access.creator_id)},
        {"kind", to_string(access.kind)},
        {"created", access.created},
    };
}

void to_json(nlohmann::json& j, const CreatureRelation& relation) {
    j = nlohmann::json{
        {"id", std::to_string(relation.id)},
        {"relation", to_string(relation.kind)},
        {"creator_id", std::to_string(relation.creator_id)},
        {"name", relation.name},
        {"created", relation.created},
        {"modified", relation.modified},
    };
}

void to_json(nlohmann::json& j, const Poop& poop) {
    j = nlohmann::json{
        {"id", std::to_string(poop.id)},
        {"creator_id", std::to_string(poop.creator_id)},
        {"creature_id", std::to_string(poop.creature_id)},
        {"created", poop.created},
        {"modified", poop.modified},
    };
}

}  // namespace didpoop::model
