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
#include <utility>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/strings/str_format.h"

// spdlog
#include "spdlog/spdlog.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/insert/insert.h"
#include "src/query/query.h"
#include "src/schema/schema.h"
#include "src/schema/tables.h"
#include "src/update/update.h"

// =====================================================================
// self header
// =====================================================================

#include "src/repository/repository.h"

namespace didpoop::repository {

using didpoop::model::AccessKind;
using didpoop::model::AuthToken;
using didpoop::model::Creature;
using didpoop::model::CreatureAccess;
using didpoop::model::CreatureRelation;
using didpoop::model::Poop;
using didpoop::model::User;
using didpoop::type::Row;

namespace {

bool is_deleted(const Row& row) {
    auto it = row.find(didpoop::schema::kDeletedColumn);
    return it != row.end() && std::holds_alternative<bool>(it->second) &&
           std::get<bool>(it->second);
}

template <typename M>
absl::StatusOr<std::vector<M>> from_rows(const std::vector<Row>& rows) {
    std::vector<M> models;
    models.reserve(rows.size());
    for (const auto& row : rows) {
        auto model = M::FromRow(row);
        if (!model.ok()) {
            return model.status();
        }
        models.push_back(std::move(model).value());
    }
    return models;
}

}  // namespace

Repository::Repository(didpoop::database::Database* db) : db_(db) {}

absl::StatusOr<Row> Repository::Insert(didpoop::rocks::Transaction& txn,
                                       const std::string& table_name,
                                       Row row) {
    auto table = db_->Table(table_name);
    if (!table.ok()) {
        return table.status();
    }

    auto id = db_->NextId();
    if (!id.ok()) {
        SPDLOG_ERROR("failed to generate id for {}: {}", table_name,
                     id.status().ToString());
        return id.status();
    }
    row["id"] = id.value();

    auto status = didpoop::insert::insert(txn, db_->catalog(), **table,
                                          std::move(row), db_->NowMillis());
    if (!status.ok()) {
        return status;
    }
    return didpoop::query::get(txn, **table, id.value());
}

absl::StatusOr<Row> Repository::InsertOne(const std::string& table_name,
                                          Row row) {
    auto txn = db_->Begin();
    auto inserted = Insert(*txn, table_name, std::move(row));
    if (!inserted.ok()) {
        return inserted.status();
    }
    auto status = txn->Commit();
    if (!status.ok()) {
        return status;
    }
    return inserted;
}

absl::Status Repository::SoftDelete(const std::string& table_name,
                                    int64_t id) {
    auto table = db_->Table(table_name);
    if (!table.ok()) {
        return table.status();
    }
    auto txn = db_->Begin();
    auto status = didpoop::update::soft_delete(*txn, db_->catalog(), **table,
                                               id, db_->NowMillis());
    if (!status.ok()) {
        return status;
    }
    status = txn->Commit();
    if (!status.ok()) {
        return status;
    }
    SPDLOG_INFO("deleted {} {}", table_name, id);
    return absl::OkStatus();
}

absl::StatusOr<Row> Repository::GetLive(const std::string& table_name,
                                        int64_t id) {
    auto table = db_->Table(table_name);
    if (!table.ok()) {
        return table.status();
    }
    auto row = didpoop::query::get(db_->store(), **table, id);
    if (!row.ok()) {
        return row.status();
    }
    if (is_deleted(row.value())) {
        return absl::NotFoundError(
            absl::StrFormat("%s %d is deleted", table_name, id));
    }
    return row;
}

absl::StatusOr<std::vector<Row>> Repository::LookupIndex(
    const std::string& table_name, const std::string& index_name,
    const didpoop::type::Datum& value) {
    auto table = db_->Table(table_name);
    if (!table.ok()) {
        return table.status();
    }
    return didpoop::query::lookup_index(db_->store(), **table, index_name,
                                        value);
}

// =====================================================================
// users
// =====================================================================

absl::StatusOr<User> Repository::CreateUser(const std::string& email,
                                            const std::string& name,
                                            const std::string& pw_salt,
                                            const std::string& pw_hash) {
    auto row = InsertOne(didpoop::schema::kUsers, {
                                                      {"email", email},
                                                      {"name", name},
                                                      {"pw_salt", pw_salt},
                                                      {"pw_hash", pw_hash},
                                                  });
    if (!row.ok()) {
        return row.status();
    }
    auto user = User::FromRow(row.value());
    if (user.ok()) {
        SPDLOG_INFO("created user {} ({})", user->id, user->email);
    }
    return user;
}

absl::StatusOr<User> Repository::GetUser(int64_t id) {
    auto row = GetLive(didpoop::schema::kUsers, id);
    if (!row.ok()) {
        return row.status();
    }
    return User::FromRow(row.value());
}

absl::StatusOr<User> Repository::FindUserByEmail(const std::string& email) {
    auto rows = LookupIndex(didpoop::schema::kUsers, "users_email", email);
    if (!rows.ok()) {
        return rows.status();
    }
    if (rows->empty()) {
        return absl::NotFoundError("no user with email " + email);
    }
    return User::FromRow(rows->front());
}

// =====================================================================
// auth tokens
// =====================================================================

absl::StatusOr<AuthToken> Repository::CreateAuthToken(
    int64_t user_id, const std::string& hash, int64_t expires_millis) {
    auto row = InsertOne(didpoop::schema::kAuthTokens,
                         {
                             {"user_id", user_id},
                             {"hash", hash},
                             {"expires", expires_millis},
                         });
    if (!row.ok()) {
        return row.status();
    }
    return AuthToken::FromRow(row.value());
}

absl::StatusOr<User> Repository::FindUserByTokenHash(const std::string& hash,
                                                     int64_t now_millis) {
    auto rows =
        LookupIndex(didpoop::schema::kAuthTokens, "auth_tokens_hash", hash);
    if (!rows.ok()) {
        return rows.status();
    }
    auto tokens = from_rows<AuthToken>(rows.value());
    if (!tokens.ok()) {
        return tokens.status();
    }
    for (const auto& token : tokens.value()) {
        if (token.expires <= now_millis) {
            continue;
        }
        auto user = GetUser(token.user_id);
        if (absl::IsNotFound(user.status())) {
            continue;
        }
        return user;
    }
    return absl::NotFoundError("no live token");
}

absl::Status Repository::RevokeAuthToken(int64_t id) {
    return SoftDelete(didpoop::schema::kAuthTokens, id);
}

// =====================================================================
// creatures
// =====================================================================

absl::StatusOr<CreatureRelation> Repository::CreateCreature(
    int64_t creator_id, const std::string& name) {
    auto txn = db_->Begin();

    auto creature_row = Insert(*txn, didpoop::schema::kCreatures,
                               {
                                   {"creator_id", creator_id},
                                   {"name", name},
                               });
    if (!creature_row.ok()) {
        return creature_row.status();
    }
    auto creature = Creature::FromRow(creature_row.value());
    if (!creature.ok()) {
        return creature.status();
    }

    auto access_row = Insert(*txn, didpoop::schema::kCreatureAccess,
                             {
                                 {"creature_id", creature->id},
                                 {"user_id", creator_id},
                                 {"creator_id", creator_id},
                                 {"kind", to_string(AccessKind::Creator)},
                             });
    if (!access_row.ok()) {
        return access_row.status();
    }
    auto access = CreatureAccess::FromRow(access_row.value());
    if (!access.ok()) {
        return access.status();
    }

    auto status = txn->Commit();
    if (!status.ok()) {
        return status;
    }
    SPDLOG_INFO("created creature {} for user {}", creature->id, creator_id);
    return CreatureRelation(creature.value(), access.value());
}

absl::StatusOr<CreatureAccess> Repository::GrantAccess(int64_t creature_id,
                                                       int64_t user_id,
                                                       int64_t creator_id,
                                                       AccessKind kind) {
    auto creatures = db_->Table(didpoop::schema::kCreatures);
    if (!creatures.ok()) {
        return creatures.status();
    }

    // liveness is checked under the writer lock held by the insert
    auto txn = db_->Begin();
    auto creature = didpoop::query::get(*txn, **creatures, creature_id);
    if (absl::IsNotFound(creature.status()) ||
        (creature.ok() && is_deleted(creature.value()))) {
        return absl::FailedPreconditionError(
            absl::StrFormat("creature %d does not exist", creature_id));
    }
    if (!creature.ok()) {
        return creature.status();
    }

    auto row = Insert(*txn, didpoop::schema::kCreatureAccess,
                      {
                          {"creature_id", creature_id},
                          {"user_id", user_id},
                          {"creator_id", creator_id},
                          {"kind", to_string(kind)},
                      });
    if (!row.ok()) {
        return row.status();
    }
    auto status = txn->Commit();
    if (!status.ok()) {
        return status;
    }
    SPDLOG_INFO("granted {} on creature {} to user {}", to_string(kind),
                creature_id, user_id);
    return CreatureAccess::FromRow(row.value());
}

absl::Status Repository::RevokeAccess(int64_t access_id) {
    return SoftDelete(didpoop::schema::kCreatureAccess, access_id);
}

absl::StatusOr<std::vector<CreatureRelation>> Repository::ListCreaturesForUser(
    int64_t user_id) {
    auto rows = LookupIndex(didpoop::schema::kCreatureAccess,
                            "idx_creature_access_user", user_id);
    if (!rows.ok()) {
        return rows.status();
    }
    auto grants = from_rows<CreatureAccess>(rows.value());
    if (!grants.ok()) {
        return grants.status();
    }

    std::vector<CreatureRelation> relations;
    for (const auto& access : grants.value()) {
        auto creature_row = GetLive(didpoop::schema::kCreatures,
                                    access.creature_id);
        if (absl::IsNotFound(creature_row.status())) {
            continue;
        }
        if (!creature_row.ok()) {
            return creature_row.status();
        }
        auto creature = Creature::FromRow(creature_row.value());
        if (!creature.ok()) {
            return creature.status();
        }
        relations.emplace_back(creature.value(), access);
    }
    return relations;
}

absl::StatusOr<CreatureRelation> Repository::GetCreatureRelation(
    int64_t creature_id, int64_t user_id) {
    auto creature_row = GetLive(didpoop::schema::kCreatures, creature_id);
    if (!creature_row.ok()) {
        return creature_row.status();
    }
    auto creature = Creature::FromRow(creature_row.value());
    if (!creature.ok()) {
        return creature.status();
    }

    auto rows = LookupIndex(didpoop::schema::kCreatureAccess,
                            "idx_creature_access_creature", creature_id);
    if (!rows.ok()) {
        return rows.status();
    }
    auto grants = from_rows<CreatureAccess>(rows.value());
    if (!grants.ok()) {
        return grants.status();
    }
    for (const auto& access : grants.value()) {
        if (access.user_id == user_id) {
            return CreatureRelation(creature.value(), access);
        }
    }
    return absl::NotFoundError(absl::StrFormat(
        "user %d has no access to creature %d", user_id, creature_id));
}

absl::Status Repository::DeleteCreature(int64_t id) {
    return SoftDelete(didpoop::schema::kCreatures, id);
}

// =====================================================================
// poops
// =====================================================================

absl::StatusOr<Poop> Repository::RecordPoop(int64_t creator_id,
                                            int64_t creature_id) {
    auto row = InsertOne(didpoop::schema::kPoops,
                         {
                             {"creator_id", creator_id},
                             {"creature_id", creature_id},
                         });
    if (!row.ok()) {
        return row.status();
    }
    return Poop::FromRow(row.value());
}

absl::StatusOr<std::vector<Poop>> Repository::ListPoopsForCreature(
    int64_t creature_id) {
    auto rows =
        LookupIndex(didpoop::schema::kPoops, "idx_poop_creature", creature_id);
    if (!rows.ok()) {
        return rows.status();
    }
    return from_rows<Poop>(rows.value());
}

absl::StatusOr<std::vector<Poop>> Repository::ListPoopsByCreator(
    int64_t user_id) {
    auto rows =
        LookupIndex(didpoop::schema::kPoops, "idx_poop_creator", user_id);
    if (!rows.ok()) {
        return rows.status();
    }
    return from_rows<Poop>(rows.value());
}

absl::Status Repository::DeletePoop(int64_t id) {
    return SoftDelete(didpoop::schema::kPoops, id);
}

}  // namespace didpoop::repository
