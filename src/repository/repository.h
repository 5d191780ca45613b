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
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"
#include "absl/status/statusor.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/database/database.h"
#include "src/model/model.h"
#include "src/rocks/transaction.h"
#include "src/type/type.h"

namespace didpoop::repository {

// Data operations of the application. Every new row gets its id from
// Database::NextId() before it is written.
//
// Lookups skip soft deleted rows and return NotFound for them. Access grants
// are only recorded, nothing here checks them.
class Repository {
   public:
    explicit Repository(didpoop::database::Database* db);

    // ---------------------------------------------------------------------
    // users
    // ---------------------------------------------------------------------

    // AlreadyExists if the email is taken.
    absl::StatusOr<didpoop::model::User> CreateUser(const std::string& email,
                                                    const std::string& name,
                                                    const std::string& pw_salt,
                                                    const std::string& pw_hash);

    absl::StatusOr<didpoop::model::User> GetUser(int64_t id);

    absl::StatusOr<didpoop::model::User> FindUserByEmail(
        const std::string& email);

    // ---------------------------------------------------------------------
    // auth tokens
    // ---------------------------------------------------------------------

    absl::StatusOr<didpoop::model::AuthToken> CreateAuthToken(
        int64_t user_id, const std::string& hash, int64_t expires_millis);

    // The user owning a live token: neither the token nor the user is
    // deleted, and the token expires after now_millis.
    absl::StatusOr<didpoop::model::User> FindUserByTokenHash(
        const std::string& hash, int64_t now_millis);

    absl::Status RevokeAuthToken(int64_t id);

    // ---------------------------------------------------------------------
    // creatures
    // ---------------------------------------------------------------------

    // Inserts the creature and the creator grant of its creator in one
    // transaction.
    absl::StatusOr<didpoop::model::CreatureRelation> CreateCreature(
        int64_t creator_id, const std::string& name);

    // FailedPrecondition if the creature is deleted.
    absl::StatusOr<didpoop::model::CreatureAccess> GrantAccess(
        int64_t creature_id, int64_t user_id, int64_t creator_id,
        didpoop::model::AccessKind kind);

    absl::Status RevokeAccess(int64_t access_id);

    // One relation per live grant of the user on a live creature, in grant
    // order.
    absl::StatusOr<std::vector<didpoop::model::CreatureRelation>>
    ListCreaturesForUser(int64_t user_id);

    // The first live grant of the user on the creature.
    absl::StatusOr<didpoop::model::CreatureRelation> GetCreatureRelation(
        int64_t creature_id, int64_t user_id);

    absl::Status DeleteCreature(int64_t id);

    // ---------------------------------------------------------------------
    // poops
    // ---------------------------------------------------------------------

    absl::StatusOr<didpoop::model::Poop> RecordPoop(int64_t creator_id,
                                                    int64_t creature_id);

    // oldest first
    absl::StatusOr<std::vector<didpoop::model::Poop>> ListPoopsForCreature(
        int64_t creature_id);

    absl::StatusOr<std::vector<didpoop::model::Poop>> ListPoopsByCreator(
        int64_t user_id);

    absl::Status DeletePoop(int64_t id);

   private:
    didpoop::database::Database* db_;

    // Assigns a new id to the row, inserts it and reads it back.
    absl::StatusOr<didpoop::type::Row> Insert(
        didpoop::rocks::Transaction& txn, const std::string& table_name,
        didpoop::type::Row row);

    // Insert() in a transaction of its own.
    absl::StatusOr<didpoop::type::Row> InsertOne(const std::string& table_name,
                                                 didpoop::type::Row row);

    absl::Status SoftDelete(const std::string& table_name, int64_t id);

    // NotFound for a missing or deleted row.
    absl::StatusOr<didpoop::type::Row> GetLive(const std::string& table_name,
                                               int64_t id);

    absl::StatusOr<std::vector<didpoop::type::Row>> LookupIndex(
        const std::string& table_name, const std::string& index_name,
        const didpoop::type::Datum& value);
};

}  // namespace didpoop::repository
