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

// A Database is the process-wide owner of everything under one data
// directory: the RocksDB instance, the catalog, the clock, the durable id
// sequence and the id generator.
//
// There is no global instance, callers hold the unique_ptr returned by Open().

#pragma once

// =====================================================================
// c++ std
// =====================================================================

#include <cstdint>
#include <memory>
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"
#include "absl/status/statusor.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/catalog/catalog.h"
#include "src/config/config.h"
#include "src/id/clock.h"
#include "src/id/durable_sequence.h"
#include "src/id/generator.h"
#include "src/id/sequence.h"
#include "src/rocks/rocks.h"
#include "src/rocks/transaction.h"
#include "src/schema/schema.h"

namespace didpoop::database {

// name of the sequence behind every "id" column
inline constexpr char kIdSequence[] = "id_seq";

class Database {
   private:
    Database(const didpoop::config::Config& config,
             std::unique_ptr<didpoop::rocks::RocksDBWrapper> db,
             std::unique_ptr<didpoop::id::Clock> clock);

   public:
    // Opens the data directory of the config, creating it if missing. A
    // nullptr clock means the system clock, a nullptr sequence the durable
    // kIdSequence.
    static absl::StatusOr<std::unique_ptr<Database>> Open(
        const didpoop::config::Config& config,
        std::unique_ptr<didpoop::id::Clock> clock = nullptr,
        std::unique_ptr<didpoop::id::Sequence> sequence = nullptr);

    // copy blocker
    Database(const Database&) = delete;

    // assignment blocker
    void operator=(const Database&) = delete;

    // Creates the application tables that are missing and seeds
    // creature_access_kind. Safe to call on every start.
    absl::Status Bootstrap();

    // A new primary key. In strict mode the generator errors are returned
    // as is. A sequence that can't persist its mark gives Unavailable.
    absl::StatusOr<int64_t> NextId();

    // Timestamp for created/modified, from the clock the ids use.
    int64_t NowMillis() const;

    // NotFound if the table doesn't exist.
    absl::StatusOr<std::shared_ptr<const didpoop::schema::Table>> Table(
        const std::string& table_name) const;

    std::unique_ptr<didpoop::rocks::Transaction> Begin();

    didpoop::catalog::Catalog& catalog() { return *catalog_; }

    didpoop::rocks::RocksDBWrapper& store() { return *db_; }

    didpoop::id::Mode mode() const { return mode_; }

    const std::string& instance_id() const { return instance_id_; }

   private:
    // declared first, destroyed last
    std::unique_ptr<didpoop::rocks::RocksDBWrapper> db_;

    std::unique_ptr<didpoop::catalog::Catalog> catalog_;
    std::unique_ptr<didpoop::id::Clock> clock_;
    std::unique_ptr<didpoop::id::Sequence> sequence_;
    std::unique_ptr<didpoop::id::Generator> generator_;

    didpoop::id::Mode mode_;
    std::string instance_id_;
};

}  // namespace didpoop::database
