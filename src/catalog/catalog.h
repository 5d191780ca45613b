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

// The catalog keeps every table definition in memory and in the "catalog"
// column family:
//
// - key: <table name>
// - value: json of the didpoop.schema.Table message

#pragma once

// =====================================================================
// c++ std
// =====================================================================

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/rocks/rocks.h"
#include "src/schema/schema.h"

namespace didpoop::catalog {

class Catalog {
   public:
    explicit Catalog(didpoop::rocks::RocksDBWrapper* db);

    // copy blocker
    Catalog(const Catalog&) = delete;

    // assignment blocker
    void operator=(const Catalog&) = delete;

    // Reads all table definitions from disk, replacing the in-memory ones.
    absl::Status Load();

    // AlreadyExists if a table with the same name exists. InvalidArgument or
    // FailedPrecondition if the definition is invalid, e.g. a foreign key to
    // a table that does not exist yet.
    absl::Status CreateTable(const didpoop::schema::Table& table);

    std::optional<std::shared_ptr<const didpoop::schema::Table>> GetTable(
        const std::string& table_name) const;

    // sorted by name
    std::vector<std::string> ListTables() const;

   private:
    didpoop::rocks::RocksDBWrapper* db_;

    mutable std::mutex mutex_;

    // all tables, key: table_name, value: table
    std::unordered_map<std::string,
                       std::shared_ptr<const didpoop::schema::Table>>
        tables_;

    // NB: caller must hold mutex_
    absl::Status ValidateReferences(const didpoop::schema::Table& table) const;
};

}  // namespace didpoop::catalog
