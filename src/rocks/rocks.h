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

// Column families:
//
// - default: rows, index entries and unique entries (see src/encode)
// - catalog: table metadata, key: <table name>, value: json of the Table
// - sequence: durable sequence marks, key: <sequence name>, value: decimal

#pragma once

// =====================================================================
// c++ std
// =====================================================================

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// rocksdb
#include "rocksdb/db.h"
#include "rocksdb/options.h"

// absl
#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace didpoop::rocks {

inline constexpr char kCatalogFamily[] = "catalog";
inline constexpr char kSequenceFamily[] = "sequence";

using KVPairs = std::vector<std::pair<std::string, std::string>>;

// Read access to the default column family, either straight from the
// database or through a transaction that sees its own writes.
class Reader {
   public:
    virtual ~Reader() = default;

    // NotFound if the key is absent.
    virtual absl::Status Get(const std::string& key, std::string* value) = 0;

    // All pairs whose key starts with prefix, in key order.
    virtual absl::StatusOr<KVPairs> GetAll(const std::string& prefix) = 0;
};

class Transaction;

class RocksDBWrapper : public Reader {
   private:
    RocksDBWrapper(rocksdb::DB* db,
                   std::unordered_map<std::string, rocksdb::ColumnFamilyHandle*>
                       cf_handles);

   public:
    // Opens (creating if missing) the database at db_path with the default
    // column family plus column_family_names.
    static absl::StatusOr<std::unique_ptr<RocksDBWrapper>> Open(
        const std::string& db_path,
        const std::vector<std::string>& column_family_names);

    ~RocksDBWrapper() override;

    // copy blocker
    RocksDBWrapper(const RocksDBWrapper&) = delete;

    // assignment blocker
    void operator=(const RocksDBWrapper&) = delete;

    // Rows are written through Begin(), this is for the other families.
    absl::Status Put(const std::string& cf_name, const std::string& key,
                     const std::string& value, bool sync = false);

    absl::Status Get(const std::string& key, std::string* value) override;
    absl::Status Get(const std::string& cf_name, const std::string& key,
                     std::string* value);

    absl::StatusOr<KVPairs> GetAll(const std::string& prefix) override;
    absl::StatusOr<KVPairs> GetAllKV(const std::string& cf_name);

    std::vector<std::string> ColumnFamilies() const;

    // Starts a write transaction. Only one transaction is alive at a time,
    // Begin() blocks until the previous one is destroyed.
    std::unique_ptr<Transaction> Begin();

   private:
    rocksdb::DB* db_;
    std::unordered_map<std::string, rocksdb::ColumnFamilyHandle*> cf_handles_;

    std::mutex writer_mutex_;

    void Close();
    absl::StatusOr<rocksdb::ColumnFamilyHandle*> GetColumnFamilyHandle(
        const std::string& cf_name);
};

absl::Status ToAbsl(const rocksdb::Status& status);

}  // namespace didpoop::rocks
