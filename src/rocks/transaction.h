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

#include <mutex>
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// rocksdb
#include "rocksdb/db.h"
#include "rocksdb/utilities/write_batch_with_index.h"

// absl
#include "absl/status/status.h"
#include "absl/status/statusor.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/rocks/rocks.h"

namespace didpoop::rocks {

// A write transaction on the default column family.
//
// Writes are buffered in an indexed batch, reads see the buffered writes on
// top of the database. Nothing reaches the database until Commit(); a
// transaction destroyed without Commit() is rolled back. The writer lock is
// held for the whole lifetime of the transaction.
class Transaction : public Reader {
   public:
    Transaction(rocksdb::DB* db, std::mutex& writer_mutex);

    ~Transaction() override = default;

    // copy blocker
    Transaction(const Transaction&) = delete;

    // assignment blocker
    void operator=(const Transaction&) = delete;

    absl::Status Get(const std::string& key, std::string* value) override;

    absl::StatusOr<KVPairs> GetAll(const std::string& prefix) override;

    absl::Status Put(const std::string& key, const std::string& value);

    absl::Status Delete(const std::string& key);

    absl::Status Commit();

   private:
    std::unique_lock<std::mutex> lock_;
    rocksdb::DB* db_;
    rocksdb::WriteBatchWithIndex batch_;
    bool committed_ = false;
};

}  // namespace didpoop::rocks
