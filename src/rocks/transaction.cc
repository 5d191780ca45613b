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

#include <memory>
#include <mutex>
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// rocksdb
#include "rocksdb/comparator.h"
#include "rocksdb/db.h"
#include "rocksdb/utilities/write_batch_with_index.h"

// spdlog
#include "spdlog/spdlog.h"

// =====================================================================
// self header
// =====================================================================

#include "src/rocks/transaction.h"

namespace didpoop::rocks {

Transaction::Transaction(rocksdb::DB* db, std::mutex& writer_mutex)
    : lock_(writer_mutex),
      db_(db),
      // overwrite_key so the batch iterator yields the latest write only
      batch_(rocksdb::BytewiseComparator(), 0, true) {}

absl::Status Transaction::Get(const std::string& key, std::string* value) {
    return ToAbsl(
        batch_.GetFromBatchAndDB(db_, rocksdb::ReadOptions(), key, value));
}

absl::StatusOr<KVPairs> Transaction::GetAll(const std::string& prefix) {
    // the batch iterator takes ownership of the base iterator
    std::unique_ptr<rocksdb::Iterator> it(
        batch_.NewIteratorWithBase(db_->NewIterator(rocksdb::ReadOptions())));
    KVPairs kv_pairs;
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix);
         it->Next()) {
        kv_pairs.emplace_back(it->key().ToString(), it->value().ToString());
    }
    if (!it->status().ok()) {
        return ToAbsl(it->status());
    }
    return kv_pairs;
}

absl::Status Transaction::Put(const std::string& key,
                              const std::string& value) {
    if (committed_) {
        return absl::FailedPreconditionError("transaction already committed");
    }
    return ToAbsl(batch_.Put(key, value));
}

absl::Status Transaction::Delete(const std::string& key) {
    if (committed_) {
        return absl::FailedPreconditionError("transaction already committed");
    }
    return ToAbsl(batch_.Delete(key));
}

absl::Status Transaction::Commit() {
    if (committed_) {
        return absl::FailedPreconditionError("transaction already committed");
    }
    auto status = ToAbsl(db_->Write(rocksdb::WriteOptions(),
                                    batch_.GetWriteBatch()));
    if (!status.ok()) {
        SPDLOG_ERROR("commit failed: {}", status.ToString());
        return status;
    }
    committed_ = true;
    return absl::OkStatus();
}

}  // namespace didpoop::rocks
