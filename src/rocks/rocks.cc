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

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
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
#include "absl/strings/str_format.h"

// spdlog
#include "spdlog/spdlog.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/rocks/transaction.h"

// =====================================================================
// self header
// =====================================================================

#include "src/rocks/rocks.h"

namespace didpoop::rocks {

absl::Status ToAbsl(const rocksdb::Status& status) {
    if (status.ok()) {
        return absl::OkStatus();
    }
    if (status.IsNotFound()) {
        return absl::NotFoundError(status.ToString());
    }
    if (status.IsBusy() || status.IsTimedOut() || status.IsTryAgain()) {
        return absl::UnavailableError(status.ToString());
    }
    return absl::InternalError(status.ToString());
}

absl::StatusOr<std::unique_ptr<RocksDBWrapper>> RocksDBWrapper::Open(
    const std::string& db_path,
    const std::vector<std::string>& column_family_names) {
    std::error_code ec;
    std::filesystem::create_directories(db_path, ec);
    if (ec) {
        return absl::InternalError(absl::StrFormat(
            "failed to create directory %s: %s", db_path, ec.message()));
    }

    rocksdb::Options options;
    options.create_if_missing = true;
    options.create_missing_column_families = true;

    std::vector<rocksdb::ColumnFamilyDescriptor> cf_descriptors;
    std::vector<rocksdb::ColumnFamilyHandle*> handles;

    // Always add the default column family
    cf_descriptors.emplace_back(rocksdb::kDefaultColumnFamilyName,
                                rocksdb::ColumnFamilyOptions());

    // Add user-defined column families
    for (const auto& name : column_family_names) {
        cf_descriptors.emplace_back(name, rocksdb::ColumnFamilyOptions());
    }

    // Open database with column families
    rocksdb::DB* db = nullptr;
    rocksdb::Status status =
        rocksdb::DB::Open(options, db_path, cf_descriptors, &handles, &db);
    if (!status.ok()) {
        SPDLOG_ERROR("failed to open rocksdb at {}: {}", db_path,
                     status.ToString());
        return absl::InternalError("failed to open rocksdb: " +
                                   status.ToString());
    }

    // Map column family handles to names
    std::unordered_map<std::string, rocksdb::ColumnFamilyHandle*> cf_handles;
    for (size_t i = 0; i < cf_descriptors.size(); ++i) {
        cf_handles[cf_descriptors[i].name] = handles[i];
    }

    SPDLOG_INFO("opened rocksdb at {}, column families: {}", db_path,
                cf_descriptors.size());
    return std::unique_ptr<RocksDBWrapper>(
        new RocksDBWrapper(db, std::move(cf_handles)));
}

RocksDBWrapper::RocksDBWrapper(
    rocksdb::DB* db,
    std::unordered_map<std::string, rocksdb::ColumnFamilyHandle*> cf_handles)
    : db_(db), cf_handles_(std::move(cf_handles)) {}

RocksDBWrapper::~RocksDBWrapper() { Close(); }

void RocksDBWrapper::Close() {
    for (const auto& cf : cf_handles_) {
        auto status = db_->DestroyColumnFamilyHandle(cf.second);
        if (!status.ok()) {
            SPDLOG_ERROR("failed to destroy column family {}: {}", cf.first,
                         status.ToString());
        }
    }
    cf_handles_.clear();
    delete db_;
    db_ = nullptr;
}

absl::StatusOr<rocksdb::ColumnFamilyHandle*>
RocksDBWrapper::GetColumnFamilyHandle(const std::string& cf_name) {
    auto it = cf_handles_.find(cf_name);
    if (it == cf_handles_.end()) {
        return absl::NotFoundError("column family not found: " + cf_name);
    }
    return it->second;
}

absl::Status RocksDBWrapper::Put(const std::string& cf_name,
                                 const std::string& key,
                                 const std::string& value, bool sync) {
    auto handle = GetColumnFamilyHandle(cf_name);
    if (!handle.ok()) {
        return handle.status();
    }
    rocksdb::WriteOptions write_options;
    write_options.sync = sync;
    return ToAbsl(db_->Put(write_options, handle.value(), key, value));
}

absl::Status RocksDBWrapper::Get(const std::string& key, std::string* value) {
    return ToAbsl(db_->Get(rocksdb::ReadOptions(), key, value));
}

absl::Status RocksDBWrapper::Get(const std::string& cf_name,
                                 const std::string& key, std::string* value) {
    auto handle = GetColumnFamilyHandle(cf_name);
    if (!handle.ok()) {
        return handle.status();
    }
    return ToAbsl(db_->Get(rocksdb::ReadOptions(), handle.value(), key, value));
}

absl::StatusOr<KVPairs> RocksDBWrapper::GetAll(const std::string& prefix) {
    std::unique_ptr<rocksdb::Iterator> it(
        db_->NewIterator(rocksdb::ReadOptions()));
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

absl::StatusOr<KVPairs> RocksDBWrapper::GetAllKV(const std::string& cf_name) {
    auto handle = GetColumnFamilyHandle(cf_name);
    if (!handle.ok()) {
        return handle.status();
    }

    KVPairs kv_pairs;

    // Create an iterator for the column family
    std::unique_ptr<rocksdb::Iterator> it(
        db_->NewIterator(rocksdb::ReadOptions(), handle.value()));

    // Iterate through all key-value pairs
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        kv_pairs.emplace_back(it->key().ToString(), it->value().ToString());
    }

    // Check for any errors during iteration
    if (!it->status().ok()) {
        return ToAbsl(it->status());
    }

    return kv_pairs;
}

std::vector<std::string> RocksDBWrapper::ColumnFamilies() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : cf_handles_) {
        names.push_back(name);
    }
    return names;
}

std::unique_ptr<Transaction> RocksDBWrapper::Begin() {
    return std::make_unique<Transaction>(db_, writer_mutex_);
}

}  // namespace didpoop::rocks
