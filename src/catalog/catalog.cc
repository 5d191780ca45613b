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

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/strings/str_format.h"

// spdlog
#include "spdlog/spdlog.h"

// protobuf
#include "google/protobuf/util/json_util.h"

// =====================================================================
// self header
// =====================================================================

#include "src/catalog/catalog.h"

namespace didpoop::catalog {

Catalog::Catalog(didpoop::rocks::RocksDBWrapper* db) : db_(db) {}

absl::Status Catalog::Load() {
    auto kv_pairs = db_->GetAllKV(didpoop::rocks::kCatalogFamily);
    if (!kv_pairs.ok()) {
        return kv_pairs.status();
    }

    std::unordered_map<std::string,
                       std::shared_ptr<const didpoop::schema::Table>>
        tables;
    for (const auto& [name, json] : kv_pairs.value()) {
        auto table = std::make_shared<didpoop::schema::Table>();
        auto status = google::protobuf::util::JsonStringToMessage(json,
                                                                  table.get());
        if (!status.ok()) {
            SPDLOG_ERROR("failed to parse table {}: {}", name,
                         status.ToString());
            return absl::DataLossError(absl::StrFormat(
                "corrupted definition of table %s: %s", name,
                status.ToString()));
        }
        tables[name] = table;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    tables_ = std::move(tables);
    SPDLOG_INFO("catalog loaded, {} tables", tables_.size());
    return absl::OkStatus();
}

absl::Status Catalog::CreateTable(const didpoop::schema::Table& table) {
    auto status = didpoop::schema::validate(table);
    if (!status.ok()) {
        return status;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (tables_.contains(table.name())) {
        return absl::AlreadyExistsError(
            absl::StrFormat("table %s already exists", table.name()));
    }

    status = ValidateReferences(table);
    if (!status.ok()) {
        return status;
    }

    // write to disk
    std::string json;
    auto json_status =
        google::protobuf::util::MessageToJsonString(table, &json);
    if (!json_status.ok()) {
        return absl::InternalError(json_status.ToString());
    }
    status = db_->Put(didpoop::rocks::kCatalogFamily, table.name(), json,
                      /*sync=*/true);
    if (!status.ok()) {
        SPDLOG_ERROR("create table {} failed: {}", table.name(),
                     status.ToString());
        return status;
    }

    // write to in-memory cache
    tables_[table.name()] = std::make_shared<didpoop::schema::Table>(table);
    SPDLOG_INFO("created table {}", table.name());
    return absl::OkStatus();
}

absl::Status Catalog::ValidateReferences(
    const didpoop::schema::Table& table) const {
    for (const auto& column : table.columns()) {
        if (!column.has_references()) {
            continue;
        }
        const auto& fk = column.references();

        const didpoop::schema::Table* target = nullptr;
        if (fk.table() == table.name()) {
            target = &table;
        } else {
            auto it = tables_.find(fk.table());
            if (it != tables_.end()) {
                target = it->second.get();
            }
        }
        if (target == nullptr) {
            return absl::FailedPreconditionError(absl::StrFormat(
                "%s.%s references unknown table %s", table.name(),
                column.name(), fk.table()));
        }

        const auto* target_column =
            didpoop::schema::find_column(*target, fk.column());
        if (target_column == nullptr || !target_column->is_primary_key()) {
            return absl::FailedPreconditionError(absl::StrFormat(
                "%s.%s must reference the primary key of %s, got %s",
                table.name(), column.name(), fk.table(), fk.column()));
        }
        if (target_column->type() != column.type()) {
            return absl::InvalidArgumentError(absl::StrFormat(
                "%s.%s is %s but %s.%s is %s", table.name(), column.name(),
                column.type(), fk.table(), fk.column(),
                target_column->type()));
        }
    }
    return absl::OkStatus();
}

std::optional<std::shared_ptr<const didpoop::schema::Table>> Catalog::GetTable(
    const std::string& table_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tables_.find(table_name);
    if (it != tables_.end()) {
        return it->second;
    } else {
        return std::nullopt;
    }
}

std::vector<std::string> Catalog::ListTables() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, _] : tables_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace didpoop::catalog
