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
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// magic_enum
#include "magic_enum/magic_enum.hpp"

// spdlog
#include "spdlog/spdlog.h"

// json
#include "nlohmann/json.hpp"

// =====================================================================
// local libraries
// =====================================================================

#include "src/insert/insert.h"
#include "src/model/model.h"
#include "src/query/query.h"
#include "src/schema/tables.h"

// =====================================================================
// self header
// =====================================================================

#include "src/database/database.h"

namespace didpoop::database {

Database::Database(const didpoop::config::Config& config,
                   std::unique_ptr<didpoop::rocks::RocksDBWrapper> db,
                   std::unique_ptr<didpoop::id::Clock> clock)
    : db_(std::move(db)),
      catalog_(std::make_unique<didpoop::catalog::Catalog>(db_.get())),
      clock_(std::move(clock)),
      mode_(config.strict_ids ? didpoop::id::Mode::Strict
                              : didpoop::id::Mode::Compatible),
      instance_id_(config.instance_id) {}

absl::StatusOr<std::unique_ptr<Database>> Database::Open(
    const didpoop::config::Config& config,
    std::unique_ptr<didpoop::id::Clock> clock,
    std::unique_ptr<didpoop::id::Sequence> sequence) {
    SPDLOG_INFO("opening database, config: {}",
                nlohmann::json(config).dump());

    auto db = didpoop::rocks::RocksDBWrapper::Open(
        config.data_dir,
        {didpoop::rocks::kCatalogFamily, didpoop::rocks::kSequenceFamily});
    if (!db.ok()) {
        return db.status();
    }

    if (clock == nullptr) {
        clock = std::make_unique<didpoop::id::SystemClock>();
    }

    std::unique_ptr<Database> database(
        new Database(config, std::move(db).value(), std::move(clock)));

    auto status = database->catalog_->Load();
    if (!status.ok()) {
        return status;
    }

    if (sequence == nullptr) {
        auto durable = didpoop::id::DurableSequence::Open(
            database->db_.get(), kIdSequence, 1, config.sequence_cache);
        if (!durable.ok()) {
            return durable.status();
        }
        sequence = std::move(durable).value();
    }
    database->sequence_ = std::move(sequence);

    database->generator_ = std::make_unique<didpoop::id::Generator>(
        *database->clock_, *database->sequence_);

    SPDLOG_INFO("database opened, instance: {}, id mode: {}",
                database->instance_id_,
                magic_enum::enum_name(database->mode_));
    return database;
}

absl::Status Database::Bootstrap() {
    for (const auto& table : didpoop::schema::builtin_tables()) {
        if (catalog_->GetTable(table.name()).has_value()) {
            continue;
        }
        auto status = catalog_->CreateTable(table);
        if (!status.ok()) {
            return status;
        }
    }

    auto kind_table = Table(didpoop::schema::kCreatureAccessKind);
    if (!kind_table.ok()) {
        return kind_table.status();
    }

    auto txn = Begin();
    for (auto kind : magic_enum::enum_values<didpoop::model::AccessKind>()) {
        didpoop::type::Datum pk = didpoop::model::to_string(kind);
        auto found = didpoop::query::exists(*txn, **kind_table, pk);
        if (!found.ok()) {
            return found.status();
        }
        if (found.value()) {
            continue;
        }
        didpoop::type::Row row{{"kind", pk}};
        auto status = didpoop::insert::insert(*txn, *catalog_, **kind_table,
                                              std::move(row), NowMillis());
        if (!status.ok()) {
            return status;
        }
        SPDLOG_INFO("seeded access kind {}", std::get<std::string>(pk));
    }
    return txn->Commit();
}

absl::StatusOr<int64_t> Database::NextId() {
    try {
        if (mode_ == didpoop::id::Mode::Strict) {
            return generator_->NextIdChecked();
        }
        return generator_->NextId();
    } catch (const std::exception& e) {
        SPDLOG_ERROR("id sequence unavailable: {}", e.what());
        return absl::UnavailableError(e.what());
    }
}

int64_t Database::NowMillis() const { return clock_->NowMillis(); }

absl::StatusOr<std::shared_ptr<const didpoop::schema::Table>> Database::Table(
    const std::string& table_name) const {
    auto table = catalog_->GetTable(table_name);
    if (!table.has_value()) {
        return absl::NotFoundError("table not found: " + table_name);
    }
    return table.value();
}

std::unique_ptr<didpoop::rocks::Transaction> Database::Begin() {
    return db_->Begin();
}

}  // namespace didpoop::database
