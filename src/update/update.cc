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

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/strings/str_format.h"

// spdlog
#include "spdlog/spdlog.h"

// nlohmann/json
#include "nlohmann/json.hpp"

// =====================================================================
// local libraries
// =====================================================================

#include "src/encode/encode.h"
#include "src/insert/insert.h"
#include "src/query/query.h"

// =====================================================================
// self header
// =====================================================================

#include "src/update/update.h"

namespace didpoop::update {

absl::Status update(didpoop::rocks::Transaction& txn,
                    const didpoop::catalog::Catalog& catalog,
                    const didpoop::schema::Table& table,
                    const didpoop::type::Datum& pk,
                    const didpoop::type::Row& changes, int64_t now_millis) {
    auto pk_index = didpoop::schema::get_pk_index(table);
    if (!pk_index.ok()) {
        return pk_index.status();
    }
    const auto& pk_column = table.columns(pk_index.value());

    for (const auto& [name, value] : changes) {
        if (name == pk_column.name()) {
            return absl::InvalidArgumentError(absl::StrFormat(
                "primary key %s.%s can't be updated", table.name(), name));
        }
        auto status = didpoop::insert::check_value(table, name, value);
        if (!status.ok()) {
            return status;
        }
    }

    auto old_row = didpoop::query::get(txn, table, pk);
    if (!old_row.ok()) {
        return old_row.status();
    }

    didpoop::type::Row new_row = old_row.value();
    for (const auto& [name, value] : changes) {
        new_row[name] = value;
    }
    if (didpoop::schema::find_column(table, didpoop::schema::kModifiedColumn) !=
            nullptr &&
        !changes.contains(didpoop::schema::kModifiedColumn)) {
        new_row[didpoop::schema::kModifiedColumn] = now_millis;
    }

    auto pk_key = didpoop::encode::encode_key(pk);

    for (const auto& [name, value] : new_row) {
        auto old_it = old_row->find(name);
        bool changed = old_it == old_row->end() || old_it->second != value;
        if (!changed) {
            continue;
        }

        const auto* column = didpoop::schema::find_column(table, name);

        if (column->unique()) {
            auto owner =
                didpoop::query::lookup_unique(txn, table, name, value);
            if (!owner.ok()) {
                return owner.status();
            }
            if (owner->has_value() && owner->value() != pk) {
                return absl::AlreadyExistsError(absl::StrFormat(
                    "duplicate value %s for unique column %s.%s",
                    didpoop::type::debug_string(value), table.name(), name));
            }
            if (old_it != old_row->end()) {
                auto status = txn.Delete(didpoop::encode::unique_key(
                    table.name(), name,
                    didpoop::encode::encode_key(old_it->second)));
                if (!status.ok()) {
                    return status;
                }
            }
            auto status = txn.Put(
                didpoop::encode::unique_key(table.name(), name,
                                            didpoop::encode::encode_key(value)),
                didpoop::encode::encode(pk));
            if (!status.ok()) {
                return status;
            }
        }

        if (column->has_references()) {
            auto status = didpoop::insert::check_reference(txn, catalog, table,
                                                           *column, value);
            if (!status.ok()) {
                return status;
            }
        }

        auto status =
            txn.Put(didpoop::encode::row_key(table.name(), pk_key, name),
                    didpoop::encode::encode(value));
        if (!status.ok()) {
            return status;
        }
    }

    // move index entries whose key or membership changed
    for (const auto& index : table.indexes()) {
        bool was_in = didpoop::insert::in_index(index, old_row.value());
        bool is_in = didpoop::insert::in_index(index, new_row);
        std::string old_key;
        std::string new_key;
        if (was_in) {
            old_key = didpoop::encode::index_key(
                table.name(), index.name(),
                didpoop::encode::encode_key(old_row->at(index.column())),
                pk_key);
        }
        if (is_in) {
            new_key = didpoop::encode::index_key(
                table.name(), index.name(),
                didpoop::encode::encode_key(new_row.at(index.column())),
                pk_key);
        }
        if (old_key == new_key) {
            continue;
        }
        if (was_in) {
            auto status = txn.Delete(old_key);
            if (!status.ok()) {
                return status;
            }
        }
        if (is_in) {
            auto status = txn.Put(new_key, "");
            if (!status.ok()) {
                return status;
            }
        }
    }

    SPDLOG_DEBUG("update {} {}: {}", table.name(),
                 didpoop::type::debug_string(pk),
                 nlohmann::json(changes).dump());
    return absl::OkStatus();
}

absl::Status soft_delete(didpoop::rocks::Transaction& txn,
                         const didpoop::catalog::Catalog& catalog,
                         const didpoop::schema::Table& table,
                         const didpoop::type::Datum& pk, int64_t now_millis) {
    if (!didpoop::schema::is_soft_deletable(table)) {
        return absl::FailedPreconditionError(absl::StrFormat(
            "table %s has no %s column", table.name(),
            didpoop::schema::kDeletedColumn));
    }
    return update(txn, catalog, table, pk,
                  {{didpoop::schema::kDeletedColumn, true}}, now_millis);
}

}  // namespace didpoop::update
