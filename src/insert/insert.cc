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
#include <utility>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/strings/str_format.h"

// spdlog
#include "spdlog/spdlog.h"

// json
#include "nlohmann/json.hpp"

// =====================================================================
// local libraries
// =====================================================================

#include "src/encode/encode.h"
#include "src/query/query.h"

// =====================================================================
// self header
// =====================================================================

#include "src/insert/insert.h"

namespace didpoop::insert {

absl::Status check_value(const didpoop::schema::Table& table,
                         const std::string& column_name,
                         const didpoop::type::Datum& value) {
    const auto* column = didpoop::schema::find_column(table, column_name);
    if (column == nullptr) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "column %s of table %s does not exist", column_name, table.name()));
    }
    auto type = didpoop::schema::column_type(*column);
    if (!type.ok()) {
        return type.status();
    }
    if (!didpoop::type::matches(value, type.value())) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "value %s does not fit column %s.%s of type %s",
            didpoop::type::debug_string(value), table.name(), column_name,
            column->type()));
    }
    return absl::OkStatus();
}

absl::Status check_reference(didpoop::rocks::Reader& reader,
                             const didpoop::catalog::Catalog& catalog,
                             const didpoop::schema::Table& table,
                             const didpoop::schema::Column& column,
                             const didpoop::type::Datum& value) {
    const auto& fk = column.references();
    auto target = catalog.GetTable(fk.table());
    if (!target.has_value()) {
        return absl::NotFoundError(
            absl::StrFormat("table %s not found", fk.table()));
    }

    auto found = didpoop::query::exists(reader, *target.value(), value);
    if (!found.ok()) {
        return found.status();
    }
    if (!found.value()) {
        return absl::FailedPreconditionError(absl::StrFormat(
            "%s.%s = %s violates foreign key: no %s.%s", table.name(),
            column.name(), didpoop::type::debug_string(value), fk.table(),
            fk.column()));
    }
    return absl::OkStatus();
}

bool in_index(const didpoop::schema::Index& index,
              const didpoop::type::Row& row) {
    if (!row.contains(index.column())) {
        return false;
    }
    if (!index.only_undeleted()) {
        return true;
    }
    auto it = row.find(didpoop::schema::kDeletedColumn);
    return it != row.end() && std::holds_alternative<bool>(it->second) &&
           !std::get<bool>(it->second);
}

absl::Status insert(didpoop::rocks::Transaction& txn,
                    const didpoop::catalog::Catalog& catalog,
                    const didpoop::schema::Table& table,
                    didpoop::type::Row row, int64_t now_millis) {
    for (const auto& [name, value] : row) {
        auto status = check_value(table, name, value);
        if (!status.ok()) {
            return status;
        }
    }

    auto pk_index = didpoop::schema::get_pk_index(table);
    if (!pk_index.ok()) {
        return pk_index.status();
    }
    const auto& pk_column = table.columns(pk_index.value());
    auto pk_it = row.find(pk_column.name());
    if (pk_it == row.end()) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "primary key %s.%s must be supplied", table.name(),
            pk_column.name()));
    }
    const didpoop::type::Datum pk = pk_it->second;

    // defaults and not-null
    for (const auto& column : table.columns()) {
        if (row.contains(column.name())) {
            continue;
        }
        switch (column.default_kind()) {
            case didpoop::schema::DEFAULT_NOW:
                row[column.name()] = now_millis;
                break;
            case didpoop::schema::DEFAULT_FALSE:
                row[column.name()] = false;
                break;
            default:
                if (column.not_null()) {
                    return absl::InvalidArgumentError(absl::StrFormat(
                        "null value in column %s.%s violates not-null "
                        "constraint",
                        table.name(), column.name()));
                }
                break;
        }
    }

    auto found = didpoop::query::exists(txn, table, pk);
    if (!found.ok()) {
        return found.status();
    }
    if (found.value()) {
        return absl::AlreadyExistsError(absl::StrFormat(
            "duplicate key %s = %s in table %s", pk_column.name(),
            didpoop::type::debug_string(pk), table.name()));
    }

    auto pk_key = didpoop::encode::encode_key(pk);

    for (const auto& column : table.columns()) {
        auto it = row.find(column.name());
        if (it == row.end()) {
            continue;
        }

        if (column.unique()) {
            auto owner = didpoop::query::lookup_unique(txn, table,
                                                       column.name(), it->second);
            if (!owner.ok()) {
                return owner.status();
            }
            if (owner->has_value()) {
                return absl::AlreadyExistsError(absl::StrFormat(
                    "duplicate value %s for unique column %s.%s",
                    didpoop::type::debug_string(it->second), table.name(),
                    column.name()));
            }
        }

        if (column.has_references()) {
            auto status =
                check_reference(txn, catalog, table, column, it->second);
            if (!status.ok()) {
                return status;
            }
        }
    }

    // write
    for (const auto& [name, value] : row) {
        auto status = txn.Put(
            didpoop::encode::row_key(table.name(), pk_key, name),
            didpoop::encode::encode(value));
        if (!status.ok()) {
            return status;
        }

        const auto* column = didpoop::schema::find_column(table, name);
        if (column->unique()) {
            status = txn.Put(
                didpoop::encode::unique_key(table.name(), name,
                                            didpoop::encode::encode_key(value)),
                didpoop::encode::encode(pk));
            if (!status.ok()) {
                return status;
            }
        }
    }

    for (const auto& index : table.indexes()) {
        if (!in_index(index, row)) {
            continue;
        }
        auto status = txn.Put(
            didpoop::encode::index_key(
                table.name(), index.name(),
                didpoop::encode::encode_key(row.at(index.column())), pk_key),
            "");
        if (!status.ok()) {
            return status;
        }
    }

    SPDLOG_DEBUG("insert into {}: {}", table.name(), nlohmann::json(row).dump());
    return absl::OkStatus();
}

}  // namespace didpoop::insert
