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

#include <set>
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/strings/ascii.h"
#include "absl/strings/str_format.h"

// magic_enum
#include "magic_enum/magic_enum.hpp"

// =====================================================================
// self header
// =====================================================================

#include "src/schema/schema.h"

namespace didpoop::schema {

namespace {

// names end up inside storage keys, keep them to [a-z0-9_]
bool valid_name(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    for (char c : name) {
        if (!absl::ascii_islower(c) && !absl::ascii_isdigit(c) && c != '_') {
            return false;
        }
    }
    return true;
}

}  // namespace

absl::StatusOr<int> get_pk_index(const Table& table) {
    for (int i = 0; i < table.columns_size(); i++) {
        if (table.columns(i).is_primary_key()) {
            return i;
        }
    }
    return absl::FailedPreconditionError("no primary key found in table " +
                                         table.name());
}

const Column* find_column(const Table& table, const std::string& name) {
    for (const auto& column : table.columns()) {
        if (column.name() == name) {
            return &column;
        }
    }
    return nullptr;
}

const Index* find_index(const Table& table, const std::string& name) {
    for (const auto& index : table.indexes()) {
        if (index.name() == name) {
            return &index;
        }
    }
    return nullptr;
}

absl::StatusOr<didpoop::type::Type> column_type(const Column& column) {
    return didpoop::type::from_string(column.type());
}

bool is_soft_deletable(const Table& table) {
    const Column* deleted = find_column(table, kDeletedColumn);
    return deleted != nullptr && deleted->type() == "boolean";
}

absl::Status validate(const Table& table) {
    if (!valid_name(table.name())) {
        return absl::InvalidArgumentError(
            absl::StrFormat("invalid table name '%s'", table.name()));
    }

    std::set<std::string> names;
    int primary_keys = 0;
    for (const auto& column : table.columns()) {
        if (!valid_name(column.name())) {
            return absl::InvalidArgumentError(absl::StrFormat(
                "invalid column name '%s' in table %s", column.name(),
                table.name()));
        }
        if (!names.insert(column.name()).second) {
            return absl::InvalidArgumentError(absl::StrFormat(
                "duplicate column %s in table %s", column.name(),
                table.name()));
        }

        auto type = column_type(column);
        if (!type.ok()) {
            return type.status();
        }

        if (column.is_primary_key()) {
            primary_keys++;
        }

        bool default_ok = true;
        switch (column.default_kind()) {
            case DEFAULT_NONE:
                break;
            case DEFAULT_ID_GEN:
                default_ok = type.value() == didpoop::type::Type::Int64;
                break;
            case DEFAULT_NOW:
                default_ok = type.value() == didpoop::type::Type::Timestamp;
                break;
            case DEFAULT_FALSE:
                default_ok = type.value() == didpoop::type::Type::Bool;
                break;
            default:
                default_ok = false;
                break;
        }
        if (!default_ok) {
            return absl::InvalidArgumentError(absl::StrFormat(
                "default %s does not fit column %s of type %s",
                magic_enum::enum_name(column.default_kind()), column.name(),
                column.type()));
        }
    }

    if (primary_keys != 1) {
        return absl::InvalidArgumentError(
            absl::StrFormat("table %s must have exactly one primary key, has %d",
                            table.name(), primary_keys));
    }

    std::set<std::string> index_names;
    for (const auto& index : table.indexes()) {
        if (!valid_name(index.name())) {
            return absl::InvalidArgumentError(
                absl::StrFormat("invalid index name '%s'", index.name()));
        }
        if (!index_names.insert(index.name()).second) {
            return absl::InvalidArgumentError(absl::StrFormat(
                "duplicate index %s on table %s", index.name(), table.name()));
        }
        if (find_column(table, index.column()) == nullptr) {
            return absl::InvalidArgumentError(absl::StrFormat(
                "index %s references unknown column %s", index.name(),
                index.column()));
        }
        if (index.only_undeleted() && !is_soft_deletable(table)) {
            return absl::InvalidArgumentError(absl::StrFormat(
                "partial index %s needs a boolean %s column", index.name(),
                kDeletedColumn));
        }
    }

    return absl::OkStatus();
}

}  // namespace didpoop::schema
