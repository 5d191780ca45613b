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

#include <optional>
#include <string>
#include <utility>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/strings/str_format.h"

// spdlog
#include "spdlog/spdlog.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/encode/encode.h"

// =====================================================================
// self header
// =====================================================================

#include "src/query/query.h"

namespace didpoop::query {

namespace {

// Adds one stored column value to the row. Columns no longer in the table
// definition are skipped.
absl::Status decode_into(const didpoop::schema::Table& table,
                         const std::string& column_name,
                         const std::string& encoded, didpoop::type::Row* row) {
    const auto* column = didpoop::schema::find_column(table, column_name);
    if (column == nullptr) {
        SPDLOG_WARN("skip unknown column {} of table {}", column_name,
                    table.name());
        return absl::OkStatus();
    }
    auto type = didpoop::schema::column_type(*column);
    if (!type.ok()) {
        return type.status();
    }
    auto datum = didpoop::encode::decode(encoded, type.value());
    if (!datum.ok()) {
        return datum.status();
    }
    (*row)[column_name] = datum.value();
    return absl::OkStatus();
}

absl::StatusOr<didpoop::type::Row> get_by_key(
    didpoop::rocks::Reader& reader, const didpoop::schema::Table& table,
    const std::string& pk_key) {
    auto prefix = didpoop::encode::row_prefix(table.name(), pk_key);
    auto kv_pairs = reader.GetAll(prefix);
    if (!kv_pairs.ok()) {
        return kv_pairs.status();
    }
    if (kv_pairs->empty()) {
        return absl::NotFoundError(
            absl::StrFormat("no row %s in table %s", pk_key, table.name()));
    }

    didpoop::type::Row row;
    for (const auto& [key, value] : kv_pairs.value()) {
        auto status =
            decode_into(table, key.substr(prefix.size()), value, &row);
        if (!status.ok()) {
            return status;
        }
    }
    return row;
}

}  // namespace

absl::StatusOr<didpoop::type::Row> get(didpoop::rocks::Reader& reader,
                                       const didpoop::schema::Table& table,
                                       const didpoop::type::Datum& pk) {
    return get_by_key(reader, table, didpoop::encode::encode_key(pk));
}

absl::StatusOr<bool> exists(didpoop::rocks::Reader& reader,
                            const didpoop::schema::Table& table,
                            const didpoop::type::Datum& pk) {
    auto pk_index = didpoop::schema::get_pk_index(table);
    if (!pk_index.ok()) {
        return pk_index.status();
    }

    // every row stores its primary key column
    std::string value;
    auto status = reader.Get(
        didpoop::encode::row_key(table.name(), didpoop::encode::encode_key(pk),
                                 table.columns(pk_index.value()).name()),
        &value);
    if (status.ok()) {
        return true;
    }
    if (absl::IsNotFound(status)) {
        return false;
    }
    return status;
}

absl::StatusOr<std::optional<didpoop::type::Datum>> lookup_unique(
    didpoop::rocks::Reader& reader, const didpoop::schema::Table& table,
    const std::string& column, const didpoop::type::Datum& value) {
    const auto* unique_column = didpoop::schema::find_column(table, column);
    if (unique_column == nullptr || !unique_column->unique()) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "%s.%s is not a unique column", table.name(), column));
    }

    std::string encoded_pk;
    auto status = reader.Get(
        didpoop::encode::unique_key(table.name(), column,
                                    didpoop::encode::encode_key(value)),
        &encoded_pk);
    if (absl::IsNotFound(status)) {
        return std::nullopt;
    }
    if (!status.ok()) {
        return status;
    }

    auto pk_index = didpoop::schema::get_pk_index(table);
    if (!pk_index.ok()) {
        return pk_index.status();
    }
    auto pk_type =
        didpoop::schema::column_type(table.columns(pk_index.value()));
    if (!pk_type.ok()) {
        return pk_type.status();
    }
    auto pk = didpoop::encode::decode(encoded_pk, pk_type.value());
    if (!pk.ok()) {
        return pk.status();
    }
    return std::optional<didpoop::type::Datum>(pk.value());
}

absl::StatusOr<std::vector<didpoop::type::Row>> lookup_index(
    didpoop::rocks::Reader& reader, const didpoop::schema::Table& table,
    const std::string& index_name, const didpoop::type::Datum& value) {
    if (didpoop::schema::find_index(table, index_name) == nullptr) {
        return absl::NotFoundError(absl::StrFormat(
            "index %s not found on table %s", index_name, table.name()));
    }

    auto prefix = didpoop::encode::index_prefix(
        table.name(), index_name, didpoop::encode::encode_key(value));
    auto entries = reader.GetAll(prefix);
    if (!entries.ok()) {
        return entries.status();
    }

    std::vector<didpoop::type::Row> rows;
    for (const auto& [key, _] : entries.value()) {
        auto row = get_by_key(reader, table, key.substr(prefix.size()));
        if (!row.ok()) {
            SPDLOG_ERROR("dangling index entry {}: {}", key,
                         row.status().ToString());
            return row.status();
        }
        rows.push_back(std::move(row.value()));
    }
    return rows;
}

absl::StatusOr<std::vector<didpoop::type::Row>> scan(
    didpoop::rocks::Reader& reader, const didpoop::schema::Table& table) {
    auto prefix = didpoop::encode::table_prefix(table.name());
    auto kv_pairs = reader.GetAll(prefix);
    if (!kv_pairs.ok()) {
        return kv_pairs.status();
    }

    // keys are <prefix><pk>/<column>, all columns of a row are adjacent
    std::vector<didpoop::type::Row> rows;
    std::string current_pk;
    for (const auto& [key, value] : kv_pairs.value()) {
        auto rest = key.substr(prefix.size());
        auto slash = rest.find('/');
        if (slash == std::string::npos) {
            return absl::DataLossError("malformed row key: " + key);
        }
        auto pk_key = rest.substr(0, slash);
        if (rows.empty() || pk_key != current_pk) {
            rows.emplace_back();
            current_pk = pk_key;
        }
        auto status =
            decode_into(table, rest.substr(slash + 1), value, &rows.back());
        if (!status.ok()) {
            return status;
        }
    }
    return rows;
}

}  // namespace didpoop::query
