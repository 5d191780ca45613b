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

#include <optional>
#include <string>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"
#include "absl/status/statusor.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/rocks/rocks.h"
#include "src/schema/schema.h"
#include "src/type/type.h"

namespace didpoop::query {

// NotFound if there is no row with the primary key. Soft deleted rows are
// returned, check the "deleted" column.
absl::StatusOr<didpoop::type::Row> get(didpoop::rocks::Reader& reader,
                                       const didpoop::schema::Table& table,
                                       const didpoop::type::Datum& pk);

absl::StatusOr<bool> exists(didpoop::rocks::Reader& reader,
                            const didpoop::schema::Table& table,
                            const didpoop::type::Datum& pk);

// The primary key of the row holding `value` in the unique column, if any.
absl::StatusOr<std::optional<didpoop::type::Datum>> lookup_unique(
    didpoop::rocks::Reader& reader, const didpoop::schema::Table& table,
    const std::string& column, const didpoop::type::Datum& value);

// Rows whose indexed column equals `value`, in primary key order. A partial
// index only returns rows that are not soft deleted.
absl::StatusOr<std::vector<didpoop::type::Row>> lookup_index(
    didpoop::rocks::Reader& reader, const didpoop::schema::Table& table,
    const std::string& index_name, const didpoop::type::Datum& value);

// All rows of the table, deleted or not, in primary key order.
absl::StatusOr<std::vector<didpoop::type::Row>> scan(
    didpoop::rocks::Reader& reader, const didpoop::schema::Table& table);

}  // namespace didpoop::query
