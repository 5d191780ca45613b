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

#include <cstdint>
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/catalog/catalog.h"
#include "src/rocks/transaction.h"
#include "src/schema/schema.h"
#include "src/type/type.h"

namespace didpoop::insert {

// Inserts one row into the transaction.
//
// The primary key must be part of `row`: ids come from Database::NextId()
// and are assigned by the caller before the row is built. Absent columns get
// their defaults (now_millis for timestamps, false for flags).
//
// Errors:
// - InvalidArgument: unknown column, wrong type, missing primary key, null in
//   a not-null column
// - AlreadyExists: duplicate primary key or unique value
// - FailedPrecondition: a foreign key points to a missing row
absl::Status insert(didpoop::rocks::Transaction& txn,
                    const didpoop::catalog::Catalog& catalog,
                    const didpoop::schema::Table& table,
                    didpoop::type::Row row, int64_t now_millis);

// The referenced row of a foreign key column exists.
absl::Status check_reference(didpoop::rocks::Reader& reader,
                             const didpoop::catalog::Catalog& catalog,
                             const didpoop::schema::Table& table,
                             const didpoop::schema::Column& column,
                             const didpoop::type::Datum& value);

// Column exists in the table and the value has its type.
absl::Status check_value(const didpoop::schema::Table& table,
                         const std::string& column_name,
                         const didpoop::type::Datum& value);

// The row belongs in the index: it has a value for the indexed column and,
// for a partial index, is not soft deleted.
bool in_index(const didpoop::schema::Index& index,
              const didpoop::type::Row& row);

}  // namespace didpoop::insert
