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

#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"
#include "absl/status/statusor.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/type/type.h"

// =====================================================================
// protobuf generated files
// =====================================================================

#include "src/schema/schema.pb.h"

namespace didpoop::schema {

// soft delete flag, rows are never physically removed
inline constexpr char kDeletedColumn[] = "deleted";

// touched by every update
inline constexpr char kModifiedColumn[] = "modified";

absl::StatusOr<int> get_pk_index(const Table& table);

// nullptr if the table has no such column
const Column* find_column(const Table& table, const std::string& name);

const Index* find_index(const Table& table, const std::string& name);

absl::StatusOr<didpoop::type::Type> column_type(const Column& column);

// The table has a boolean "deleted" column.
bool is_soft_deletable(const Table& table);

// Checks that only involve the table itself: names, types, a single primary
// key, defaults matching column types, index columns. Foreign key targets
// are checked by the catalog.
absl::Status validate(const Table& table);

}  // namespace didpoop::schema
