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

namespace didpoop::update {

// Sets the columns in `changes` on the row with primary key `pk`, and
// "modified" to now_millis unless `changes` sets it. The primary key itself
// can't change.
//
// Errors:
// - NotFound: no such row
// - InvalidArgument: unknown column, wrong type, primary key in changes
// - AlreadyExists: a unique value is taken by another row
// - FailedPrecondition: a foreign key points to a missing row
absl::Status update(didpoop::rocks::Transaction& txn,
                    const didpoop::catalog::Catalog& catalog,
                    const didpoop::schema::Table& table,
                    const didpoop::type::Datum& pk,
                    const didpoop::type::Row& changes, int64_t now_millis);

// Marks the row deleted. The row keeps its id and stays readable by primary
// key, it drops out of partial indexes. Deleting a deleted row only touches
// "modified".
//
// FailedPrecondition if the table has no "deleted" column.
absl::Status soft_delete(didpoop::rocks::Transaction& txn,
                         const didpoop::catalog::Catalog& catalog,
                         const didpoop::schema::Table& table,
                         const didpoop::type::Datum& pk, int64_t now_millis);

}  // namespace didpoop::update
