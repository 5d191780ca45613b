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

// The application tables, in creation order (a table only references tables
// before it):
//
//   users, auth_tokens, creatures, creature_access_kind, creature_access,
//   poops
//
// Every "id" column is a bigint primary key filled with Database::NextId().

#pragma once

// =====================================================================
// c++ std
// =====================================================================

#include <string>
#include <vector>

// =====================================================================
// protobuf generated files
// =====================================================================

#include "src/schema/schema.pb.h"

namespace didpoop::schema {

inline constexpr char kUsers[] = "users";
inline constexpr char kAuthTokens[] = "auth_tokens";
inline constexpr char kCreatures[] = "creatures";
inline constexpr char kCreatureAccessKind[] = "creature_access_kind";
inline constexpr char kCreatureAccess[] = "creature_access";
inline constexpr char kPoops[] = "poops";

std::vector<Table> builtin_tables();

}  // namespace didpoop::schema
