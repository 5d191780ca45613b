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

// The storage pattern of rows is:
//
// - column value
//   - key: r/<table>/<pk>/<column>
//   - value: encode(<value>)
// - index entry (one per indexed row)
//   - key: i/<table>/<index>/<value>/<pk>
//   - value: empty
// - unique entry (one per row and unique column)
//   - key: u/<table>/<column>/<value>
//   - value: <pk>
//
// <pk> and <value> inside keys use encode_key(), which never contains '/' and
// sorts the same way as the values it encodes.

#pragma once

// =====================================================================
// c++ std
// =====================================================================

#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/statusor.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/type/type.h"

namespace didpoop::encode {

std::string encode(const didpoop::type::Datum& datum);

absl::StatusOr<didpoop::type::Datum> decode(const std::string& str,
                                            didpoop::type::Type type);

std::string encode_key(const didpoop::type::Datum& datum);

std::string table_prefix(const std::string& table);

std::string row_prefix(const std::string& table, const std::string& pk_key);

std::string row_key(const std::string& table, const std::string& pk_key,
                    const std::string& column);

std::string index_prefix(const std::string& table, const std::string& index,
                         const std::string& value_key);

std::string index_key(const std::string& table, const std::string& index,
                      const std::string& value_key, const std::string& pk_key);

std::string unique_key(const std::string& table, const std::string& column,
                       const std::string& value_key);

}  // namespace didpoop::encode
