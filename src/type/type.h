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
#include <map>
#include <string>
#include <variant>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/statusor.h"

// json
#include "nlohmann/json.hpp"

namespace didpoop::type {

enum class Type {
    Int64 = 10,
    String = 20,
    Bool = 30,
    // milliseconds since the unix epoch, held as int64
    Timestamp = 40,
};

using Datum = std::variant<int64_t, std::string, bool>;

// A row, or a part of a row: column name -> value. A column that is absent
// has no value (NULL).
using Row = std::map<std::string, Datum>;

// SQL name of the type: bigint, text, boolean, timestamptz
std::string to_string(Type type);

absl::StatusOr<Type> from_string(const std::string& type_name);

// Whether the datum can be stored in a column of the type.
bool matches(const Datum& datum, Type type);

// Human readable value, for logs and error messages.
std::string debug_string(const Datum& datum);

}  // namespace didpoop::type

// Datum is a std::variant, ADL would not find a to_json next to it.
namespace nlohmann {

template <>
struct adl_serializer<didpoop::type::Datum> {
    static void to_json(json& j, const didpoop::type::Datum& datum) {
        std::visit([&j](const auto& v) { j = v; }, datum);
    }
};

}  // namespace nlohmann
