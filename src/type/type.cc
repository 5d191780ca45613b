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

#include <stdexcept>
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// magic_enum
#include "magic_enum/magic_enum.hpp"

// =====================================================================
// self include
// =====================================================================

#include "src/type/type.h"

namespace didpoop::type {

std::string to_string(Type type) {
    switch (type) {
        case Type::Int64:
            return "bigint";
        case Type::String:
            return "text";
        case Type::Bool:
            return "boolean";
        case Type::Timestamp:
            return "timestamptz";
        default:
            throw std::runtime_error("unknown type " +
                                     std::string(magic_enum::enum_name(type)));
    }
}

absl::StatusOr<Type> from_string(const std::string& type_name) {
    if (type_name == "bigint" || type_name == "int8") {
        return Type::Int64;
    } else if (type_name == "text") {
        return Type::String;
    } else if (type_name == "boolean" || type_name == "bool") {
        return Type::Bool;
    } else if (type_name == "timestamptz") {
        return Type::Timestamp;
    } else {
        return absl::InvalidArgumentError("unknown type: " + type_name);
    }
}

bool matches(const Datum& datum, Type type) {
    switch (type) {
        case Type::Int64:
        case Type::Timestamp:
            return std::holds_alternative<int64_t>(datum);
        case Type::String:
            return std::holds_alternative<std::string>(datum);
        case Type::Bool:
            return std::holds_alternative<bool>(datum);
        default:
            return false;
    }
}

std::string debug_string(const Datum& datum) {
    if (std::holds_alternative<int64_t>(datum)) {
        return std::to_string(std::get<int64_t>(datum));
    } else if (std::holds_alternative<bool>(datum)) {
        return std::get<bool>(datum) ? "true" : "false";
    }
    return "'" + std::get<std::string>(datum) + "'";
}

}  // namespace didpoop::type
