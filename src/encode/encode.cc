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

#include <cstdint>
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/strings/escaping.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

// =====================================================================
// self header
// =====================================================================

#include "src/encode/encode.h"

namespace didpoop::encode {

std::string encode(const didpoop::type::Datum& datum) {
    if (std::holds_alternative<int64_t>(datum)) {
        return std::to_string(std::get<int64_t>(datum));
    } else if (std::holds_alternative<bool>(datum)) {
        return std::get<bool>(datum) ? "true" : "false";
    }
    return std::get<std::string>(datum);
}

absl::StatusOr<didpoop::type::Datum> decode(const std::string& str,
                                            didpoop::type::Type type) {
    switch (type) {
        case didpoop::type::Type::Int64:
        case didpoop::type::Type::Timestamp: {
            int64_t value = 0;
            if (!absl::SimpleAtoi(str, &value)) {
                return absl::DataLossError("not an int64: " + str);
            }
            return didpoop::type::Datum(value);
        }
        case didpoop::type::Type::String:
            return didpoop::type::Datum(str);
        case didpoop::type::Type::Bool: {
            if (str == "true") {
                return didpoop::type::Datum(true);
            } else if (str == "false") {
                return didpoop::type::Datum(false);
            }
            return absl::DataLossError("not a boolean: " + str);
        }
        default:
            return absl::InternalError("unsupported type for decoding");
    }
}

std::string encode_key(const didpoop::type::Datum& datum) {
    if (std::holds_alternative<int64_t>(datum)) {
        // flip the sign bit so negative numbers sort first, fixed width hex
        // keeps the byte order equal to the numeric order
        uint64_t flipped =
            static_cast<uint64_t>(std::get<int64_t>(datum)) ^ (1ULL << 63);
        return absl::StrFormat("%016x", flipped);
    } else if (std::holds_alternative<bool>(datum)) {
        return std::get<bool>(datum) ? "1" : "0";
    }
    return absl::BytesToHexString(std::get<std::string>(datum));
}

std::string table_prefix(const std::string& table) {
    return absl::StrCat("r/", table, "/");
}

std::string row_prefix(const std::string& table, const std::string& pk_key) {
    return absl::StrCat("r/", table, "/", pk_key, "/");
}

std::string row_key(const std::string& table, const std::string& pk_key,
                    const std::string& column) {
    return absl::StrCat("r/", table, "/", pk_key, "/", column);
}

std::string index_prefix(const std::string& table, const std::string& index,
                         const std::string& value_key) {
    return absl::StrCat("i/", table, "/", index, "/", value_key, "/");
}

std::string index_key(const std::string& table, const std::string& index,
                      const std::string& value_key, const std::string& pk_key) {
    return absl::StrCat("i/", table, "/", index, "/", value_key, "/", pk_key);
}

std::string unique_key(const std::string& table, const std::string& column,
                       const std::string& value_key) {
    return absl::StrCat("u/", table, "/", column, "/", value_key);
}

}  // namespace didpoop::encode
