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
#include <limits>
#include <string>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"

// gtest
#include "gtest/gtest.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/encode/encode.h"
#include "src/type/type.h"

namespace didpoop::encode {

using didpoop::type::Datum;
using didpoop::type::Type;

TEST(EncodeTest, Values) {
    EXPECT_EQ(encode(Datum(int64_t{-42})), "-42");
    EXPECT_EQ(encode(Datum(std::string("abc"))), "abc");
    EXPECT_EQ(encode(Datum(true)), "true");
    EXPECT_EQ(encode(Datum(false)), "false");

    auto value = decode("5242880000", Type::Int64);
    ASSERT_TRUE(value.ok());
    EXPECT_EQ(std::get<int64_t>(value.value()), 5242880000);

    value = decode("false", Type::Bool);
    ASSERT_TRUE(value.ok());
    EXPECT_FALSE(std::get<bool>(value.value()));

    value = decode("", Type::String);
    ASSERT_TRUE(value.ok());
    EXPECT_EQ(std::get<std::string>(value.value()), "");
}

TEST(EncodeTest, CorruptedValues) {
    EXPECT_EQ(decode("12x", Type::Int64).status().code(),
              absl::StatusCode::kDataLoss);
    EXPECT_EQ(decode("", Type::Timestamp).status().code(),
              absl::StatusCode::kDataLoss);
    EXPECT_EQ(decode("yes", Type::Bool).status().code(),
              absl::StatusCode::kDataLoss);
}

TEST(EncodeTest, IntKeysKeepOrder) {
    std::vector<int64_t> values = {
        std::numeric_limits<int64_t>::min(),
        -5242880000,
        -1,
        0,
        1,
        255,
        256,
        5242880000,
        std::numeric_limits<int64_t>::max(),
    };
    for (size_t i = 1; i < values.size(); i++) {
        EXPECT_LT(encode_key(values[i - 1]), encode_key(values[i]))
            << values[i - 1] << " vs " << values[i];
    }
    EXPECT_EQ(encode_key(int64_t{0}), "8000000000000000");
    EXPECT_EQ(encode_key(int64_t{-1}), "7fffffffffffffff");
}

TEST(EncodeTest, StringKeysKeepOrder) {
    std::vector<std::string> values = {"", "a", "a/b", "ab", "b", "\xff"};
    for (size_t i = 1; i < values.size(); i++) {
        EXPECT_LT(encode_key(values[i - 1]), encode_key(values[i]));
    }
    // no separator inside a key component
    EXPECT_EQ(encode_key(std::string("a/b")).find('/'), std::string::npos);
}

TEST(EncodeTest, BoolKeys) {
    EXPECT_EQ(encode_key(false), "0");
    EXPECT_EQ(encode_key(true), "1");
}

TEST(EncodeTest, Layout) {
    auto pk = encode_key(int64_t{7});
    EXPECT_EQ(row_key("users", pk, "email"), "r/users/" + pk + "/email");
    EXPECT_EQ(row_prefix("users", pk), "r/users/" + pk + "/");
    EXPECT_EQ(table_prefix("users"), "r/users/");

    auto value = encode_key(std::string("x"));
    EXPECT_EQ(index_key("users", "users_email", value, pk),
              "i/users/users_email/78/" + pk);
    EXPECT_EQ(index_prefix("users", "users_email", value),
              "i/users/users_email/78/");
    EXPECT_EQ(unique_key("users", "email", value), "u/users/email/78");
}

}  // namespace didpoop::encode
