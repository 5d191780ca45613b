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
#include <memory>
#include <string>

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

#include "src/catalog/catalog.h"
#include "src/rocks/rocks.h"
#include "src/schema/schema.h"
#include "src/type/type.h"

namespace didpoop::test {

class DidpoopEnvironment : public ::testing::Environment {
   public:
    ~DidpoopEnvironment() override {}

    void SetUp() override;

    void TearDown() override;
};

// A fresh directory under the system temp directory, removed with all its
// content on destruction.
class TempDir {
   public:
    TempDir();
    ~TempDir();

    // copy blocker
    TempDir(const TempDir&) = delete;

    // assignment blocker
    void operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }

   private:
    std::string path_;
};

// A fresh store holding the application tables, for tests of the row
// operations.
class StoreTest : public ::testing::Test {
   protected:
    // fixed "now" of every write
    static constexpr int64_t kNow = 1700000000000;

    void SetUp() override;

    const didpoop::schema::Table& table(const std::string& name) const;

    // inserts the row in a transaction of its own
    absl::Status Insert(const std::string& table_name, didpoop::type::Row row);

    TempDir dir_;
    std::unique_ptr<didpoop::rocks::RocksDBWrapper> db_;
    std::unique_ptr<didpoop::catalog::Catalog> catalog_;
};

}  // namespace didpoop::test
