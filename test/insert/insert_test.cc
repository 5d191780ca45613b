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
#include "absl/status/status.h"

// gtest
#include "gtest/gtest.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/insert/insert.h"
#include "src/query/query.h"
#include "src/schema/tables.h"
#include "test/util/test_env.h"

namespace didpoop::insert {

using didpoop::schema::kCreatures;
using didpoop::schema::kPoops;
using didpoop::schema::kUsers;
using didpoop::type::Row;

class InsertTest : public didpoop::test::StoreTest {
   protected:
    Row User(int64_t id, const std::string& email) {
        return {
            {"id", id},
            {"email", email},
            {"name", std::string("n")},
            {"pw_salt", std::string("00")},
            {"pw_hash", std::string("ff")},
        };
    }
};

TEST_F(InsertTest, Defaults) {
    ASSERT_TRUE(Insert(kUsers, User(1, "a@b.c")).ok());

    auto row = didpoop::query::get(*db_, table(kUsers), int64_t{1});
    ASSERT_TRUE(row.ok()) << row.status();
    EXPECT_EQ(std::get<std::string>(row->at("email")), "a@b.c");
    EXPECT_EQ(std::get<bool>(row->at("deleted")), false);
    EXPECT_EQ(std::get<int64_t>(row->at("created")), kNow);
    EXPECT_EQ(std::get<int64_t>(row->at("modified")), kNow);
}

TEST_F(InsertTest, MissingPrimaryKey) {
    auto row = User(1, "a@b.c");
    row.erase("id");
    EXPECT_EQ(Insert(kUsers, row).code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(InsertTest, DuplicatePrimaryKey) {
    ASSERT_TRUE(Insert(kUsers, User(1, "a@b.c")).ok());
    EXPECT_EQ(Insert(kUsers, User(1, "d@e.f")).code(),
              absl::StatusCode::kAlreadyExists);
}

TEST_F(InsertTest, DuplicateUniqueValue) {
    ASSERT_TRUE(Insert(kUsers, User(1, "a@b.c")).ok());
    EXPECT_EQ(Insert(kUsers, User(2, "a@b.c")).code(),
              absl::StatusCode::kAlreadyExists);

    auto exists = didpoop::query::exists(*db_, table(kUsers), int64_t{2});
    ASSERT_TRUE(exists.ok());
    EXPECT_FALSE(exists.value());
}

TEST_F(InsertTest, NotNull) {
    auto row = User(1, "a@b.c");
    row.erase("name");
    EXPECT_EQ(Insert(kUsers, row).code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(InsertTest, WrongType) {
    auto row = User(1, "a@b.c");
    row["name"] = int64_t{5};
    EXPECT_EQ(Insert(kUsers, row).code(), absl::StatusCode::kInvalidArgument);

    row = User(1, "a@b.c");
    row["age"] = int64_t{5};
    EXPECT_EQ(Insert(kUsers, row).code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(InsertTest, ForeignKey) {
    Row creature = {
        {"id", int64_t{10}},
        {"creator_id", int64_t{1}},
        {"name", std::string("rex")},
    };
    EXPECT_EQ(Insert(kCreatures, creature).code(),
              absl::StatusCode::kFailedPrecondition);

    ASSERT_TRUE(Insert(kUsers, User(1, "a@b.c")).ok());
    EXPECT_TRUE(Insert(kCreatures, creature).ok());

    Row poop = {
        {"id", int64_t{20}},
        {"creator_id", int64_t{1}},
        {"creature_id", int64_t{11}},
    };
    EXPECT_EQ(Insert(kPoops, poop).code(),
              absl::StatusCode::kFailedPrecondition);
}

TEST_F(InsertTest, ForeignKeyToText) {
    ASSERT_TRUE(Insert(kUsers, User(1, "a@b.c")).ok());
    ASSERT_TRUE(Insert(kCreatures, {{"id", int64_t{10}},
                                    {"creator_id", int64_t{1}},
                                    {"name", std::string("rex")}})
                    .ok());

    Row access = {
        {"id", int64_t{30}},
        {"creature_id", int64_t{10}},
        {"user_id", int64_t{1}},
        {"creator_id", int64_t{1}},
        {"kind", std::string("owner")},
    };
    EXPECT_EQ(Insert(didpoop::schema::kCreatureAccess, access).code(),
              absl::StatusCode::kFailedPrecondition);

    access["kind"] = std::string("pooper");
    EXPECT_TRUE(Insert(didpoop::schema::kCreatureAccess, access).ok());
}

TEST_F(InsertTest, SeesOwnWrites) {
    auto txn = db_->Begin();
    ASSERT_TRUE(insert(*txn, *catalog_, table(kUsers), User(1, "a@b.c"), kNow)
                    .ok());
    // the creature references a user that only exists in the transaction
    ASSERT_TRUE(insert(*txn, *catalog_, table(kCreatures),
                       {{"id", int64_t{10}},
                        {"creator_id", int64_t{1}},
                        {"name", std::string("rex")}},
                       kNow)
                    .ok());
    // a duplicate inside the same transaction
    EXPECT_EQ(
        insert(*txn, *catalog_, table(kUsers), User(2, "a@b.c"), kNow).code(),
        absl::StatusCode::kAlreadyExists);

    auto outside = didpoop::query::exists(*db_, table(kUsers), int64_t{1});
    ASSERT_TRUE(outside.ok());
    EXPECT_FALSE(outside.value());

    ASSERT_TRUE(txn->Commit().ok());
    EXPECT_EQ(txn->Commit().code(), absl::StatusCode::kFailedPrecondition);
    txn.reset();

    outside = didpoop::query::exists(*db_, table(kCreatures), int64_t{10});
    ASSERT_TRUE(outside.ok());
    EXPECT_TRUE(outside.value());
}

TEST_F(InsertTest, AbandonedTransaction) {
    {
        auto txn = db_->Begin();
        ASSERT_TRUE(
            insert(*txn, *catalog_, table(kUsers), User(1, "a@b.c"), kNow)
                .ok());
    }
    auto exists = didpoop::query::exists(*db_, table(kUsers), int64_t{1});
    ASSERT_TRUE(exists.ok());
    EXPECT_FALSE(exists.value());
    EXPECT_TRUE(Insert(kUsers, User(1, "a@b.c")).ok());
}

TEST_F(InsertTest, Lookups) {
    ASSERT_TRUE(Insert(kUsers, User(2, "b@x")).ok());
    ASSERT_TRUE(Insert(kUsers, User(1, "a@x")).ok());

    auto owner = didpoop::query::lookup_unique(*db_, table(kUsers), "email",
                                               std::string("b@x"));
    ASSERT_TRUE(owner.ok());
    ASSERT_TRUE(owner->has_value());
    EXPECT_EQ(std::get<int64_t>(owner->value()), 2);

    owner = didpoop::query::lookup_unique(*db_, table(kUsers), "email",
                                          std::string("c@x"));
    ASSERT_TRUE(owner.ok());
    EXPECT_FALSE(owner->has_value());

    EXPECT_EQ(didpoop::query::lookup_unique(*db_, table(kUsers), "name",
                                            std::string("n"))
                  .status()
                  .code(),
              absl::StatusCode::kInvalidArgument);

    auto rows = didpoop::query::lookup_index(*db_, table(kUsers),
                                             "users_email", std::string("a@x"));
    ASSERT_TRUE(rows.ok());
    ASSERT_EQ(rows->size(), 1);
    EXPECT_EQ(std::get<int64_t>(rows->at(0).at("id")), 1);

    EXPECT_EQ(didpoop::query::lookup_index(*db_, table(kUsers), "nope",
                                           std::string("a@x"))
                  .status()
                  .code(),
              absl::StatusCode::kNotFound);

    // scan is in primary key order
    auto all = didpoop::query::scan(*db_, table(kUsers));
    ASSERT_TRUE(all.ok());
    ASSERT_EQ(all->size(), 2);
    EXPECT_EQ(std::get<int64_t>(all->at(0).at("id")), 1);
    EXPECT_EQ(std::get<int64_t>(all->at(1).at("id")), 2);

    EXPECT_EQ(didpoop::query::get(*db_, table(kUsers), int64_t{3})
                  .status()
                  .code(),
              absl::StatusCode::kNotFound);
}

TEST_F(InsertTest, NegativeKeysSortFirst) {
    ASSERT_TRUE(Insert(kUsers, User(5, "a@x")).ok());
    ASSERT_TRUE(Insert(kUsers, User(-5, "b@x")).ok());

    auto all = didpoop::query::scan(*db_, table(kUsers));
    ASSERT_TRUE(all.ok());
    ASSERT_EQ(all->size(), 2);
    EXPECT_EQ(std::get<int64_t>(all->at(0).at("id")), -5);
}

}  // namespace didpoop::insert
