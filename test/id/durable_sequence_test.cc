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
#include <memory>
#include <set>
#include <string>
#include <thread>
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

#include "src/id/durable_sequence.h"
#include "src/rocks/rocks.h"
#include "test/util/test_env.h"

namespace didpoop::id {

class DurableSequenceTest : public ::testing::Test {
   protected:
    didpoop::test::TempDir dir_;

    std::unique_ptr<rocks::RocksDBWrapper> OpenDB() {
        auto db = rocks::RocksDBWrapper::Open(dir_.path(),
                                              {rocks::kSequenceFamily});
        EXPECT_TRUE(db.ok()) << db.status();
        return std::move(db).value();
    }
};

TEST_F(DurableSequenceTest, StartsAtStart) {
    auto db = OpenDB();
    auto sequence = DurableSequence::Open(db.get(), "s", 1, 10);
    ASSERT_TRUE(sequence.ok()) << sequence.status();

    EXPECT_EQ((*sequence)->Current(), 1);
    EXPECT_EQ((*sequence)->Next(), 1);
    EXPECT_EQ((*sequence)->Next(), 2);
    EXPECT_EQ((*sequence)->Current(), 3);
    EXPECT_EQ((*sequence)->Reserved(), 11);

    std::string mark;
    ASSERT_TRUE(db->Get(rocks::kSequenceFamily, "s", &mark).ok());
    EXPECT_EQ(mark, "11");
}

TEST_F(DurableSequenceTest, NoReuseAfterRestart) {
    std::set<int64_t> seen;
    {
        auto db = OpenDB();
        auto sequence = DurableSequence::Open(db.get(), "s", 1, 4);
        ASSERT_TRUE(sequence.ok()) << sequence.status();
        for (int i = 0; i < 10; i++) {
            seen.insert((*sequence)->Next());
        }
    }

    auto db = OpenDB();
    auto sequence = DurableSequence::Open(db.get(), "s", 1, 4);
    ASSERT_TRUE(sequence.ok()) << sequence.status();

    int64_t first = (*sequence)->Next();
    EXPECT_EQ(seen.count(first), 0);
    EXPECT_GT(first, *seen.rbegin());
    // at most one block is skipped
    EXPECT_LE(first - *seen.rbegin(), 4 + 1);
}

TEST_F(DurableSequenceTest, CacheOfOne) {
    auto db = OpenDB();
    {
        auto sequence = DurableSequence::Open(db.get(), "s", 100, 1);
        ASSERT_TRUE(sequence.ok()) << sequence.status();
        EXPECT_EQ((*sequence)->Next(), 100);
        EXPECT_EQ((*sequence)->Next(), 101);
        EXPECT_EQ((*sequence)->Reserved(), 102);
    }
    auto sequence = DurableSequence::Open(db.get(), "s", 100, 1);
    ASSERT_TRUE(sequence.ok()) << sequence.status();
    EXPECT_EQ((*sequence)->Next(), 102);
}

TEST_F(DurableSequenceTest, IndependentNames) {
    auto db = OpenDB();
    auto a = DurableSequence::Open(db.get(), "a", 1, 8);
    auto b = DurableSequence::Open(db.get(), "b", 1000, 8);
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());

    EXPECT_EQ((*a)->Next(), 1);
    EXPECT_EQ((*b)->Next(), 1000);
    EXPECT_EQ((*a)->Next(), 2);
}

TEST_F(DurableSequenceTest, InvalidCache) {
    auto db = OpenDB();
    auto sequence = DurableSequence::Open(db.get(), "s", 1, 0);
    EXPECT_EQ(sequence.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(DurableSequenceTest, CorruptedMark) {
    auto db = OpenDB();
    ASSERT_TRUE(db->Put(rocks::kSequenceFamily, "s", "not a number").ok());

    auto sequence = DurableSequence::Open(db.get(), "s", 1, 8);
    EXPECT_EQ(sequence.status().code(), absl::StatusCode::kDataLoss);
}

TEST_F(DurableSequenceTest, ConcurrentCallers) {
    constexpr int kThreads = 8;
    constexpr int kValuesPerThread = 2000;

    auto db = OpenDB();
    auto opened = DurableSequence::Open(db.get(), "s", 1, 16);
    ASSERT_TRUE(opened.ok());
    auto& sequence = *opened.value();

    std::vector<std::vector<int64_t>> values(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; t++) {
        threads.emplace_back([&sequence, &values, t]() {
            for (int i = 0; i < kValuesPerThread; i++) {
                values[t].push_back(sequence.Next());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<int64_t> unique;
    for (const auto& per_thread : values) {
        unique.insert(per_thread.begin(), per_thread.end());
    }
    EXPECT_EQ(unique.size(), kThreads * kValuesPerThread);
    EXPECT_EQ(*unique.begin(), 1);
    EXPECT_EQ(*unique.rbegin(), kThreads * kValuesPerThread);
    EXPECT_EQ(sequence.Current(), 1 + kThreads * kValuesPerThread);
    EXPECT_GT(sequence.Reserved(), *unique.rbegin());
}

}  // namespace didpoop::id
