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
#include <set>
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

#include "src/id/clock.h"
#include "src/id/generator.h"
#include "src/id/sequence.h"

namespace didpoop::id {

TEST(SequenceTest, StartsAtOne) {
    AtomicSequence sequence;
    EXPECT_EQ(sequence.Current(), 1);
    EXPECT_EQ(sequence.Next(), 1);
    EXPECT_EQ(sequence.Next(), 2);
    EXPECT_EQ(sequence.Current(), 3);
}

TEST(GeneratorTest, KnownValues) {
    ManualClock clock(kEpochMillis + 5000);
    AtomicSequence sequence(0);
    Generator generator(clock, sequence);

    EXPECT_EQ(generator.NextId(), 5242880000);
    EXPECT_EQ(generator.NextId(), 5242880001);
}

TEST(GeneratorTest, SequenceWrapsToZero) {
    ManualClock clock(kEpochMillis + 5000);
    AtomicSequence sequence(kSequenceModulus);
    Generator generator(clock, sequence);

    int64_t id = generator.NextId();
    EXPECT_EQ(id & kSequenceMask, 0);
    EXPECT_EQ(id, 5242880000);
}

TEST(GeneratorTest, CollisionAfterFullWindow) {
    ManualClock clock(kEpochMillis + 1);
    AtomicSequence sequence(0);
    Generator generator(clock, sequence);

    int64_t first = generator.NextId();
    int64_t prev = first;
    for (int64_t i = 1; i < kSequenceModulus; i++) {
        int64_t id = generator.NextId();
        ASSERT_GT(id, prev);
        prev = id;
    }
    int64_t last = generator.NextId();
    EXPECT_EQ(last, first);
    EXPECT_EQ(sequence.Current(), kSequenceModulus + 1);
}

TEST(GeneratorTest, IncreasingAcrossMilliseconds) {
    ManualClock clock(kEpochMillis + 1000);
    AtomicSequence sequence;
    Generator generator(clock, sequence);

    int64_t prev = generator.NextId();
    for (int i = 0; i < 1000; i++) {
        clock.AdvanceMillis(1);
        int64_t id = generator.NextId();
        ASSERT_GT(id, prev);
        prev = id;
    }
}

TEST(GeneratorTest, Decompose) {
    ManualClock clock(kEpochMillis + 123456789);
    AtomicSequence sequence(777);
    Generator generator(clock, sequence);

    auto parts = Decompose(generator.NextId());
    EXPECT_EQ(parts.timestamp_millis, kEpochMillis + 123456789);
    EXPECT_EQ(parts.sequence, 777);

    // the sequence field is the counter modulo 2^20
    AtomicSequence wrapped(3 * kSequenceModulus + 5);
    Generator wrapped_generator(clock, wrapped);
    EXPECT_EQ(Decompose(wrapped_generator.NextId()).sequence, 5);
}

TEST(GeneratorTest, ComposeDecompose) {
    int64_t id = Compose(5000, 42);
    EXPECT_EQ(id, (int64_t{5000} << 20) | 42);
    auto parts = Decompose(id);
    EXPECT_EQ(parts.timestamp_millis, kEpochMillis + 5000);
    EXPECT_EQ(parts.sequence, 42);

    // sequence values beyond 20 bits are masked
    EXPECT_EQ(Compose(5000, kSequenceModulus + 42), id);
}

TEST(GeneratorTest, ConcurrentCallers) {
    constexpr int kThreads = 8;
    constexpr int kIdsPerThread = 10000;

    ManualClock clock(kEpochMillis + 42);
    AtomicSequence sequence;
    Generator generator(clock, sequence);

    std::vector<std::vector<int64_t>> ids(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; t++) {
        threads.emplace_back([&generator, &ids, t]() {
            for (int i = 0; i < kIdsPerThread; i++) {
                ids[t].push_back(generator.NextId());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(sequence.Current(), 1 + kThreads * kIdsPerThread);

    // fewer than 2^20 ids in one millisecond never collide
    std::set<int64_t> unique;
    for (const auto& per_thread : ids) {
        unique.insert(per_thread.begin(), per_thread.end());
    }
    EXPECT_EQ(unique.size(), kThreads * kIdsPerThread);
}

TEST(GeneratorTest, CompatibleModeFollowsClockBackwards) {
    ManualClock clock(kEpochMillis + 5000);
    AtomicSequence sequence(0);
    Generator generator(clock, sequence);

    int64_t before = generator.NextId();
    clock.SetMillis(kEpochMillis + 4000);
    int64_t after = generator.NextId();
    EXPECT_LT(after, before);
}

TEST(GeneratorTest, CompatibleModeBeforeEpoch) {
    ManualClock clock(kEpochMillis - 1);
    AtomicSequence sequence(0);
    Generator generator(clock, sequence);

    EXPECT_LT(generator.NextId(), 0);
}

TEST(StrictGeneratorTest, SameAsCompatible) {
    ManualClock clock(kEpochMillis + 5000);
    AtomicSequence sequence(0);
    Generator generator(clock, sequence);

    auto id = generator.NextIdChecked();
    ASSERT_TRUE(id.ok()) << id.status();
    EXPECT_EQ(id.value(), 5242880000);
}

TEST(StrictGeneratorTest, ClockRegression) {
    ManualClock clock(kEpochMillis + 5000);
    AtomicSequence sequence;
    Generator generator(clock, sequence);

    ASSERT_TRUE(generator.NextIdChecked().ok());
    clock.SetMillis(kEpochMillis + 4999);

    auto id = generator.NextIdChecked();
    EXPECT_EQ(id.status().code(), absl::StatusCode::kFailedPrecondition);
    // the counter advanced anyway
    EXPECT_EQ(sequence.Current(), 3);

    clock.SetMillis(kEpochMillis + 5001);
    EXPECT_TRUE(generator.NextIdChecked().ok());
}

TEST(StrictGeneratorTest, Exhaustion) {
    ManualClock clock(kEpochMillis + 5000);
    AtomicSequence sequence(0);
    Generator generator(clock, sequence);

    for (int64_t i = 0; i < kSequenceModulus; i++) {
        auto id = generator.NextIdChecked();
        ASSERT_TRUE(id.ok()) << id.status();
    }
    auto id = generator.NextIdChecked();
    EXPECT_EQ(id.status().code(), absl::StatusCode::kResourceExhausted);
    EXPECT_EQ(sequence.Current(), kSequenceModulus + 1);

    // a new millisecond opens a new window
    clock.AdvanceMillis(1);
    EXPECT_TRUE(generator.NextIdChecked().ok());
}

TEST(StrictGeneratorTest, OutOfRange) {
    ManualClock clock(kEpochMillis - 1);
    AtomicSequence sequence;
    Generator generator(clock, sequence);

    EXPECT_EQ(generator.NextIdChecked().status().code(),
              absl::StatusCode::kOutOfRange);

    // a pre-epoch reading is left behind by the first valid one
    clock.SetMillis(kEpochMillis);
    EXPECT_TRUE(generator.NextIdChecked().ok());

    clock.SetMillis(kEpochMillis + kMaxDeltaMillis + 1);
    EXPECT_EQ(generator.NextIdChecked().status().code(),
              absl::StatusCode::kOutOfRange);

    clock.SetMillis(kEpochMillis + kMaxDeltaMillis);
    // going back from the overflow is a regression
    EXPECT_EQ(generator.NextIdChecked().status().code(),
              absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(sequence.Current(), 5);

    // a fresh generator recovers
    Generator fresh(clock, sequence);
    EXPECT_TRUE(fresh.NextIdChecked().ok());
}

TEST(StrictGeneratorTest, LargestId) {
    ManualClock clock(kEpochMillis + kMaxDeltaMillis);
    AtomicSequence sequence(kSequenceMask);
    Generator generator(clock, sequence);

    auto id = generator.NextIdChecked();
    ASSERT_TRUE(id.ok()) << id.status();
    EXPECT_EQ(id.value(), std::numeric_limits<int64_t>::max());
}

}  // namespace didpoop::id
