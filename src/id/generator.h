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

// Layout of a generated id (64 bits, signed):
//
//   | 44 bits: millis since kEpochMillis | 20 bits: sequence % 2^20 |
//
// 44 bits of millis is ~550 years. The sequence disambiguates ids issued in
// the same millisecond, up to 2^20 of them.

#pragma once

// =====================================================================
// c++ std
// =====================================================================

#include <cstdint>
#include <limits>
#include <mutex>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/statusor.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/id/clock.h"
#include "src/id/sequence.h"

namespace didpoop::id {

// 2022-01-17 18:26:51.996 UTC. Ids are ordered relative to this instant, it
// must never change once ids have been issued.
constexpr int64_t kEpochMillis = 1642444011996;

constexpr int kSequenceBits = 20;

// 1048576
constexpr int64_t kSequenceModulus = int64_t{1} << kSequenceBits;

constexpr int64_t kSequenceMask = kSequenceModulus - 1;

// the largest delta whose composed id is still a non-negative int64
constexpr int64_t kMaxDeltaMillis = (int64_t{1} << (63 - kSequenceBits)) - 1;

class IdParts {
   public:
    int64_t timestamp_millis;
    int64_t sequence;
};

int64_t Compose(int64_t delta_millis, int64_t sequence);

IdParts Decompose(int64_t id);

enum class Mode {
    // same ids as the id_gen() SQL function, no guards
    Compatible,
    // detect clock regression, sequence exhaustion and range overflow
    Strict,
};

// Generator hands out primary keys. It borrows the clock and the sequence,
// both must outlive it.
class Generator {
   public:
    Generator(const Clock& clock, Sequence& sequence);

    // copy blocker
    Generator(const Generator&) = delete;

    // assignment blocker
    void operator=(const Generator&) = delete;

    // Lock-free. Never fails: a duplicate is returned when more than 2^20 ids
    // are requested in one millisecond, and ids go backwards with the clock.
    int64_t NextId();

    // Serialized. Errors:
    // - FailedPrecondition: the clock went backwards since the last id
    // - ResourceExhausted: more than 2^20 ids in the current millisecond
    // - OutOfRange: the clock is before the epoch or past the 43-bit range
    //
    // The sequence advances even when an error is returned. An OutOfRange
    // reading still becomes the last observed millisecond: later readings
    // before it fail with FailedPrecondition, so after a reading past the
    // 43-bit range every call fails until the generator is recreated.
    absl::StatusOr<int64_t> NextIdChecked();

   private:
    const Clock& clock_;
    Sequence& sequence_;

    std::mutex strict_mutex_;

    // guarded by strict_mutex_
    int64_t last_millis_ = std::numeric_limits<int64_t>::min();
    int64_t window_count_ = 0;
};

}  // namespace didpoop::id
