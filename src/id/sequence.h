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

#include <atomic>
#include <cstdint>

namespace didpoop::id {

// An atomically incrementable counter.
//
// A sequence starts at `start` (1 unless told otherwise): the first call to
// Next() returns `start`, the second `start + 1`, and so on. Every call
// performs exactly one atomic read-modify-write, so no two callers ever see
// the same value.
class Sequence {
   public:
    virtual ~Sequence() = default;

    virtual int64_t Next() = 0;

    // The value the next call to Next() will return.
    virtual int64_t Current() const = 0;
};

// In-memory sequence. Restarts from `start` with the process.
class AtomicSequence : public Sequence {
   public:
    AtomicSequence();
    explicit AtomicSequence(int64_t start);
    ~AtomicSequence() override = default;

    int64_t Next() override;

    int64_t Current() const override;

   private:
    std::atomic<int64_t> next_;
};

}  // namespace didpoop::id
