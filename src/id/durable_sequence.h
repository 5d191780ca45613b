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
#include <memory>
#include <mutex>
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/statusor.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/id/sequence.h"
#include "src/rocks/rocks.h"

namespace didpoop::id {

// A sequence that survives restarts.
//
// Values are reserved in blocks of `cache`: before a value of a new block is
// handed out, the end of the block (the mark) is written to the sequence
// column family with a synced write. A restarted sequence resumes at the
// stored mark, so values are never handed out twice; up to `cache` values
// are skipped.
//
// Next() throws std::runtime_error if the mark cannot be written.
class DurableSequence : public Sequence {
   private:
    DurableSequence(rocks::RocksDBWrapper* db, std::string name,
                    int64_t first, int64_t cache);

   public:
    static absl::StatusOr<std::unique_ptr<DurableSequence>> Open(
        rocks::RocksDBWrapper* db, const std::string& name, int64_t start,
        int64_t cache);

    ~DurableSequence() override = default;

    int64_t Next() override;

    int64_t Current() const override;

    // The persisted mark, every value below it may have been handed out.
    int64_t Reserved() const;

   private:
    rocks::RocksDBWrapper* db_;
    std::string name_;
    int64_t cache_;

    std::atomic<int64_t> next_;
    std::atomic<int64_t> limit_;

    std::mutex reserve_mutex_;

    void Reserve(int64_t value);
};

}  // namespace didpoop::id
