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
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"

// spdlog
#include "spdlog/spdlog.h"

// =====================================================================
// self header
// =====================================================================

#include "src/id/durable_sequence.h"

namespace didpoop::id {

absl::StatusOr<std::unique_ptr<DurableSequence>> DurableSequence::Open(
    rocks::RocksDBWrapper* db, const std::string& name, int64_t start,
    int64_t cache) {
    if (cache < 1) {
        return absl::InvalidArgumentError(
            absl::StrFormat("sequence cache must be positive, got %d", cache));
    }

    int64_t first = start;

    std::string value;
    auto status = db->Get(rocks::kSequenceFamily, name, &value);
    if (status.ok()) {
        if (!absl::SimpleAtoi(value, &first)) {
            return absl::DataLossError(absl::StrFormat(
                "corrupted mark of sequence %s: %s", name, value));
        }
        SPDLOG_INFO("sequence {} resumes at {}", name, first);
    } else if (absl::IsNotFound(status)) {
        SPDLOG_INFO("sequence {} starts at {}", name, first);
    } else {
        return status;
    }

    if (cache == 1) {
        SPDLOG_WARN("sequence {} has cache 1, every value costs a synced write",
                    name);
    }

    return std::unique_ptr<DurableSequence>(
        new DurableSequence(db, name, first, cache));
}

DurableSequence::DurableSequence(rocks::RocksDBWrapper* db, std::string name,
                                 int64_t first, int64_t cache)
    : db_(db),
      name_(std::move(name)),
      cache_(cache),
      next_{first},
      limit_{first} {}

int64_t DurableSequence::Next() {
    int64_t value = next_.fetch_add(1, std::memory_order_relaxed);
    if (value < limit_.load(std::memory_order_acquire)) {
        return value;
    }
    Reserve(value);
    return value;
}

void DurableSequence::Reserve(int64_t value) {
    std::lock_guard<std::mutex> lock(reserve_mutex_);

    int64_t limit = limit_.load(std::memory_order_relaxed);
    if (value < limit) {
        // another caller reserved the block while we waited
        return;
    }

    int64_t new_limit = limit;
    while (value >= new_limit) {
        new_limit += cache_;
    }

    auto status = db_->Put(rocks::kSequenceFamily, name_,
                           std::to_string(new_limit), /*sync=*/true);
    if (!status.ok()) {
        SPDLOG_ERROR("failed to persist sequence {}: {}", name_,
                     status.ToString());
        throw std::runtime_error("failed to persist sequence " + name_ + ": " +
                                 status.ToString());
    }
    limit_.store(new_limit, std::memory_order_release);
}

int64_t DurableSequence::Current() const {
    return next_.load(std::memory_order_relaxed);
}

int64_t DurableSequence::Reserved() const {
    return limit_.load(std::memory_order_acquire);
}

}  // namespace didpoop::id
