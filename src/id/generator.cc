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
#include <mutex>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"

// spdlog
#include "spdlog/spdlog.h"

// =====================================================================
// self header
// =====================================================================

#include "src/id/generator.h"

namespace didpoop::id {

int64_t Compose(int64_t delta_millis, int64_t sequence) {
    // shift as unsigned, a negative delta is not UB but still a broken id
    uint64_t high = static_cast<uint64_t>(delta_millis) << kSequenceBits;
    uint64_t low = static_cast<uint64_t>(sequence & kSequenceMask);
    return static_cast<int64_t>(high | low);
}

IdParts Decompose(int64_t id) {
    return IdParts{
        .timestamp_millis = (id >> kSequenceBits) + kEpochMillis,
        .sequence = id & kSequenceMask,
    };
}

Generator::Generator(const Clock& clock, Sequence& sequence)
    : clock_(clock), sequence_(sequence) {}

int64_t Generator::NextId() {
    int64_t seq_id = sequence_.Next() & kSequenceMask;
    int64_t now_millis = clock_.NowMillis();
    return Compose(now_millis - kEpochMillis, seq_id);
}

absl::StatusOr<int64_t> Generator::NextIdChecked() {
    std::lock_guard<std::mutex> lock(strict_mutex_);

    int64_t seq_id = sequence_.Next() & kSequenceMask;
    int64_t now_millis = clock_.NowMillis();

    if (now_millis < last_millis_) {
        SPDLOG_WARN("clock moved backwards by {} ms", last_millis_ - now_millis);
        return absl::FailedPreconditionError(
            absl::StrFormat("clock regression: now %d < last observed %d",
                            now_millis, last_millis_));
    }

    if (now_millis == last_millis_) {
        window_count_++;
    } else {
        last_millis_ = now_millis;
        window_count_ = 1;
    }

    if (window_count_ > kSequenceModulus) {
        return absl::ResourceExhaustedError(absl::StrFormat(
            "sequence exhausted: more than %d ids in millisecond %d",
            kSequenceModulus, now_millis));
    }

    int64_t delta = now_millis - kEpochMillis;
    if (delta < 0 || delta > kMaxDeltaMillis) {
        return absl::OutOfRangeError(absl::StrFormat(
            "timestamp %d is outside the id range of epoch %d", now_millis,
            kEpochMillis));
    }

    return Compose(delta, seq_id);
}

}  // namespace didpoop::id
