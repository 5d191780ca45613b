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

#include <chrono>
#include <cstdint>

// =====================================================================
// self header
// =====================================================================

#include "src/id/clock.h"

namespace didpoop::id {

int64_t SystemClock::NowMillis() const {
    // floor, the same as floor(extract(epoch from clock_timestamp()) * 1000)
    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    return now.time_since_epoch().count();
}

ManualClock::ManualClock(int64_t start_millis) : now_millis_{start_millis} {}

int64_t ManualClock::NowMillis() const {
    return now_millis_.load(std::memory_order_acquire);
}

void ManualClock::SetMillis(int64_t millis) {
    now_millis_.store(millis, std::memory_order_release);
}

void ManualClock::AdvanceMillis(int64_t delta) {
    now_millis_.fetch_add(delta, std::memory_order_acq_rel);
}

}  // namespace didpoop::id
