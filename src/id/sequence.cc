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

#include <atomic>
#include <cstdint>

// =====================================================================
// self header
// =====================================================================

#include "src/id/sequence.h"

namespace didpoop::id {

AtomicSequence::AtomicSequence() : next_{1} {}

AtomicSequence::AtomicSequence(int64_t start) : next_{start} {}

int64_t AtomicSequence::Next() {
    // uniqueness is all we need, no ordering with other memory
    return next_.fetch_add(1, std::memory_order_relaxed);
}

int64_t AtomicSequence::Current() const {
    return next_.load(std::memory_order_relaxed);
}

}  // namespace didpoop::id
