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

// Wall-clock source with millisecond resolution.
class Clock {
   public:
    virtual ~Clock() = default;

    // Milliseconds since the unix epoch.
    virtual int64_t NowMillis() const = 0;
};

class SystemClock : public Clock {
   public:
    SystemClock() = default;
    ~SystemClock() override = default;

    int64_t NowMillis() const override;
};

// A clock that only moves when told to. Safe to read from many threads while
// another thread moves it.
class ManualClock : public Clock {
   public:
    explicit ManualClock(int64_t start_millis);
    ~ManualClock() override = default;

    int64_t NowMillis() const override;

    void SetMillis(int64_t millis);

    void AdvanceMillis(int64_t delta);

   private:
    std::atomic<int64_t> now_millis_;
};

}  // namespace didpoop::id
