// Copyright 2025 Xiaochen Cui
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

#include <cstdint>

namespace flake::id {

// Source of wall-clock time for the generator.
class Clock {
   public:
    virtual ~Clock() = default;

    // Milliseconds since the unix epoch.
    virtual int64_t now_ms() = 0;
};

// Clock backed by std::chrono::system_clock. It may move backward when the
// system time is adjusted (e.g. by NTP).
class SystemClock final : public Clock {
   private:
    // singleton instance - constructor protector
    SystemClock();
    // singleton instance - destructor protector
    ~SystemClock() override;

   public:
    // singleton instance - copy blocker
    SystemClock(const SystemClock&) = delete;

    // singleton instance - assignment blocker
    void operator=(const SystemClock&) = delete;

    // singleton instance - get instance
    static SystemClock* get_instance();

    int64_t now_ms() override;
};

}  // namespace flake::id
