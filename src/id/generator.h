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

#include "src/id/clock.h"

namespace flake::id {

// Generates unique, time ordered 64-bit ids for one (worker, datacenter)
// pair. See src/id/layout.h for the bit layout.
//
// Thread-safe. Ids from one instance are strictly increasing as long as the
// clock does not move backward.
class Generator {
   private:
    const int64_t worker_id_;
    const int64_t datacenter_id_;

    // not owned
    Clock* clock_;

    // guards last_timestamp_ and sequence_
    std::mutex mutex_;

    // -1 until the first id is generated
    int64_t last_timestamp_ = -1;
    int64_t sequence_ = 0;

    Generator(int64_t worker_id, int64_t datacenter_id, Clock* clock);

    // Spin until the clock passes last_timestamp_.
    //
    // NB: Caller must hold mutex_.
    int64_t til_next_millis();

   public:
    Generator(const Generator&) = delete;
    void operator=(const Generator&) = delete;

    // Fails with an InvalidConfiguration status (see src/id/errors.h) if
    // worker_id or datacenter_id is outside [0, 31].
    //
    // The clock must outlive the generator.
    static absl::StatusOr<std::unique_ptr<Generator>> init(
        int64_t worker_id, int64_t datacenter_id,
        Clock* clock = SystemClock::get_instance());

    // Returns the next id, or a ClockMovedBackward status if the clock is
    // behind the last generated id. A failed call leaves the generator
    // untouched.
    //
    // When 4096 ids have already been issued in the current millisecond, the
    // call blocks until the clock advances.
    absl::StatusOr<uint64_t> next_id();

    int64_t worker_id() const { return worker_id_; }

    int64_t datacenter_id() const { return datacenter_id_; }

    std::string to_string() const;
};

}  // namespace flake::id
