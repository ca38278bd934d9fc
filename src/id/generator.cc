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
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"

// spdlog
#include "spdlog/spdlog.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/id/errors.h"
#include "src/id/layout.h"

// =====================================================================
// self header
// =====================================================================

#include "src/id/generator.h"

namespace flake::id {

Generator::Generator(int64_t worker_id, int64_t datacenter_id, Clock* clock)
    : worker_id_(worker_id), datacenter_id_(datacenter_id), clock_(clock) {}

absl::StatusOr<std::unique_ptr<Generator>> Generator::init(
    int64_t worker_id, int64_t datacenter_id, Clock* clock) {
    if (worker_id > kMaxWorkerId || worker_id < 0) {
        return invalid_configuration_error("worker id", worker_id,
                                           kMaxWorkerId);
    }
    if (datacenter_id > kMaxDatacenterId || datacenter_id < 0) {
        return invalid_configuration_error("datacenter id", datacenter_id,
                                           kMaxDatacenterId);
    }
    if (clock == nullptr) {
        return absl::InvalidArgumentError("clock must not be null");
    }

    SPDLOG_INFO("id generator created: worker_id: {}, datacenter_id: {}",
                worker_id, datacenter_id);

    // the constructor is private, so std::make_unique can't be used here
    return std::unique_ptr<Generator>(
        new Generator(worker_id, datacenter_id, clock));
}

absl::StatusOr<uint64_t> Generator::next_id() {
    std::lock_guard<std::mutex> lock(this->mutex_);

    int64_t timestamp = clock_->now_ms();
    if (timestamp < last_timestamp_) {
        SPDLOG_WARN(
            "clock moved backwards: last_timestamp: {}, now: {}, deficit: {}ms",
            last_timestamp_, timestamp, last_timestamp_ - timestamp);
        return clock_moved_backward_error(last_timestamp_, timestamp);
    }

    int64_t sequence = 0;
    if (timestamp == last_timestamp_) {
        sequence = static_cast<int64_t>((sequence_ + 1) & kSequenceMask);
        if (sequence == 0) {
            SPDLOG_DEBUG("sequence exhausted at {}, waiting for next tick",
                         last_timestamp_);
            timestamp = til_next_millis();
        }
    }

    // Checked before any state changes so a failed call is side-effect free.
    int64_t delta = timestamp - kEpochMs;
    if (delta < 0 || delta > kMaxTimestampDelta) {
        SPDLOG_ERROR("timestamp {} can't be encoded in {} bits since epoch {}",
                     timestamp, kTimestampBits, kEpochMs);
        return absl::OutOfRangeError(absl::StrFormat(
            "timestamp %d is outside the representable range [%d, %d]",
            timestamp, kEpochMs, kEpochMs + kMaxTimestampDelta));
    }

    sequence_ = sequence;
    last_timestamp_ = timestamp;

    return compose(timestamp, datacenter_id_, worker_id_, sequence_);
}

int64_t Generator::til_next_millis() {
    int64_t timestamp = clock_->now_ms();
    while (timestamp <= last_timestamp_) {
        timestamp = clock_->now_ms();
    }
    return timestamp;
}

std::string Generator::to_string() const {
    return absl::StrFormat(
        "timestamp left shift %d, datacenter id bits %d, worker id bits %d, "
        "sequence bits %d, worker id %d, datacenter id %d",
        kTimestampShift, kDatacenterIdBits, kWorkerIdBits, kSequenceBits,
        worker_id_, datacenter_id_);
}

}  // namespace flake::id
