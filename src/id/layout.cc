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
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/strings/str_format.h"

// =====================================================================
// self header
// =====================================================================

#include "src/id/layout.h"

namespace flake::id {

uint64_t compose(int64_t timestamp_ms, int64_t datacenter_id,
                 int64_t worker_id, int64_t sequence) {
    uint64_t delta = static_cast<uint64_t>(timestamp_ms - kEpochMs);
    return (delta << kTimestampShift) |
           (static_cast<uint64_t>(datacenter_id) << kDatacenterIdShift) |
           (static_cast<uint64_t>(worker_id) << kWorkerIdShift) |
           static_cast<uint64_t>(sequence);
}

IdParts decompose(uint64_t id) {
    IdParts parts{};
    parts.timestamp_ms =
        static_cast<int64_t>(id >> kTimestampShift) + kEpochMs;
    parts.datacenter_id =
        static_cast<int64_t>((id >> kDatacenterIdShift) & kDatacenterIdMask);
    parts.worker_id =
        static_cast<int64_t>((id >> kWorkerIdShift) & kWorkerIdMask);
    parts.sequence = static_cast<int64_t>(id & kSequenceMask);
    return parts;
}

std::string to_string(const IdParts& parts) {
    return absl::StrFormat(
        "timestamp_ms %d, datacenter_id %d, worker_id %d, sequence %d",
        parts.timestamp_ms, parts.datacenter_id, parts.worker_id,
        parts.sequence);
}

}  // namespace flake::id
