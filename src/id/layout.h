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
#include <string>

namespace flake::id {

// Layout of an id, from the most significant bit:
//
//   0 | 41 bits timestamp delta | 5 bits datacenter | 5 bits worker | 12 bits seq
//
// These values are part of the wire contract. Changing any of them changes
// the meaning of every id issued before.

// 2018-01-01T00:00:00Z in unix milliseconds.
constexpr int64_t kEpochMs = 1514736000000LL;

constexpr int kWorkerIdBits = 5;
constexpr int kDatacenterIdBits = 5;
constexpr int kSequenceBits = 12;
constexpr int kTimestampBits = 41;

constexpr int64_t kMaxWorkerId = (1LL << kWorkerIdBits) - 1;
constexpr int64_t kMaxDatacenterId = (1LL << kDatacenterIdBits) - 1;
constexpr int64_t kMaxTimestampDelta = (1LL << kTimestampBits) - 1;

constexpr uint64_t kSequenceMask = (1ULL << kSequenceBits) - 1;
constexpr uint64_t kWorkerIdMask = (1ULL << kWorkerIdBits) - 1;
constexpr uint64_t kDatacenterIdMask = (1ULL << kDatacenterIdBits) - 1;

constexpr int kWorkerIdShift = kSequenceBits;
constexpr int kDatacenterIdShift = kSequenceBits + kWorkerIdBits;
constexpr int kTimestampShift =
    kSequenceBits + kWorkerIdBits + kDatacenterIdBits;

static_assert(1 + kTimestampBits + kDatacenterIdBits + kWorkerIdBits +
                      kSequenceBits ==
                  64,
              "id layout must fill exactly 64 bits");

// Decoded fields of an id.
struct IdParts {
    // Absolute unix milliseconds, i.e. the epoch is already added back.
    int64_t timestamp_ms;
    int64_t datacenter_id;
    int64_t worker_id;
    int64_t sequence;
};

// Pack the fields into an id. The caller is responsible for passing values
// that fit their fields, the generator checks this before calling.
uint64_t compose(int64_t timestamp_ms, int64_t datacenter_id,
                 int64_t worker_id, int64_t sequence);

IdParts decompose(uint64_t id);

std::string to_string(const IdParts& parts);

}  // namespace flake::id
