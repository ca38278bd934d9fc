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
#include <optional>
#include <string_view>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"

namespace flake::id {

// Payload type urls. absl status codes are shared with unrelated errors, the
// payload is what identifies the error kind.
constexpr std::string_view kInvalidConfigurationPayloadUrl =
    "type.flake/invalid_configuration";
constexpr std::string_view kClockRegressionPayloadUrl =
    "type.flake/clock_moved_backward";

// Details of a rejected clock read.
struct ClockRegression {
    // The timestamp of the last successful generation.
    int64_t last_timestamp_ms;

    // How far the clock is behind last_timestamp_ms.
    int64_t deficit_ms;
};

// InvalidConfiguration: an identifier is outside [0, max_value].
//
// Reported as absl::StatusCode::kInvalidArgument.
absl::Status invalid_configuration_error(std::string_view field,
                                         int64_t value, int64_t max_value);

// ClockMovedBackward: the clock returned a value earlier than the last
// recorded timestamp.
//
// Reported as absl::StatusCode::kUnavailable since the caller may retry once
// the clock has caught up.
absl::Status clock_moved_backward_error(int64_t last_timestamp_ms,
                                        int64_t now_ms);

bool is_invalid_configuration(const absl::Status& status);

bool is_clock_moved_backward(const absl::Status& status);

// Returns the regression details carried by a ClockMovedBackward status, or
// std::nullopt for any other status.
std::optional<ClockRegression> get_clock_regression(
    const absl::Status& status);

}  // namespace flake::id
