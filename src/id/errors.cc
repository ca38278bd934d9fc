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
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"

// =====================================================================
// self header
// =====================================================================

#include "src/id/errors.h"

namespace flake::id {

absl::Status invalid_configuration_error(std::string_view field,
                                         int64_t value, int64_t max_value) {
    absl::Status status = absl::InvalidArgumentError(absl::StrFormat(
        "%s can't be greater than %d or less than 0, got %d", field,
        max_value, value));
    status.SetPayload(kInvalidConfigurationPayloadUrl, absl::Cord(field));
    return status;
}

absl::Status clock_moved_backward_error(int64_t last_timestamp_ms,
                                        int64_t now_ms) {
    int64_t deficit_ms = last_timestamp_ms - now_ms;
    absl::Status status = absl::UnavailableError(absl::StrFormat(
        "clock moved backwards. Rejecting requests until %d. Refusing to "
        "generate id for %d milliseconds",
        last_timestamp_ms, deficit_ms));

    // payload format: <last_timestamp_ms>,<deficit_ms>
    status.SetPayload(kClockRegressionPayloadUrl,
                      absl::Cord(absl::StrCat(last_timestamp_ms, ",",
                                              deficit_ms)));
    return status;
}

bool is_invalid_configuration(const absl::Status& status) {
    return absl::IsInvalidArgument(status) &&
           status.GetPayload(kInvalidConfigurationPayloadUrl).has_value();
}

bool is_clock_moved_backward(const absl::Status& status) {
    return absl::IsUnavailable(status) &&
           status.GetPayload(kClockRegressionPayloadUrl).has_value();
}

std::optional<ClockRegression> get_clock_regression(
    const absl::Status& status) {
    if (!absl::IsUnavailable(status)) {
        return std::nullopt;
    }

    auto payload = status.GetPayload(kClockRegressionPayloadUrl);
    if (!payload.has_value()) {
        return std::nullopt;
    }

    std::vector<std::string> fields =
        absl::StrSplit(std::string(payload.value()), ',');
    if (fields.size() != 2) {
        return std::nullopt;
    }

    ClockRegression regression{};
    if (!absl::SimpleAtoi(fields[0], &regression.last_timestamp_ms) ||
        !absl::SimpleAtoi(fields[1], &regression.deficit_ms)) {
        return std::nullopt;
    }
    return regression;
}

}  // namespace flake::id
