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

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/statusor.h"

namespace flake::config {

// Identifiers assigned to one generator instance by whoever deploys it.
//
// Example file:
//
//   {"worker_id": 3, "datacenter_id": 1}
//
// The values are not range checked here, flake::id::Generator::init does
// that.
class GeneratorConfig {
   public:
    int64_t worker_id = 0;
    int64_t datacenter_id = 0;
};

absl::StatusOr<GeneratorConfig> parse_config(const std::string& text);

absl::StatusOr<GeneratorConfig> load_config(const std::string& path);

}  // namespace flake::config
