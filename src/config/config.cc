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
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"

// json
#include "nlohmann/json.hpp"

// spdlog
#include "spdlog/spdlog.h"

// =====================================================================
// self header
// =====================================================================

#include "src/config/config.h"

namespace flake::config {

void to_json(nlohmann::json& j, const GeneratorConfig& config) {
    j = nlohmann::json{
        {"worker_id", config.worker_id},
        {"datacenter_id", config.datacenter_id},
    };
}

void from_json(const nlohmann::json& j, GeneratorConfig& config) {
    j.at("worker_id").get_to(config.worker_id);
    j.at("datacenter_id").get_to(config.datacenter_id);
}

absl::StatusOr<GeneratorConfig> parse_config(const std::string& text) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return absl::InvalidArgumentError("config is not valid json");
    }
    if (!j.is_object()) {
        return absl::InvalidArgumentError("config must be a json object");
    }

    // get_to would silently convert floats and booleans
    for (const char* key : {"worker_id", "datacenter_id"}) {
        if (!j.contains(key)) {
            return absl::InvalidArgumentError(
                absl::StrFormat("config is missing \"%s\"", key));
        }
        if (!j.at(key).is_number_integer()) {
            return absl::InvalidArgumentError(
                absl::StrFormat("config field \"%s\" must be an integer", key));
        }
        // get_to(int64_t) would wrap these to negative values
        if (j.at(key).is_number_unsigned() &&
            j.at(key).get<uint64_t>() >
                static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return absl::InvalidArgumentError(
                absl::StrFormat("config field \"%s\" is too large", key));
        }
    }

    return j.get<GeneratorConfig>();
}

absl::StatusOr<GeneratorConfig> load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SPDLOG_ERROR("failed to open config file: {}", path);
        return absl::NotFoundError(
            absl::StrFormat("can't open config file %s", path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = parse_config(buffer.str());
    if (!config.ok()) {
        SPDLOG_ERROR("failed to parse config file {}: {}", path,
                     config.status().ToString());
        return config.status();
    }

    SPDLOG_INFO("loaded config {}: {}", path,
                nlohmann::json(config.value()).dump());
    return config;
}

}  // namespace flake::config
