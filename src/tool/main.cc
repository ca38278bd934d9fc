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
#include <iostream>
#include <string>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// spdlog
#include "spdlog/spdlog.h"

// CLI11
#include "CLI/CLI.hpp"

// =====================================================================
// local libraries
// =====================================================================

#include "src/config/config.h"
#include "src/id/generator.h"
#include "src/id/layout.h"

namespace {

int run_generate(const std::string& config_path, int64_t worker_id,
                 int64_t datacenter_id, int count) {
    if (!config_path.empty()) {
        auto config = flake::config::load_config(config_path);
        if (!config.ok()) {
            SPDLOG_ERROR("failed to load config: {}",
                         config.status().ToString());
            return 1;
        }
        worker_id = config->worker_id;
        datacenter_id = config->datacenter_id;
    }

    auto generator = flake::id::Generator::init(worker_id, datacenter_id);
    if (!generator.ok()) {
        SPDLOG_ERROR("failed to create generator: {}",
                     generator.status().ToString());
        return 1;
    }

    for (int i = 0; i < count; ++i) {
        auto id = generator.value()->next_id();
        if (!id.ok()) {
            SPDLOG_ERROR("failed to generate id: {}", id.status().ToString());
            return 1;
        }
        std::cout << id.value() << std::endl;
    }
    return 0;
}

int run_decode(const std::vector<uint64_t>& ids) {
    for (uint64_t id : ids) {
        std::cout << id << ": "
                  << flake::id::to_string(flake::id::decompose(id))
                  << std::endl;
    }
    return 0;
}

int run_describe(int64_t worker_id, int64_t datacenter_id) {
    auto generator = flake::id::Generator::init(worker_id, datacenter_id);
    if (!generator.ok()) {
        SPDLOG_ERROR("failed to create generator: {}",
                     generator.status().ToString());
        return 1;
    }
    std::cout << generator.value()->to_string() << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%@] %v");

    CLI::App app{"flake"};
    app.require_subcommand(1);

    std::string log_level = "warn";
    app.add_option("--log-level", log_level,
                   "trace, debug, info, warn, err, critical or off")
        ->check(CLI::IsMember(
            {"trace", "debug", "info", "warn", "err", "critical", "off"}));

    // generate
    auto* generate = app.add_subcommand("generate", "Generate ids");

    std::string config_path;
    auto* config_opt = generate->add_option(
        "--config", config_path, "JSON file with worker_id and datacenter_id");
    config_opt->check(CLI::ExistingFile);

    int64_t worker_id = 0;
    auto* worker_opt =
        generate->add_option("--worker-id", worker_id, "Worker id")
            ->check(CLI::Range(0, static_cast<int>(flake::id::kMaxWorkerId)));

    int64_t datacenter_id = 0;
    auto* datacenter_opt =
        generate->add_option("--datacenter-id", datacenter_id, "Datacenter id")
            ->check(
                CLI::Range(0, static_cast<int>(flake::id::kMaxDatacenterId)));

    // ids come from the config file or from both flags, never defaulted
    config_opt->excludes(worker_opt);
    config_opt->excludes(datacenter_opt);
    worker_opt->needs(datacenter_opt);
    datacenter_opt->needs(worker_opt);

    int count = 1;
    generate->add_option("-n,--count", count, "Number of ids to generate")
        ->check(CLI::PositiveNumber);

    // decode
    auto* decode = app.add_subcommand("decode", "Decode ids into fields");

    std::vector<uint64_t> ids;
    decode->add_option("ids", ids, "Ids to decode")->required();

    // describe
    auto* describe =
        app.add_subcommand("describe", "Print the id layout of a generator");

    int64_t describe_worker_id = 0;
    describe->add_option("--worker-id", describe_worker_id, "Worker id")
        ->required();

    int64_t describe_datacenter_id = 0;
    describe->add_option("--datacenter-id", describe_datacenter_id,
                         "Datacenter id")
        ->required();

    try {
        app.parse(argc, argv);

        if (generate->parsed() && config_opt->count() == 0 &&
            worker_opt->count() == 0) {
            throw CLI::RequiredError("--config or --worker-id/--datacenter-id");
        }
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    spdlog::set_level(spdlog::level::from_str(log_level));

    if (generate->parsed()) {
        return run_generate(config_path, worker_id, datacenter_id, count);
    }
    if (decode->parsed()) {
        return run_decode(ids);
    }
    if (describe->parsed()) {
        return run_describe(describe_worker_id, describe_datacenter_id);
    }
    return 0;
}
