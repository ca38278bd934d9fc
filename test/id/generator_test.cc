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
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"
#include "absl/status/statusor.h"

// gtest
#include "gtest/gtest.h"

// spdlog
#include "spdlog/sinks/ostream_sink.h"
#include "spdlog/spdlog.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/id/errors.h"
#include "src/id/generator.h"
#include "src/id/layout.h"
#include "test/util/environment.h"
#include "test/util/manual_clock.h"

using flake::id::decompose;
using flake::id::Generator;
using flake::id::IdParts;

// 2024-01-01T00:00:00Z
constexpr int64_t kNow = 1704067200000LL;

class GeneratorTest : public ::testing::Test {
   protected:
    test_util::ManualClock clock{kNow};

    std::unique_ptr<Generator> make_generator(int64_t worker_id,
                                              int64_t datacenter_id) {
        auto generator = Generator::init(worker_id, datacenter_id, &clock);
        EXPECT_TRUE(generator.ok()) << generator.status();
        return std::move(generator).value();
    }

    uint64_t next(Generator& generator) {
        auto id = generator.next_id();
        EXPECT_TRUE(id.ok()) << id.status();
        return id.value_or(0);
    }
};

TEST(GeneratorInitTest, AcceptsBoundaryIds) {
    for (auto [worker_id, datacenter_id] :
         std::vector<std::pair<int64_t, int64_t>>{{0, 0}, {31, 31}, {0, 31},
                                                  {31, 0}}) {
        auto generator = Generator::init(worker_id, datacenter_id);
        ASSERT_TRUE(generator.ok()) << generator.status();
        EXPECT_EQ(generator.value()->worker_id(), worker_id);
        EXPECT_EQ(generator.value()->datacenter_id(), datacenter_id);
    }
}

TEST(GeneratorInitTest, RejectsWorkerIdOutOfRange) {
    for (int64_t worker_id : {-1, 32, 1024}) {
        auto generator = Generator::init(worker_id, 0);
        ASSERT_FALSE(generator.ok());
        EXPECT_TRUE(flake::id::is_invalid_configuration(generator.status()));
        EXPECT_EQ(generator.status().code(),
                  absl::StatusCode::kInvalidArgument);
        EXPECT_NE(generator.status().message().find("worker id"),
                  std::string::npos)
            << generator.status();
        EXPECT_NE(generator.status().message().find("31"), std::string::npos)
            << generator.status();
    }
}

TEST(GeneratorInitTest, RejectsDatacenterIdOutOfRange) {
    for (int64_t datacenter_id : {-1, 32}) {
        auto generator = Generator::init(0, datacenter_id);
        ASSERT_FALSE(generator.ok());
        EXPECT_TRUE(flake::id::is_invalid_configuration(generator.status()));
        EXPECT_NE(generator.status().message().find("datacenter id"),
                  std::string::npos)
            << generator.status();
    }
}

TEST(GeneratorInitTest, ChecksWorkerIdFirst) {
    auto generator = Generator::init(32, -1);
    ASSERT_FALSE(generator.ok());
    EXPECT_NE(generator.status().message().find("worker id"),
              std::string::npos);
}

TEST(GeneratorInitTest, RejectsNullClock) {
    auto generator = Generator::init(1, 1, nullptr);
    ASSERT_FALSE(generator.ok());
    EXPECT_FALSE(flake::id::is_invalid_configuration(generator.status()));
}

TEST(GeneratorInitTest, DescribesLayout) {
    auto generator = Generator::init(3, 7);
    ASSERT_TRUE(generator.ok());
    EXPECT_EQ(generator.value()->to_string(),
              "timestamp left shift 22, datacenter id bits 5, worker id bits "
              "5, sequence bits 12, worker id 3, datacenter id 7");
}

TEST_F(GeneratorTest, SameMillisecondIncrementsSequence) {
    auto generator = make_generator(1, 1);

    uint64_t first = next(*generator);
    uint64_t second = next(*generator);

    IdParts a = decompose(first);
    IdParts b = decompose(second);

    EXPECT_EQ(b.sequence, a.sequence + 1);
    EXPECT_EQ(a.timestamp_ms, kNow);
    EXPECT_EQ(b.timestamp_ms, kNow);
    EXPECT_EQ(a.worker_id, 1);
    EXPECT_EQ(b.worker_id, 1);
    EXPECT_EQ(a.datacenter_id, 1);
    EXPECT_EQ(b.datacenter_id, 1);
    EXPECT_GT(second, first);
}

TEST_F(GeneratorTest, FirstIdStartsAtSequenceZero) {
    auto generator = make_generator(4, 2);

    uint64_t id = next(*generator);

    EXPECT_EQ(id, flake::id::compose(kNow, 2, 4, 0));
}

TEST_F(GeneratorTest, NewMillisecondResetsSequence) {
    auto generator = make_generator(1, 1);

    next(*generator);
    next(*generator);
    next(*generator);

    clock.advance(1);
    IdParts parts = decompose(next(*generator));

    EXPECT_EQ(parts.timestamp_ms, kNow + 1);
    EXPECT_EQ(parts.sequence, 0);
}

TEST_F(GeneratorTest, SequenceWrapWaitsForNextTick) {
    auto generator = make_generator(5, 6);

    uint64_t previous = 0;
    for (int i = 0; i < 4096; ++i) {
        uint64_t id = next(*generator);
        IdParts parts = decompose(id);
        ASSERT_EQ(parts.timestamp_ms, kNow);
        ASSERT_EQ(parts.sequence, i);
        ASSERT_GT(id, previous);
        previous = id;
    }

    // The 4097th call reads kNow once, then spins twice more on kNow before
    // the clock moves.
    clock.jump_after(3, kNow + 1);
    int64_t reads_before = clock.reads();

    uint64_t id = next(*generator);
    IdParts parts = decompose(id);

    EXPECT_EQ(parts.timestamp_ms, kNow + 1);
    EXPECT_EQ(parts.sequence, 0);
    EXPECT_EQ(parts.worker_id, 5);
    EXPECT_EQ(parts.datacenter_id, 6);
    EXPECT_GT(id, previous);
    EXPECT_EQ(clock.reads() - reads_before, 4);
}

TEST_F(GeneratorTest, SequenceExhaustionIsLoggedAtDebug) {
    auto generator = make_generator(1, 1);

    std::ostringstream output;
    auto previous_logger = spdlog::default_logger();
    auto logger = std::make_shared<spdlog::logger>(
        "capture", std::make_shared<spdlog::sinks::ostream_sink_mt>(output));
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::debug);

    for (int i = 0; i < 4096; ++i) {
        next(*generator);
    }
    clock.jump_after(1, kNow + 1);
    IdParts parts = decompose(next(*generator));

    spdlog::set_default_logger(previous_logger);

    EXPECT_EQ(parts.timestamp_ms, kNow + 1);
    EXPECT_NE(output.str().find("sequence exhausted at 1704067200000"),
              std::string::npos)
        << output.str();
}

TEST_F(GeneratorTest, ClockMovedBackwardLeavesStateUntouched) {
    auto generator = make_generator(1, 1);

    next(*generator);
    uint64_t before = next(*generator);

    clock.set(kNow - 5);
    auto failed = generator->next_id();
    ASSERT_FALSE(failed.ok());
    EXPECT_TRUE(flake::id::is_clock_moved_backward(failed.status()));
    EXPECT_EQ(failed.status().code(), absl::StatusCode::kUnavailable);

    auto regression = flake::id::get_clock_regression(failed.status());
    ASSERT_TRUE(regression.has_value());
    EXPECT_EQ(regression->last_timestamp_ms, kNow);
    EXPECT_EQ(regression->deficit_ms, 5);

    // Retrying while the clock is still behind keeps failing.
    clock.set(kNow - 1);
    EXPECT_TRUE(flake::id::is_clock_moved_backward(
        generator->next_id().status()));

    // Back at the last tick, the sequence continues where it left off.
    clock.set(kNow);
    uint64_t after = next(*generator);
    IdParts parts = decompose(after);
    EXPECT_EQ(parts.timestamp_ms, kNow);
    EXPECT_EQ(parts.sequence, decompose(before).sequence + 1);
    EXPECT_GT(after, before);
}

TEST_F(GeneratorTest, ClockBeforeEpochIsOutOfRange) {
    auto generator = make_generator(1, 1);

    clock.set(flake::id::kEpochMs - 1);
    auto failed = generator->next_id();
    ASSERT_FALSE(failed.ok());
    EXPECT_EQ(failed.status().code(), absl::StatusCode::kOutOfRange);
    EXPECT_FALSE(flake::id::is_clock_moved_backward(failed.status()));

    // nothing was recorded, so an earlier valid time is still accepted
    clock.set(flake::id::kEpochMs);
    EXPECT_EQ(next(*generator),
              flake::id::compose(flake::id::kEpochMs, 1, 1, 0));
}

TEST_F(GeneratorTest, ClockBeyondTimestampBitsIsOutOfRange) {
    auto generator = make_generator(1, 1);

    clock.set(flake::id::kEpochMs + flake::id::kMaxTimestampDelta + 1);
    auto failed = generator->next_id();
    ASSERT_FALSE(failed.ok());
    EXPECT_EQ(failed.status().code(), absl::StatusCode::kOutOfRange);
}

TEST(GeneratorSystemClockTest, IdsAreIncreasingAndCarryConfiguredIds) {
    auto generator = Generator::init(17, 29);
    ASSERT_TRUE(generator.ok());

    uint64_t previous = 0;
    for (int i = 0; i < 20000; ++i) {
        auto id = generator.value()->next_id();
        ASSERT_TRUE(id.ok()) << id.status();
        ASSERT_GT(id.value(), previous);
        previous = id.value();

        IdParts parts = decompose(id.value());
        ASSERT_EQ(parts.worker_id, 17);
        ASSERT_EQ(parts.datacenter_id, 29);
    }
}

TEST(GeneratorSystemClockTest, ConcurrentCallersGetUniqueIds) {
    auto init = Generator::init(2, 3);
    ASSERT_TRUE(init.ok());
    std::shared_ptr<Generator> generator = std::move(init).value();

    constexpr int kThreads = 8;
    constexpr int kIdsPerThread = 5000;

    std::mutex mutex;
    std::set<uint64_t> seen;
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            std::vector<uint64_t> local;
            local.reserve(kIdsPerThread);
            uint64_t previous = 0;
            for (int i = 0; i < kIdsPerThread; ++i) {
                auto id = generator->next_id();
                ASSERT_TRUE(id.ok()) << id.status();
                // ids observed by one thread are increasing
                ASSERT_GT(id.value(), previous);
                previous = id.value();
                local.push_back(id.value());
            }
            std::lock_guard<std::mutex> lock(mutex);
            seen.insert(local.begin(), local.end());
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(seen.size(), static_cast<size_t>(kThreads * kIdsPerThread));
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);

    testing::AddGlobalTestEnvironment(new test_util::FlakeEnvironment);

    return RUN_ALL_TESTS();
}
