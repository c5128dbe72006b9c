// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.


#include <gtest/gtest.h>
#include <gpu_telemetry/config/polling_config.h>
#include <gpu_telemetry/core/sampling_scheduler.h>
#include <gpu_telemetry/core/vendor_detector.h>

#include "test_support.h"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

namespace gpu_telemetry {
namespace {

using namespace std::chrono_literals;
using test::fake_backend;
using test::make_device;

class SamplingSchedulerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        devices_ = {make_device("card0", gpu_vendor_tag::filesystem_exposed, 0),
                    make_device("card1", gpu_vendor_tag::filesystem_exposed, 1)};
        backend_ = std::make_shared<fake_backend>(gpu_vendor_tag::filesystem_exposed, devices_);
        backend_->reading.utilization = raw_field::of(42.0);
        backend_->reading.temperature = raw_field::of(60.0);
        store_ = std::make_unique<telemetry_store>(devices_, 8);
        logger_ = std::make_shared<test::recording_logger>();
    }

    std::vector<poll_target> targets() const {
        std::vector<poll_target> out;
        for (const auto& device : devices_) {
            out.push_back(poll_target{backend_, device});
        }
        return out;
    }

    template <typename Predicate>
    static bool wait_until(Predicate pred, std::chrono::milliseconds timeout = 2000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) {
                return true;
            }
            std::this_thread::sleep_for(1ms);
        }
        return pred();
    }

    std::vector<gpu_device> devices_;
    std::shared_ptr<fake_backend> backend_;
    std::unique_ptr<telemetry_store> store_;
    std::shared_ptr<test::recording_logger> logger_;
};

TEST_F(SamplingSchedulerTest, InitialStateIsIdle) {
    sampling_scheduler scheduler(targets(), *store_, 100ms);
    EXPECT_EQ(scheduler.state(), scheduler_state::idle);
    EXPECT_FALSE(scheduler.is_running());
    EXPECT_EQ(scheduler.tick_count(), 0u);
}

TEST_F(SamplingSchedulerTest, StateNames) {
    EXPECT_EQ(scheduler_state_to_string(scheduler_state::idle), "idle");
    EXPECT_EQ(scheduler_state_to_string(scheduler_state::running), "running");
    EXPECT_EQ(scheduler_state_to_string(scheduler_state::stopping), "stopping");
    EXPECT_EQ(scheduler_state_to_string(scheduler_state::stopped), "stopped");
}

TEST_F(SamplingSchedulerTest, RejectsNonPositiveInterval) {
    EXPECT_THROW(sampling_scheduler(targets(), *store_, 0ms), std::invalid_argument);
}

TEST_F(SamplingSchedulerTest, RejectsIntervalAboveOneHour) {
    EXPECT_THROW(sampling_scheduler(targets(), *store_, MAX_POLLING_INTERVAL + 1ms),
                 std::invalid_argument);
    EXPECT_NO_THROW(sampling_scheduler(targets(), *store_, MAX_POLLING_INTERVAL));
}

TEST_F(SamplingSchedulerTest, RunOncePollsEveryDevice) {
    sampling_scheduler scheduler(targets(), *store_, 100ms);
    ASSERT_TRUE(scheduler.run_once().is_ok());

    EXPECT_EQ(backend_->poll_count.load(), 2);
    EXPECT_EQ(scheduler.tick_count(), 1u);

    for (const auto& device : devices_) {
        auto latest = store_->latest(device.id);
        ASSERT_TRUE(latest.is_ok());
        EXPECT_DOUBLE_EQ(latest.value().utilization_percent, 42.0);
        EXPECT_DOUBLE_EQ(latest.value().temperature_celsius, 60.0);
    }
}

TEST_F(SamplingSchedulerTest, BackToBackTicksKeepTimestampsIncreasing) {
    sampling_scheduler scheduler(targets(), *store_, 100ms);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(scheduler.run_once().is_ok());
    }

    auto samples = store_->snapshot("card0");
    ASSERT_TRUE(samples.is_ok());
    ASSERT_EQ(samples.value().size(), 5u);
    for (size_t i = 1; i < samples.value().size(); ++i) {
        EXPECT_LT(samples.value()[i - 1].timestamp, samples.value()[i].timestamp);
    }
}

TEST_F(SamplingSchedulerTest, StartStopLifecycle) {
    sampling_scheduler scheduler(targets(), *store_, 10ms, logger_);
    ASSERT_TRUE(scheduler.start().is_ok());
    EXPECT_EQ(scheduler.state(), scheduler_state::running);

    EXPECT_TRUE(wait_until([&]() { return scheduler.tick_count() >= 3; }));

    ASSERT_TRUE(scheduler.stop().is_ok());
    EXPECT_EQ(scheduler.state(), scheduler_state::stopped);
    EXPECT_EQ(logger_->count_containing(log_level::info, "Sampling started"), 1u);
    EXPECT_EQ(logger_->count_containing(log_level::info, "Sampling stopped"), 1u);

    auto samples = store_->snapshot("card1");
    ASSERT_TRUE(samples.is_ok());
    EXPECT_GE(samples.value().size(), 3u);
}

TEST_F(SamplingSchedulerTest, StartTwiceIsRejected) {
    sampling_scheduler scheduler(targets(), *store_, 50ms);
    ASSERT_TRUE(scheduler.start().is_ok());

    auto second = scheduler.start();
    ASSERT_TRUE(second.is_err());
    EXPECT_EQ(error_code_of(second), telemetry_error_code::already_started);

    EXPECT_TRUE(scheduler.stop().is_ok());
}

TEST_F(SamplingSchedulerTest, RestartAfterStopIsRejected) {
    sampling_scheduler scheduler(targets(), *store_, 50ms);
    ASSERT_TRUE(scheduler.start().is_ok());
    ASSERT_TRUE(scheduler.stop().is_ok());

    auto restarted = scheduler.start();
    ASSERT_TRUE(restarted.is_err());
    EXPECT_EQ(error_code_of(restarted), telemetry_error_code::already_stopped);
    ASSERT_TRUE(restarted.error().details.has_value());
    EXPECT_EQ(*restarted.error().details, "state stopped");
    EXPECT_TRUE(scheduler.stop().is_ok());
}

TEST_F(SamplingSchedulerTest, RunOnceRejectedWhileRunning) {
    sampling_scheduler scheduler(targets(), *store_, 50ms);
    ASSERT_TRUE(scheduler.start().is_ok());

    auto once = scheduler.run_once();
    ASSERT_TRUE(once.is_err());
    EXPECT_EQ(error_code_of(once), telemetry_error_code::already_started);
    EXPECT_TRUE(scheduler.stop().is_ok());
}

TEST_F(SamplingSchedulerTest, StopIsObservedWithinOneInterval) {
    sampling_scheduler scheduler(targets(), *store_, 200ms);
    ASSERT_TRUE(scheduler.start().is_ok());
    EXPECT_TRUE(wait_until([&]() { return scheduler.tick_count() >= 1; }));

    auto begin = std::chrono::steady_clock::now();
    ASSERT_TRUE(scheduler.stop().is_ok());
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(elapsed, 200ms);
}

TEST_F(SamplingSchedulerTest, ExceptionsBecomeZeroSnapshots) {
    backend_->throw_on_poll = true;
    sampling_scheduler scheduler(targets(), *store_, 100ms, logger_);
    ASSERT_TRUE(scheduler.run_once().is_ok());

    auto latest = store_->latest("card0");
    ASSERT_TRUE(latest.is_ok());
    EXPECT_DOUBLE_EQ(latest.value().utilization_percent, 0.0);
    EXPECT_EQ(logger_->count(log_level::error), 2u);

    backend_->throw_on_poll = false;
    ASSERT_TRUE(scheduler.run_once().is_ok());
    EXPECT_DOUBLE_EQ(store_->latest("card0").value().utilization_percent, 42.0);
}

TEST_F(SamplingSchedulerTest, NonStandardExceptionsBecomeZeroSnapshots) {
    backend_->throw_non_standard = true;
    sampling_scheduler scheduler({poll_target{backend_, devices_[0]}}, *store_, 100ms, logger_);
    ASSERT_TRUE(scheduler.run_once().is_ok());

    auto latest = store_->latest("card0");
    ASSERT_TRUE(latest.is_ok());
    EXPECT_DOUBLE_EQ(latest.value().utilization_percent, 0.0);
    EXPECT_EQ(logger_->count_containing(log_level::error, "non-standard exception"), 1u);
}

TEST_F(SamplingSchedulerTest, LoopSurvivesNonStandardException) {
    backend_->throw_non_standard = true;
    sampling_scheduler scheduler(targets(), *store_, 5ms, logger_);
    ASSERT_TRUE(scheduler.start().is_ok());

    EXPECT_TRUE(wait_until([&]() { return scheduler.tick_count() >= 3; }));
    EXPECT_EQ(scheduler.state(), scheduler_state::running);
    EXPECT_TRUE(scheduler.stop().is_ok());
}

TEST_F(SamplingSchedulerTest, LoopSurvivesThrowingBackend) {
    backend_->throw_on_poll = true;
    sampling_scheduler scheduler(targets(), *store_, 5ms, logger_);
    ASSERT_TRUE(scheduler.start().is_ok());

    EXPECT_TRUE(wait_until([&]() { return scheduler.tick_count() >= 3; }));
    EXPECT_EQ(scheduler.state(), scheduler_state::running);
    EXPECT_TRUE(scheduler.stop().is_ok());
}

TEST_F(SamplingSchedulerTest, WarnsOnceForEachFieldTransition) {
    backend_->reading.fan_rpm = raw_field::failed(field_status::unsupported);
    backend_->reading.power = raw_field::failed(field_status::permission_denied);

    sampling_scheduler scheduler({poll_target{backend_, devices_[0]}}, *store_, 100ms, logger_);
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(scheduler.run_once().is_ok());
    }

    EXPECT_EQ(logger_->count_containing(log_level::warning, "gpu_fan_rpm unsupported"), 1u);
    EXPECT_EQ(logger_->count_containing(log_level::warning, "gpu_power_watts permission_denied"), 1u);
}

TEST_F(SamplingSchedulerTest, SlowPollsReanchorSchedule) {
    backend_->poll_delay = 30ms;
    sampling_scheduler scheduler({poll_target{backend_, devices_[0]}}, *store_, 10ms, logger_);
    ASSERT_TRUE(scheduler.start().is_ok());

    EXPECT_TRUE(wait_until([&]() { return scheduler.reanchor_count() >= 1; }));
    EXPECT_TRUE(scheduler.stop().is_ok());
    EXPECT_GE(logger_->count_containing(log_level::debug, "re-anchored"), 1u);
}

TEST_F(SamplingSchedulerTest, CadenceDoesNotAccumulatePollTime) {
    backend_->poll_delay = 5ms;
    sampling_scheduler scheduler({poll_target{backend_, devices_[0]}}, *store_, 20ms);

    auto begin = std::chrono::steady_clock::now();
    ASSERT_TRUE(scheduler.start().is_ok());
    std::this_thread::sleep_for(500ms);
    ASSERT_TRUE(scheduler.stop().is_ok());
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - begin);

    // One immediate tick, then one per interval; sleeping a full interval
    // after each 5ms poll would fall about six ticks short.
    double expected = static_cast<double>(elapsed.count()) / 20.0 + 1.0;
    EXPECT_NEAR(static_cast<double>(scheduler.tick_count()), expected, 2.0);
}

TEST_F(SamplingSchedulerTest, DestructorStopsRunningThread) {
    {
        sampling_scheduler scheduler(targets(), *store_, 10ms);
        ASSERT_TRUE(scheduler.start().is_ok());
    }
    SUCCEED();
}

TEST_F(SamplingSchedulerTest, TargetsOfFlattensDetectionResult) {
    detection_result detected;
    detected.backends.push_back(detected_backend{backend_, devices_});
    auto flattened = targets_of(detected);

    ASSERT_EQ(flattened.size(), 2u);
    EXPECT_EQ(flattened[0].device.id, "card0");
    EXPECT_EQ(flattened[1].device.id, "card1");
    EXPECT_EQ(flattened[0].backend.get(), backend_.get());
}

}  // namespace
}  // namespace gpu_telemetry
