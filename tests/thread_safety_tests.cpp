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
#include <gpu_telemetry/core/sampling_scheduler.h>
#include <gpu_telemetry/utils/time_series_buffer.h>

#include <atomic>
#include <chrono>
#include <latch>
#include <thread>
#include <vector>

using namespace gpu_telemetry;
using namespace std::chrono_literals;

namespace {

/**
 * @brief Backend whose every metric of one poll carries the same counter value
 */
class counting_backend : public vendor_backend {
public:
    explicit counting_backend(std::vector<gpu_device> devices) : devices_(std::move(devices)) {}

    auto name() const -> std::string_view override { return "counting"; }
    auto vendor() const -> gpu_vendor_tag override { return gpu_vendor_tag::filesystem_exposed; }
    auto init() -> result_void override { return make_void_success(); }
    auto enumerate() const -> std::vector<gpu_device> override { return devices_; }
    auto is_available() const -> bool override { return true; }

    auto poll(const gpu_device&) -> raw_reading override {
        double v = static_cast<double>(counter_.fetch_add(1) % 100);
        raw_reading raw;
        raw.utilization = raw_field::of(v);
        raw.memory_used = raw_field::of(v);
        raw.memory_total = raw_field::of(v);
        raw.temperature = raw_field::of(v);
        raw.power = raw_field::of(v);
        raw.fan_rpm = raw_field::of(v);
        raw.fan_duty = raw_field::of(v);
        raw.power_limit = raw_field::of(v);
        raw.graphics_clock = raw_field::of(v);
        raw.memory_clock = raw_field::of(v);
        raw.pcie_tx = raw_field::of(v);
        raw.pcie_rx = raw_field::of(v);
        return raw;
    }

private:
    std::vector<gpu_device> devices_;
    std::atomic<uint64_t> counter_{0};
};

bool is_consistent(const metric_snapshot& s) {
    double v = s.utilization_percent;
    return s.temperature_celsius == v && s.power_watts == v && s.fan_rpm == v &&
           s.fan_percent == v && s.power_limit_watts == v && s.graphics_clock_mhz == v &&
           s.memory_clock_mhz == v && s.pcie_tx_mbps == v && s.pcie_rx_mbps == v &&
           static_cast<double>(s.memory_used_bytes) == v &&
           static_cast<double>(s.memory_total_bytes) == v;
}

}  // namespace

class TelemetryThreadSafetyTest : public ::testing::Test {
   protected:
    void SetUp() override {
        gpu_device device;
        device.id = "card0";
        device.name = "Concurrent GPU";
        devices_ = {device};
        backend_ = std::make_shared<counting_backend>(devices_);
        store_ = std::make_unique<telemetry_store>(devices_, 64);
    }

    std::vector<gpu_device> devices_;
    std::shared_ptr<counting_backend> backend_;
    std::unique_ptr<telemetry_store> store_;
};

// Readers never observe a partially written snapshot while the scheduler appends
TEST_F(TelemetryThreadSafetyTest, ConcurrentReadsDuringSampling) {
    const int num_readers = 8;
    std::atomic<int> torn{0};
    std::atomic<int> unordered{0};
    std::atomic<bool> done{false};

    sampling_scheduler scheduler({poll_target{backend_, devices_[0]}}, *store_, 1ms);
    ASSERT_TRUE(scheduler.start().is_ok());

    std::vector<std::thread> readers;
    std::latch sync_point(num_readers);

    for (int i = 0; i < num_readers; ++i) {
        readers.emplace_back([&]() {
            sync_point.arrive_and_wait();
            while (!done.load()) {
                auto window = store_->snapshot("card0");
                if (window.is_err()) {
                    continue;
                }
                const auto& samples = window.value();
                for (size_t k = 0; k < samples.size(); ++k) {
                    if (!is_consistent(samples[k])) {
                        ++torn;
                    }
                    if (k > 0 && !(samples[k - 1].timestamp < samples[k].timestamp)) {
                        ++unordered;
                    }
                }
            }
        });
    }

    std::this_thread::sleep_for(200ms);
    done = true;
    for (auto& t : readers) {
        t.join();
    }
    ASSERT_TRUE(scheduler.stop().is_ok());

    EXPECT_EQ(torn.load(), 0);
    EXPECT_EQ(unordered.load(), 0);
    EXPECT_GT(scheduler.tick_count(), 0u);
}

// Direct buffer hammering: one writer, many readers, statistics included
TEST_F(TelemetryThreadSafetyTest, ConcurrentBufferAccess) {
    snapshot_buffer_config config;
    config.max_samples = 32;
    snapshot_buffer buffer(config);

    const int num_readers = 6;
    const int writes = 5000;
    std::atomic<bool> done{false};
    std::atomic<int> errors{0};
    std::latch sync_point(num_readers + 1);

    std::thread writer([&]() {
        sync_point.arrive_and_wait();
        auto base = std::chrono::steady_clock::now();
        for (int i = 1; i <= writes; ++i) {
            metric_snapshot snap;
            snap.timestamp = base + std::chrono::microseconds(i);
            snap.utilization_percent = static_cast<double>(i % 100);
            if (buffer.append(snap).is_err()) {
                ++errors;
            }
        }
        done = true;
    });

    std::vector<std::thread> readers;
    for (int i = 0; i < num_readers; ++i) {
        readers.emplace_back([&]() {
            sync_point.arrive_and_wait();
            while (!done.load()) {
                auto samples = buffer.snapshot();
                if (samples.size() > buffer.capacity()) {
                    ++errors;
                }
                auto stats = buffer.statistics(metric_kind::utilization_percent);
                if (stats.sample_count > 0 && stats.max_value > 100.0) {
                    ++errors;
                }
                auto latest = buffer.latest();
                static_cast<void>(latest);
            }
        });
    }

    writer.join();
    for (auto& t : readers) {
        t.join();
    }

    EXPECT_EQ(errors.load(), 0);
    EXPECT_EQ(buffer.size(), 32u);
}
