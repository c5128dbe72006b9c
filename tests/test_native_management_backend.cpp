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
#include <gpu_telemetry/backends/native_management_backend.h>
#include <gpu_telemetry/backends/nvml_library.h>
#include <gpu_telemetry/core/metric_normalizer.h>

#include "test_support.h"

#include <chrono>
#include <memory>
#include <utility>

namespace gpu_telemetry {
namespace {

class NativeManagementBackendTest : public ::testing::Test {
  protected:
    void SetUp() override {
        library_ = std::make_unique<test::fake_management_library>();
    }

    /**
     * @brief Backend whose factory hands over library_ on init()
     */
    std::unique_ptr<native_management_backend> make_backend() {
        auto holder = std::make_shared<std::unique_ptr<management_library>>(std::move(library_));
        return std::make_unique<native_management_backend>(
            [holder]() -> result<std::unique_ptr<management_library>> {
                return make_success(std::move(*holder));
            });
    }

    std::unique_ptr<test::fake_management_library> library_;
};

TEST_F(NativeManagementBackendTest, EnumeratesDevicesWithMetadata) {
    test::fake_management_library::device_state first;
    first.name = "NVIDIA GeForce RTX 4090";
    first.uuid = "GPU-1234";
    first.vbios = "95.02.18.80.5F";
    first.pcie_gen = 4;
    first.pcie_width = 16;
    test::fake_management_library::device_state second;
    library_->devices = {first, second};

    auto backend = make_backend();
    ASSERT_TRUE(backend->init().is_ok());
    EXPECT_TRUE(backend->is_available());

    auto devices = backend->enumerate();
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].id, "nvml0");
    EXPECT_EQ(devices[0].name, "NVIDIA GeForce RTX 4090");
    EXPECT_EQ(devices[0].uuid, "GPU-1234");
    EXPECT_EQ(devices[0].driver_version, "550.54.14");
    EXPECT_EQ(devices[0].vendor, gpu_vendor_tag::native_managed);
    EXPECT_EQ(devices[0].vbios_version, "95.02.18.80.5F");
    EXPECT_EQ(devices[0].pcie_gen, 4u);
    EXPECT_EQ(devices[0].pcie_width, 16u);
    EXPECT_EQ(devices[1].id, "nvml1");
    EXPECT_EQ(devices[1].index, 1u);
    EXPECT_EQ(devices[1].name, "NVIDIA GPU 1");
    EXPECT_EQ(devices[1].vbios_version, "N/A");
    EXPECT_EQ(devices[1].pcie_gen, 0u);
    EXPECT_EQ(devices[1].pcie_width, 0u);
}

TEST_F(NativeManagementBackendTest, LoadFailureIsBackendUnavailable) {
    native_management_backend backend([]() -> result<std::unique_ptr<management_library>> {
        return make_error_with_context<std::unique_ptr<management_library>>(
            telemetry_error_code::library_not_found, "NVML could not be loaded", "libnvidia-ml.so.1");
    });

    auto result = backend.init();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(error_code_of(result), telemetry_error_code::backend_unavailable);
    ASSERT_TRUE(result.error().details.has_value());
    EXPECT_NE(result.error().details->find("libnvidia-ml.so.1"), std::string::npos);
    EXPECT_FALSE(backend.is_available());
    EXPECT_TRUE(backend.enumerate().empty());
}

TEST_F(NativeManagementBackendTest, InitializeFailureIsBackendUnavailable) {
    library_->fail_initialize = true;
    auto backend = make_backend();

    auto result = backend->init();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(error_code_of(result), telemetry_error_code::backend_unavailable);
    EXPECT_FALSE(backend->is_available());
}

TEST_F(NativeManagementBackendTest, DeviceCountFailureIsBackendUnavailable) {
    library_->fail_count = true;
    auto backend = make_backend();
    EXPECT_TRUE(backend->init().is_err());
}

TEST_F(NativeManagementBackendTest, PollMapsEveryQuery) {
    test::fake_management_library::device_state state;
    state.name = "GPU";
    state.utilization = raw_field::of(87.0);
    state.memory = {raw_field::of(2147483648.0), raw_field::of(25769803776.0)};
    state.temperature = raw_field::of(71.0);
    state.power = raw_field::of(285000.0);
    state.power_limit = raw_field::of(450000.0);
    state.fan = raw_field::of(64.0);
    state.graphics_clock = raw_field::of(2520.0);
    state.memory_clock = raw_field::of(10501.0);
    state.pcie_tx = raw_field::of(2048.0);
    state.pcie_rx = raw_field::of(512.0);
    library_->devices = {state};

    auto backend = make_backend();
    ASSERT_TRUE(backend->init().is_ok());
    auto raw = backend->poll(backend->enumerate().front());

    EXPECT_EQ(raw.fan_rpm.status, field_status::unsupported);
    EXPECT_DOUBLE_EQ(raw.scale.power, 1e-3);
    EXPECT_DOUBLE_EQ(*raw.pcie_tx.value, 2048.0);
    EXPECT_DOUBLE_EQ(*raw.pcie_rx.value, 512.0);

    auto snap = metric_normalizer::normalize(raw, std::chrono::steady_clock::now());
    EXPECT_DOUBLE_EQ(snap.utilization_percent, 87.0);
    EXPECT_EQ(snap.memory_used_bytes, 2147483648ull);
    EXPECT_EQ(snap.memory_total_bytes, 25769803776ull);
    EXPECT_DOUBLE_EQ(snap.temperature_celsius, 71.0);
    EXPECT_NEAR(snap.power_watts, 285.0, 1e-9);
    EXPECT_NEAR(snap.power_limit_watts, 450.0, 1e-9);
    EXPECT_DOUBLE_EQ(snap.fan_rpm, 0.0);
    EXPECT_DOUBLE_EQ(snap.fan_percent, 64.0);
    EXPECT_DOUBLE_EQ(snap.graphics_clock_mhz, 2520.0);
    EXPECT_DOUBLE_EQ(snap.memory_clock_mhz, 10501.0);
    EXPECT_DOUBLE_EQ(snap.pcie_tx_mbps, 2.0);
    EXPECT_DOUBLE_EQ(snap.pcie_rx_mbps, 0.5);
}

TEST_F(NativeManagementBackendTest, UnsupportedPcieThroughputReadsZero) {
    test::fake_management_library::device_state state;
    state.utilization = raw_field::of(10.0);
    state.pcie_tx = raw_field::failed(field_status::unsupported);
    state.pcie_rx = raw_field::failed(field_status::query_failed);
    library_->devices = {state};

    auto backend = make_backend();
    ASSERT_TRUE(backend->init().is_ok());
    auto raw = backend->poll(backend->enumerate().front());

    EXPECT_EQ(raw.pcie_tx.status, field_status::unsupported);
    EXPECT_EQ(raw.pcie_rx.status, field_status::query_failed);
    auto snap = metric_normalizer::normalize(raw, std::chrono::steady_clock::now());
    EXPECT_DOUBLE_EQ(snap.pcie_tx_mbps, 0.0);
    EXPECT_DOUBLE_EQ(snap.pcie_rx_mbps, 0.0);
    EXPECT_DOUBLE_EQ(snap.utilization_percent, 10.0);
}

TEST_F(NativeManagementBackendTest, FailingQueryOnlyAffectsItsField) {
    test::fake_management_library::device_state state;
    state.utilization = raw_field::of(50.0);
    state.temperature = raw_field::failed(field_status::query_failed);
    state.fan = raw_field::failed(field_status::unsupported);
    library_->devices = {state};

    auto backend = make_backend();
    ASSERT_TRUE(backend->init().is_ok());
    auto raw = backend->poll(backend->enumerate().front());

    EXPECT_EQ(raw.temperature.status, field_status::query_failed);
    EXPECT_EQ(raw.fan_duty.status, field_status::unsupported);
    ASSERT_TRUE(raw.utilization.supported());
    EXPECT_DOUBLE_EQ(*raw.utilization.value, 50.0);
}

TEST_F(NativeManagementBackendTest, PollBeforeInitReportsQueryFailed) {
    auto backend = make_backend();
    auto raw = backend->poll(test::make_device("nvml0", gpu_vendor_tag::native_managed));
    EXPECT_EQ(raw.utilization.status, field_status::query_failed);
    EXPECT_FALSE(raw.memory_total.supported());
    EXPECT_EQ(raw.pcie_tx.status, field_status::query_failed);
}

TEST(NvmlLibraryTest, BadPathIsLibraryNotFound) {
    auto loaded = nvml_library::load("/nonexistent/libnvidia-ml.so.1");
    ASSERT_TRUE(loaded.is_err());
    EXPECT_EQ(error_code_of(loaded), telemetry_error_code::library_not_found);
}

TEST(NvmlLibraryTest, DefaultCandidatesTrySonames) {
    auto candidates = nvml_library::default_candidates();
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0], "libnvidia-ml.so.1");
    EXPECT_EQ(candidates[1], "libnvidia-ml.so");
}

TEST(NvmlLibraryTest, NvmlFactoryWithBadPathFailsBackendInit) {
    native_management_backend backend(make_nvml_factory("/nonexistent/libnvidia-ml.so"));
    auto result = backend.init();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(error_code_of(result), telemetry_error_code::backend_unavailable);
}

}  // namespace
}  // namespace gpu_telemetry
