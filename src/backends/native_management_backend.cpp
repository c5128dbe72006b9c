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


#include <gpu_telemetry/backends/native_management_backend.h>
#include <gpu_telemetry/backends/nvml_library.h>

#include <utility>

namespace gpu_telemetry {
namespace {

constexpr double MILLIWATTS_TO_WATTS = 1e-3;
constexpr double KILOBYTES_TO_MEGABYTES = 1.0 / 1024.0;
constexpr const char* UNKNOWN_VBIOS = "N/A";

raw_reading unsupported_reading(field_status status) {
    raw_reading raw;
    raw.utilization = raw_field::failed(status);
    raw.memory_used = raw_field::failed(status);
    raw.memory_total = raw_field::failed(status);
    raw.temperature = raw_field::failed(status);
    raw.power = raw_field::failed(status);
    raw.fan_rpm = raw_field::failed(field_status::unsupported);
    raw.fan_duty = raw_field::failed(status);
    raw.power_limit = raw_field::failed(status);
    raw.graphics_clock = raw_field::failed(status);
    raw.memory_clock = raw_field::failed(status);
    raw.pcie_tx = raw_field::failed(status);
    raw.pcie_rx = raw_field::failed(status);
    return raw;
}

}  // anonymous namespace

library_factory make_nvml_factory(const std::string& path) {
    return [path]() -> result<std::unique_ptr<management_library>> {
        auto loaded = nvml_library::load(path);
        if (loaded.is_err()) {
            return common::Result<std::unique_ptr<management_library>>::err(loaded.error());
        }
        std::unique_ptr<management_library> library = std::move(loaded.value());
        return make_success(std::move(library));
    };
}

native_management_backend::native_management_backend(library_factory factory)
    : factory_(std::move(factory)) {}

auto native_management_backend::init() -> result_void {
    if (library_) {
        return make_void_success();
    }
    if (!factory_) {
        return make_void_error(telemetry_error_code::backend_unavailable,
                               "No management library factory configured");
    }

    auto loaded = factory_();
    if (loaded.is_err()) {
        return make_void_error(telemetry_error_code::backend_unavailable,
                               "Management library could not be loaded",
                               loaded.error().message +
                                   (loaded.error().details ? ": " + *loaded.error().details : ""));
    }
    auto library = std::move(loaded.value());

    auto init_result = library->initialize();
    if (init_result.is_err()) {
        return make_void_error(telemetry_error_code::backend_unavailable,
                               "Management library failed to initialize",
                               init_result.error().message);
    }

    auto count = library->device_count();
    if (count.is_err()) {
        return make_void_error(telemetry_error_code::backend_unavailable,
                               "Device count query failed", count.error().message);
    }

    std::string driver;
    if (auto version = library->driver_version(); version.is_ok()) {
        driver = version.value();
    }

    devices_.clear();
    for (uint32_t i = 0; i < count.value(); ++i) {
        gpu_device device;
        device.id = "nvml" + std::to_string(i);
        device.vendor = gpu_vendor_tag::native_managed;
        device.index = i;
        device.driver_version = driver;

        auto name = library->device_name(i);
        device.name = name.is_ok() ? name.value() : "NVIDIA GPU " + std::to_string(i);

        if (auto uuid = library->device_uuid(i); uuid.is_ok()) {
            device.uuid = uuid.value();
        }

        auto vbios = library->vbios_version(i);
        device.vbios_version = vbios.is_ok() ? vbios.value() : UNKNOWN_VBIOS;
        if (auto gen = library->pcie_link_generation(i); gen.is_ok()) {
            device.pcie_gen = gen.value();
        }
        if (auto width = library->pcie_link_width(i); width.is_ok()) {
            device.pcie_width = width.value();
        }
        devices_.push_back(std::move(device));
    }

    library_ = std::move(library);
    return make_void_success();
}

auto native_management_backend::poll(const gpu_device& device) -> raw_reading {
    if (!library_ || device.vendor != gpu_vendor_tag::native_managed) {
        return unsupported_reading(field_status::query_failed);
    }

    const uint32_t index = device.index;
    raw_reading raw;
    raw.utilization = library_->utilization(index);

    memory_reading mem = library_->memory(index);
    raw.memory_used = mem.used;
    raw.memory_total = mem.total;

    raw.temperature = library_->temperature(index);
    raw.power = library_->power_usage(index);
    raw.fan_rpm = raw_field::failed(field_status::unsupported);
    raw.fan_duty = library_->fan_speed(index);
    raw.power_limit = library_->power_limit(index);
    raw.graphics_clock = library_->graphics_clock(index);
    raw.memory_clock = library_->memory_clock(index);
    raw.pcie_tx = library_->pcie_tx_throughput(index);
    raw.pcie_rx = library_->pcie_rx_throughput(index);

    raw.scale.power = MILLIWATTS_TO_WATTS;
    raw.scale.throughput = KILOBYTES_TO_MEGABYTES;
    return raw;
}

}  // namespace gpu_telemetry
