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


#pragma once

/**
 * @file management_library.h
 * @brief Binary management interface seam for the native backend
 *
 * native_management_backend talks to the vendor's management library only
 * through this interface. The production implementation is nvml_library,
 * which resolves NVML entry points at run time; tests substitute a fake.
 *
 * All device queries take the library-local device index. Every metric
 * query is independent: a failing call reports its own field_status and
 * leaves the others untouched.
 */

#include "../core/result_types.h"
#include "../core/telemetry_types.h"

#include <cstdint>
#include <string>

namespace gpu_telemetry {

/**
 * @struct memory_reading
 * @brief Used and total framebuffer memory in bytes
 */
struct memory_reading {
    raw_field used;
    raw_field total;
};

class management_library {
public:
    virtual ~management_library() = default;

    /**
     * @brief Initialize the library (nvmlInit)
     * @return backend_init_failed when the library refuses to start
     */
    virtual auto initialize() -> result_void = 0;

    virtual auto device_count() -> result<uint32_t> = 0;
    virtual auto device_name(uint32_t index) -> result<std::string> = 0;
    virtual auto device_uuid(uint32_t index) -> result<std::string> = 0;
    virtual auto driver_version() -> result<std::string> = 0;
    virtual auto vbios_version(uint32_t index) -> result<std::string> = 0;
    virtual auto pcie_link_generation(uint32_t index) -> result<uint32_t> = 0;
    virtual auto pcie_link_width(uint32_t index) -> result<uint32_t> = 0;

    /// GPU utilization, percent
    virtual auto utilization(uint32_t index) -> raw_field = 0;
    /// Framebuffer memory, bytes
    virtual auto memory(uint32_t index) -> memory_reading = 0;
    /// Core temperature, degrees Celsius
    virtual auto temperature(uint32_t index) -> raw_field = 0;
    /// Power draw, milliwatts
    virtual auto power_usage(uint32_t index) -> raw_field = 0;
    /// Power management limit, milliwatts
    virtual auto power_limit(uint32_t index) -> raw_field = 0;
    /// Fan 0 duty, percent
    virtual auto fan_speed(uint32_t index) -> raw_field = 0;
    /// Graphics clock, MHz
    virtual auto graphics_clock(uint32_t index) -> raw_field = 0;
    /// Memory clock, MHz
    virtual auto memory_clock(uint32_t index) -> raw_field = 0;
    /// PCIe transmit throughput, KB/s
    virtual auto pcie_tx_throughput(uint32_t index) -> raw_field = 0;
    /// PCIe receive throughput, KB/s
    virtual auto pcie_rx_throughput(uint32_t index) -> raw_field = 0;
};

}  // namespace gpu_telemetry
