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
 * @file nvml_library.h
 * @brief NVML reached through dlopen/dlsym
 *
 * The NVIDIA Management Library is resolved at run time, so the project
 * neither includes nvml.h nor links libnvidia-ml. A machine without the
 * NVIDIA driver simply fails load() and the detector falls back.
 *
 * Usage:
 * @code
 * auto lib = nvml_library::load("");
 * if (lib.is_ok() && lib.value()->initialize().is_ok()) {
 *     auto count = lib.value()->device_count();
 * }
 * @endcode
 */

#include "management_library.h"

#include <memory>
#include <string>
#include <vector>

namespace gpu_telemetry {

/**
 * @class nvml_library
 * @brief management_library backed by libnvidia-ml
 *
 * Owns the dlopen handle. nvmlShutdown() is issued on destruction when
 * initialize() succeeded, before the handle is closed.
 */
class nvml_library : public management_library {
public:
    /**
     * @brief Default sonames tried when no explicit path is configured
     */
    static auto default_candidates() -> std::vector<std::string>;

    /**
     * @brief Open the library and resolve its entry points
     * @param path Explicit library path; empty tries default_candidates()
     * @return library_not_found when nothing could be opened,
     *         symbol_not_found when a mandatory entry point is missing
     */
    static auto load(const std::string& path) -> result<std::unique_ptr<nvml_library>>;

    ~nvml_library() override;

    nvml_library(const nvml_library&) = delete;
    nvml_library& operator=(const nvml_library&) = delete;

    auto initialize() -> result_void override;

    auto device_count() -> result<uint32_t> override;
    auto device_name(uint32_t index) -> result<std::string> override;
    auto device_uuid(uint32_t index) -> result<std::string> override;
    auto driver_version() -> result<std::string> override;
    auto vbios_version(uint32_t index) -> result<std::string> override;
    auto pcie_link_generation(uint32_t index) -> result<uint32_t> override;
    auto pcie_link_width(uint32_t index) -> result<uint32_t> override;

    auto utilization(uint32_t index) -> raw_field override;
    auto memory(uint32_t index) -> memory_reading override;
    auto temperature(uint32_t index) -> raw_field override;
    auto power_usage(uint32_t index) -> raw_field override;
    auto power_limit(uint32_t index) -> raw_field override;
    auto fan_speed(uint32_t index) -> raw_field override;
    auto graphics_clock(uint32_t index) -> raw_field override;
    auto memory_clock(uint32_t index) -> raw_field override;
    auto pcie_tx_throughput(uint32_t index) -> raw_field override;
    auto pcie_rx_throughput(uint32_t index) -> raw_field override;

private:
    struct entry_points;
    using nvml_link_query = int (*)(void*, unsigned int*);

    nvml_library(void* handle, std::unique_ptr<entry_points> api);

    auto device_handle(uint32_t index, void** device) -> bool;
    auto clock(uint32_t index, unsigned int clock_type) -> raw_field;
    auto pcie_throughput(uint32_t index, unsigned int counter) -> raw_field;
    auto link_property(uint32_t index, nvml_link_query query) -> result<uint32_t>;

    void* handle_{nullptr};
    std::unique_ptr<entry_points> api_;
    bool initialized_{false};
};

}  // namespace gpu_telemetry
