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
 * @file native_management_backend.h
 * @brief Vendor backend driven by a binary management library (NVML)
 */

#include "management_library.h"
#include "vendor_backend.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace gpu_telemetry {

/**
 * @brief Produces the management library on init()
 *
 * The default factory loads NVML from the configured path; tests inject a
 * factory returning a fake library or a load error.
 */
using library_factory = std::function<result<std::unique_ptr<management_library>>()>;

/**
 * @brief Factory loading libnvidia-ml from @p path (empty for the default sonames)
 */
library_factory make_nvml_factory(const std::string& path);

/**
 * @class native_management_backend
 * @brief Handle-based enumeration and per-metric queries through management_library
 *
 * Devices are identified as "nvml<index>". Power is reported in milliwatts
 * and scaled to watts by the normalizer. The library exposes fan duty, not
 * RPM, so fan_rpm is always unsupported for this backend.
 */
class native_management_backend : public vendor_backend {
public:
    explicit native_management_backend(library_factory factory);
    ~native_management_backend() override = default;

    auto name() const -> std::string_view override { return "nvml"; }
    auto vendor() const -> gpu_vendor_tag override { return gpu_vendor_tag::native_managed; }

    /**
     * @return backend_unavailable when the library cannot be loaded or
     *         refuses to initialize; the detail travels in the error context
     */
    auto init() -> result_void override;
    auto enumerate() const -> std::vector<gpu_device> override { return devices_; }
    auto poll(const gpu_device& device) -> raw_reading override;
    auto is_available() const -> bool override { return library_ != nullptr; }

private:
    library_factory factory_;
    std::unique_ptr<management_library> library_;
    std::vector<gpu_device> devices_;
};

}  // namespace gpu_telemetry
