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
 * @file vendor_backend.h
 * @brief Polymorphic interface implemented by every GPU vendor backend
 *
 * A backend owns one acquisition mechanism (a management library or a
 * kernel filesystem tree). The detector initializes it once, reads its
 * device list, and the sampling scheduler polls it from a single thread.
 *
 * Usage:
 * @code
 * sysfs_backend backend("/sys", "amdgpu");
 * if (backend.init().is_ok()) {
 *     for (const auto& device : backend.enumerate()) {
 *         raw_reading raw = backend.poll(device);
 *     }
 * }
 * @endcode
 */

#include "../core/result_types.h"
#include "../core/telemetry_types.h"

#include <string_view>
#include <vector>

namespace gpu_telemetry {

/**
 * @class vendor_backend
 * @brief Pure virtual interface for GPU telemetry acquisition
 *
 * Thread Safety:
 * - init() and enumerate() are called once, from the detecting thread
 * - poll() is called only from the polling thread, never concurrently
 *
 * Lifecycle:
 * 1. Construction
 * 2. init(), which enumerates and caches the device set
 * 3. Periodic poll() calls for each cached device
 * 4. Destruction releases every handle the backend acquired
 */
class vendor_backend {
public:
    virtual ~vendor_backend() = default;

    /**
     * @brief Short backend name used in logs ("nvml", "sysfs")
     */
    virtual auto name() const -> std::string_view = 0;

    /**
     * @brief Vendor family of every device this backend reports
     */
    virtual auto vendor() const -> gpu_vendor_tag = 0;

    /**
     * @brief Acquire the backend's resources and discover devices
     * @return backend_unavailable when the mechanism cannot be used at all
     *
     * A backend that initializes but finds no device returns success with
     * an empty enumerate() list.
     */
    virtual auto init() -> result_void = 0;

    /**
     * @brief Devices discovered by init(), in deterministic order
     */
    virtual auto enumerate() const -> std::vector<gpu_device> = 0;

    /**
     * @brief Read every metric of one device in vendor-native units
     *
     * Never fails as a whole: each field carries its own field_status.
     */
    virtual auto poll(const gpu_device& device) -> raw_reading = 0;

    /**
     * @brief Whether init() succeeded
     */
    virtual auto is_available() const -> bool = 0;
};

}  // namespace gpu_telemetry
