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
 * @file telemetry_store.h
 * @brief Per-device snapshot buffers
 *
 * The set of devices is fixed at construction, so the map itself is never
 * modified afterwards and lookups need no lock. Each buffer guards its own
 * ring.
 */

#include "../utils/time_series_buffer.h"
#include "result_types.h"
#include "telemetry_types.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace gpu_telemetry {

class telemetry_store {
public:
    /**
     * @param devices Devices to create a buffer for
     * @param capacity Samples retained per device
     * @throws std::invalid_argument if capacity is 0 or a device id repeats
     */
    telemetry_store(const std::vector<gpu_device>& devices, size_t capacity);

    telemetry_store(const telemetry_store&) = delete;
    telemetry_store& operator=(const telemetry_store&) = delete;

    /**
     * @brief Append a snapshot to a device's buffer
     * @return unknown_device, or the buffer's out_of_order_sample
     */
    result_void append(const std::string& device_id, const metric_snapshot& snapshot);

    /**
     * @brief Copy of a device's retained window, oldest first
     */
    result<std::vector<metric_snapshot>> snapshot(const std::string& device_id) const;

    result<metric_snapshot> latest(const std::string& device_id) const;

    result<time_series_statistics> statistics(const std::string& device_id,
                                              metric_kind kind) const;

    /**
     * @brief Direct access to a device's buffer, nullptr for unknown ids
     */
    const snapshot_buffer* buffer(const std::string& device_id) const;

    std::vector<std::string> device_ids() const;
    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    std::map<std::string, std::unique_ptr<snapshot_buffer>> buffers_;
};

}  // namespace gpu_telemetry
