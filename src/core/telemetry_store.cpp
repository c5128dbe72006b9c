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


#include <gpu_telemetry/core/telemetry_store.h>

#include <stdexcept>

namespace gpu_telemetry {

telemetry_store::telemetry_store(const std::vector<gpu_device>& devices, size_t capacity)
    : capacity_(capacity) {
    snapshot_buffer_config config;
    config.max_samples = capacity;

    for (const auto& device : devices) {
        auto [it, inserted] =
            buffers_.emplace(device.id, std::make_unique<snapshot_buffer>(config));
        if (!inserted) {
            throw std::invalid_argument("Duplicate device id in telemetry_store: " + device.id);
        }
    }

    // An empty store still rejects a zero capacity
    if (devices.empty()) {
        auto validation = config.validate();
        if (validation.is_err()) {
            throw std::invalid_argument("Invalid telemetry_store configuration: " +
                                        validation.error().message);
        }
    }
}

const snapshot_buffer* telemetry_store::buffer(const std::string& device_id) const {
    auto it = buffers_.find(device_id);
    return it == buffers_.end() ? nullptr : it->second.get();
}

result_void telemetry_store::append(const std::string& device_id,
                                    const metric_snapshot& snapshot) {
    auto it = buffers_.find(device_id);
    if (it == buffers_.end()) {
        return make_void_error(telemetry_error_code::unknown_device, "", device_id);
    }
    return it->second->append(snapshot);
}

result<std::vector<metric_snapshot>> telemetry_store::snapshot(
    const std::string& device_id) const {
    const auto* buf = buffer(device_id);
    if (!buf) {
        return make_error_with_context<std::vector<metric_snapshot>>(
            telemetry_error_code::unknown_device, "No buffer for device", device_id);
    }
    return make_success(buf->snapshot());
}

result<metric_snapshot> telemetry_store::latest(const std::string& device_id) const {
    const auto* buf = buffer(device_id);
    if (!buf) {
        return make_error_with_context<metric_snapshot>(
            telemetry_error_code::unknown_device, "No buffer for device", device_id);
    }
    return buf->latest();
}

result<time_series_statistics> telemetry_store::statistics(const std::string& device_id,
                                                           metric_kind kind) const {
    const auto* buf = buffer(device_id);
    if (!buf) {
        return make_error_with_context<time_series_statistics>(
            telemetry_error_code::unknown_device, "No buffer for device", device_id);
    }
    return make_success(buf->statistics(kind));
}

std::vector<std::string> telemetry_store::device_ids() const {
    std::vector<std::string> ids;
    ids.reserve(buffers_.size());
    for (const auto& [id, buf] : buffers_) {
        ids.push_back(id);
    }
    return ids;
}

}  // namespace gpu_telemetry
