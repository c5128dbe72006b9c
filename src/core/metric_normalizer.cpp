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

#include <gpu_telemetry/core/metric_normalizer.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace gpu_telemetry {
namespace {

constexpr double PERCENT_MAX = 100.0;

uint64_t to_bytes(double value) {
    // Largest double that still fits into uint64_t
    constexpr double max_bytes = 18446744073709549568.0;
    if (value >= max_bytes) {
        return (std::numeric_limits<uint64_t>::max)();
    }
    return static_cast<uint64_t>(std::llround(value));
}

}  // anonymous namespace

double metric_normalizer::value_or_zero(const raw_field& field, double scale) {
    if (!field.value.has_value()) {
        return 0.0;
    }
    double v = *field.value * scale;
    if (!std::isfinite(v) || v < 0.0) {
        return 0.0;
    }
    return v;
}

double metric_normalizer::clamped(const raw_field& field, double scale, double upper) {
    return (std::min)(value_or_zero(field, scale), upper);
}

metric_snapshot metric_normalizer::normalize(const raw_reading& raw,
                                             std::chrono::steady_clock::time_point timestamp) {
    metric_snapshot snap;
    snap.timestamp = timestamp;

    snap.utilization_percent = clamped(raw.utilization, 1.0, PERCENT_MAX);
    snap.memory_used_bytes = to_bytes(value_or_zero(raw.memory_used, raw.scale.memory));
    snap.memory_total_bytes = to_bytes(value_or_zero(raw.memory_total, raw.scale.memory));
    snap.temperature_celsius = value_or_zero(raw.temperature, raw.scale.temperature);
    snap.power_watts = value_or_zero(raw.power, raw.scale.power);
    snap.fan_rpm = value_or_zero(raw.fan_rpm);

    snap.fan_percent = clamped(raw.fan_duty, raw.scale.fan_duty, PERCENT_MAX);
    snap.power_limit_watts = value_or_zero(raw.power_limit, raw.scale.power);
    snap.graphics_clock_mhz = value_or_zero(raw.graphics_clock, raw.scale.clock);
    snap.memory_clock_mhz = value_or_zero(raw.memory_clock, raw.scale.clock);
    snap.pcie_tx_mbps = value_or_zero(raw.pcie_tx, raw.scale.throughput);
    snap.pcie_rx_mbps = value_or_zero(raw.pcie_rx, raw.scale.throughput);

    return snap;
}

}  // namespace gpu_telemetry
