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
 * @file telemetry_types.h
 * @brief Device, raw reading and canonical snapshot types
 *
 * Backends produce raw_reading values in their native units. The
 * metric_normalizer turns them into metric_snapshot values, which are the
 * only records stored in the time series buffers.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gpu_telemetry {

/**
 * @enum gpu_vendor_tag
 * @brief Acquisition mechanism family of a device
 */
enum class gpu_vendor_tag {
    native_managed,     ///< Queried through a binary management library (NVML)
    filesystem_exposed  ///< Read from kernel filesystem nodes (amdgpu sysfs)
};

/**
 * @brief Convert gpu_vendor_tag to string representation
 */
inline std::string vendor_tag_to_string(gpu_vendor_tag tag) {
    switch (tag) {
        case gpu_vendor_tag::native_managed:
            return "native";
        case gpu_vendor_tag::filesystem_exposed:
            return "filesystem";
        default:
            return "unknown";
    }
}

/**
 * @struct gpu_device
 * @brief Information about a detected GPU device
 */
struct gpu_device {
    std::string id;              ///< Unique device identifier (e.g., "nvml0", "card1")
    gpu_vendor_tag vendor{gpu_vendor_tag::filesystem_exposed};
    std::string name;            ///< Human-readable device name
    uint32_t index{0};           ///< Backend-local device index
    std::string device_path;     ///< sysfs device directory, empty for NVML devices
    std::string uuid;            ///< Vendor UUID when exposed
    std::string driver_version;  ///< Driver version string when exposed
    std::string vbios_version;   ///< Video BIOS version, "N/A" when not exposed
    uint32_t pcie_gen{0};        ///< Current PCIe link generation, 0 when unknown
    uint32_t pcie_width{0};      ///< Current PCIe link width (lanes), 0 when unknown

    bool operator==(const gpu_device& other) const {
        return id == other.id && vendor == other.vendor && name == other.name &&
               index == other.index && device_path == other.device_path &&
               uuid == other.uuid && driver_version == other.driver_version &&
               vbios_version == other.vbios_version && pcie_gen == other.pcie_gen &&
               pcie_width == other.pcie_width;
    }
};

/**
 * @enum field_status
 * @brief Why a raw field does or does not carry a value
 */
enum class field_status {
    ok,                 ///< Value present
    unsupported,        ///< Sensor not exposed by hardware or driver
    permission_denied,  ///< Node exists but is not readable
    parse_error,        ///< Node content is not a number
    query_failed        ///< Management library call failed
};

/**
 * @brief Convert field_status to string representation
 */
inline std::string field_status_to_string(field_status status) {
    switch (status) {
        case field_status::ok:
            return "ok";
        case field_status::unsupported:
            return "unsupported";
        case field_status::permission_denied:
            return "permission_denied";
        case field_status::parse_error:
            return "parse_error";
        case field_status::query_failed:
            return "query_failed";
        default:
            return "unknown";
    }
}

/**
 * @struct raw_field
 * @brief One vendor-native reading, or the reason it is missing
 */
struct raw_field {
    std::optional<double> value;
    field_status status{field_status::unsupported};

    static raw_field of(double v) { return raw_field{v, field_status::ok}; }
    static raw_field failed(field_status s) { return raw_field{std::nullopt, s}; }

    bool supported() const { return value.has_value(); }
};

/**
 * @struct unit_scale
 * @brief Multipliers converting vendor-native units to canonical units
 */
struct unit_scale {
    double temperature{1.0};  ///< to degrees Celsius
    double power{1.0};        ///< to watts
    double memory{1.0};       ///< to bytes
    double clock{1.0};        ///< to MHz
    double fan_duty{1.0};     ///< to percent
    double throughput{1.0};   ///< to megabytes per second
};

/**
 * @struct raw_reading
 * @brief Vendor-specific bag of optional numeric fields
 */
struct raw_reading {
    raw_field utilization;
    raw_field memory_used;
    raw_field memory_total;
    raw_field temperature;
    raw_field power;
    raw_field fan_rpm;

    raw_field fan_duty;
    raw_field power_limit;
    raw_field graphics_clock;
    raw_field memory_clock;
    raw_field pcie_tx;
    raw_field pcie_rx;

    unit_scale scale;
};

/**
 * @enum metric_kind
 * @brief Scalar series available in a metric_snapshot
 */
enum class metric_kind {
    utilization_percent,
    memory_used_bytes,
    memory_total_bytes,
    temperature_celsius,
    power_watts,
    fan_rpm,
    fan_percent,
    power_limit_watts,
    graphics_clock_mhz,
    memory_clock_mhz,
    pcie_tx_mbps,
    pcie_rx_mbps
};

/**
 * @brief Convert metric_kind to its metric name
 */
inline std::string metric_kind_to_string(metric_kind kind) {
    switch (kind) {
        case metric_kind::utilization_percent:
            return "gpu_utilization_percent";
        case metric_kind::memory_used_bytes:
            return "gpu_memory_used_bytes";
        case metric_kind::memory_total_bytes:
            return "gpu_memory_total_bytes";
        case metric_kind::temperature_celsius:
            return "gpu_temperature_celsius";
        case metric_kind::power_watts:
            return "gpu_power_watts";
        case metric_kind::fan_rpm:
            return "gpu_fan_rpm";
        case metric_kind::fan_percent:
            return "gpu_fan_speed_percent";
        case metric_kind::power_limit_watts:
            return "gpu_power_limit_watts";
        case metric_kind::graphics_clock_mhz:
            return "gpu_clock_mhz";
        case metric_kind::memory_clock_mhz:
            return "gpu_memory_clock_mhz";
        case metric_kind::pcie_tx_mbps:
            return "gpu_pcie_tx_megabytes_per_second";
        case metric_kind::pcie_rx_mbps:
            return "gpu_pcie_rx_megabytes_per_second";
        default:
            return "unknown";
    }
}

/**
 * @struct metric_snapshot
 * @brief One fully normalized reading of all metrics of one device
 *
 * Every field is finite and non-negative. Unsupported sensors read 0.
 */
struct metric_snapshot {
    std::chrono::steady_clock::time_point timestamp;

    double utilization_percent{0.0};  ///< GPU compute utilization (0-100)
    uint64_t memory_used_bytes{0};    ///< VRAM currently used
    uint64_t memory_total_bytes{0};   ///< Total VRAM capacity
    double temperature_celsius{0.0};  ///< GPU temperature
    double power_watts{0.0};          ///< Current power draw
    double fan_rpm{0.0};              ///< Fan speed in RPM

    double fan_percent{0.0};          ///< Fan duty (0-100)
    double power_limit_watts{0.0};    ///< Power limit/cap
    double graphics_clock_mhz{0.0};   ///< Current graphics clock
    double memory_clock_mhz{0.0};     ///< Current memory clock
    double pcie_tx_mbps{0.0};         ///< PCIe transmit throughput in MB/s
    double pcie_rx_mbps{0.0};         ///< PCIe receive throughput in MB/s

    /**
     * @brief Read one scalar series out of the snapshot
     */
    double value_of(metric_kind kind) const {
        switch (kind) {
            case metric_kind::utilization_percent:
                return utilization_percent;
            case metric_kind::memory_used_bytes:
                return static_cast<double>(memory_used_bytes);
            case metric_kind::memory_total_bytes:
                return static_cast<double>(memory_total_bytes);
            case metric_kind::temperature_celsius:
                return temperature_celsius;
            case metric_kind::power_watts:
                return power_watts;
            case metric_kind::fan_rpm:
                return fan_rpm;
            case metric_kind::fan_percent:
                return fan_percent;
            case metric_kind::power_limit_watts:
                return power_limit_watts;
            case metric_kind::graphics_clock_mhz:
                return graphics_clock_mhz;
            case metric_kind::memory_clock_mhz:
                return memory_clock_mhz;
            case metric_kind::pcie_tx_mbps:
                return pcie_tx_mbps;
            case metric_kind::pcie_rx_mbps:
                return pcie_rx_mbps;
            default:
                return 0.0;
        }
    }
};

/**
 * @enum device_presence
 * @brief System-level hardware state exposed to the presentation layer
 *
 * Distinguishes "no hardware" from "hardware present but idle".
 */
enum class device_presence {
    detected,             ///< At least one device is being polled
    no_gpu_detected,      ///< No backend found any device
    backend_unavailable   ///< The forced backend could not be used
};

/**
 * @brief Convert device_presence to string representation
 */
inline std::string device_presence_to_string(device_presence presence) {
    switch (presence) {
        case device_presence::detected:
            return "detected";
        case device_presence::no_gpu_detected:
            return "no_gpu_detected";
        case device_presence::backend_unavailable:
            return "backend_unavailable";
        default:
            return "unknown";
    }
}

}  // namespace gpu_telemetry
