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
 * @file polling_config.h
 * @brief Polling engine configuration
 *
 * Usage:
 * @code
 * config_map raw = {{"interval_ms", "500"}, {"vendor", "filesystem"}};
 * auto cfg = polling_config::from_map(raw);
 * if (cfg.is_ok()) {
 *     gpu_monitor monitor(cfg.value());
 * }
 * @endcode
 */

#include "../core/result_types.h"
#include "../utils/config_parser.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace gpu_telemetry {

/// Environment variable overriding the management library path
inline constexpr const char* NVML_PATH_ENV = "GPU_TELEMETRY_NVML_PATH";

/// Longest accepted polling interval
inline constexpr std::chrono::milliseconds MAX_POLLING_INTERVAL = std::chrono::hours(1);

/// Largest accepted per-device history; buffers are allocated up front
inline constexpr size_t MAX_RETAINED_SAMPLES = 100000;

/**
 * @enum backend_choice
 * @brief Forced backend selection
 */
enum class backend_choice {
    auto_detect,
    native,
    filesystem
};

std::string backend_choice_to_string(backend_choice choice);

/**
 * @enum detection_policy
 * @brief How many usable backends the detector keeps
 */
enum class detection_policy {
    first_available,  ///< Stop at the first backend that reports devices
    all_available     ///< Keep every backend that reports devices, native first
};

std::string detection_policy_to_string(detection_policy policy);

/**
 * @struct polling_config
 * @brief Settings for detection, sampling cadence and retention
 */
struct polling_config {
    std::chrono::milliseconds interval{1000};
    size_t retained_samples{300};
    backend_choice vendor{backend_choice::auto_detect};
    detection_policy detection{detection_policy::first_available};

    std::string sysfs_root{"/sys"};
    std::string driver_name{"amdgpu"};

    /// Explicit management library path; empty means the default search list
    std::string management_library;

    /**
     * @brief Validate configuration
     * @return invalid_interval when interval is outside (0, MAX_POLLING_INTERVAL],
     *         invalid_capacity when retained_samples is outside [1, MAX_RETAINED_SAMPLES],
     *         invalid_configuration for an empty sysfs root or driver name
     */
    result_void validate() const;

    /**
     * @brief Build a configuration from string key/value pairs
     *
     * Unknown keys are ignored. Unparseable numbers fall back to defaults,
     * an unknown vendor or detection value is an error.
     */
    static result<polling_config> from_map(const config_map& config);

    /**
     * @brief Management library path after applying GPU_TELEMETRY_NVML_PATH
     */
    std::string resolved_management_library() const;
};

}  // namespace gpu_telemetry
