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
 * @file error_codes.h
 * @brief GPU telemetry specific error codes
 *
 * This file defines the error codes used throughout the telemetry core,
 * following the pattern established by the other kcenon systems.
 */

#include <cstdint>
#include <string>

namespace gpu_telemetry {

/**
 * @enum telemetry_error_code
 * @brief Error codes for detection, acquisition and polling operations
 */
enum class telemetry_error_code : std::uint32_t {
    // Success
    success = 0,

    // Detection errors (1000-1999)
    device_not_found = 1000,
    backend_unavailable = 1001,
    backend_init_failed = 1002,
    library_not_found = 1003,
    symbol_not_found = 1004,

    // Acquisition errors (2000-2999)
    sensor_unavailable = 2000,
    permission_denied = 2001,
    parse_error = 2002,
    query_failed = 2003,

    // Configuration errors (3000-3999)
    invalid_configuration = 3000,
    invalid_interval = 3001,
    invalid_capacity = 3002,
    invalid_vendor = 3003,

    // Lifecycle errors (4000-4999)
    already_started = 4000,
    already_stopped = 4001,

    // Storage errors (5000-5999)
    storage_empty = 5000,
    out_of_order_sample = 5001,
    unknown_device = 5002,
    storage_allocation_failed = 5003,

    // Unknown error
    unknown_error = 9999
};

/**
 * @brief Convert error code to string representation
 * @param code The error code to convert
 * @return String representation of the error code
 */
inline std::string error_code_to_string(telemetry_error_code code) {
    switch (code) {
        case telemetry_error_code::success:
            return "Success";

        // Detection errors
        case telemetry_error_code::device_not_found:
            return "Device not found";
        case telemetry_error_code::backend_unavailable:
            return "Backend unavailable";
        case telemetry_error_code::backend_init_failed:
            return "Backend initialization failed";
        case telemetry_error_code::library_not_found:
            return "Management library not found";
        case telemetry_error_code::symbol_not_found:
            return "Management library symbol not found";

        // Acquisition errors
        case telemetry_error_code::sensor_unavailable:
            return "Sensor unavailable";
        case telemetry_error_code::permission_denied:
            return "Permission denied";
        case telemetry_error_code::parse_error:
            return "Parse error";
        case telemetry_error_code::query_failed:
            return "Query failed";

        // Configuration errors
        case telemetry_error_code::invalid_configuration:
            return "Invalid configuration";
        case telemetry_error_code::invalid_interval:
            return "Invalid interval";
        case telemetry_error_code::invalid_capacity:
            return "Invalid capacity";
        case telemetry_error_code::invalid_vendor:
            return "Invalid vendor override";

        // Lifecycle errors
        case telemetry_error_code::already_started:
            return "Already started";
        case telemetry_error_code::already_stopped:
            return "Already stopped";

        // Storage errors
        case telemetry_error_code::storage_empty:
            return "Storage is empty";
        case telemetry_error_code::out_of_order_sample:
            return "Sample timestamp is not newer than the latest sample";
        case telemetry_error_code::unknown_device:
            return "Unknown device";
        case telemetry_error_code::storage_allocation_failed:
            return "Storage allocation failed";

        // Unknown error
        case telemetry_error_code::unknown_error:
        default:
            return "Unknown error";
    }
}

/**
 * @brief Get detailed error message
 * @param code The error code
 * @return Detailed error message with suggestions
 */
inline std::string get_error_details(telemetry_error_code code) {
    switch (code) {
        case telemetry_error_code::device_not_found:
            return "No supported GPU was detected. Check that a driver is loaded.";
        case telemetry_error_code::backend_unavailable:
            return "The telemetry backend could not be used. Another backend may still be selected.";
        case telemetry_error_code::library_not_found:
            return "The vendor management library could not be loaded. Install the driver "
                   "or set GPU_TELEMETRY_NVML_PATH.";
        case telemetry_error_code::permission_denied:
            return "A telemetry node is not readable by this process.";
        case telemetry_error_code::invalid_configuration:
            return "Configuration validation failed. Review configuration parameters and constraints.";
        case telemetry_error_code::storage_allocation_failed:
            return "Sample buffers could not be allocated. Lower retained_samples.";
        default:
            return error_code_to_string(code);
    }
}

} // namespace gpu_telemetry
