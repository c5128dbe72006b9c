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


#include <gpu_telemetry/config/polling_config.h>

#include <cstdlib>
#include <string>

namespace gpu_telemetry {

std::string backend_choice_to_string(backend_choice choice) {
    switch (choice) {
        case backend_choice::auto_detect:
            return "auto";
        case backend_choice::native:
            return "native";
        case backend_choice::filesystem:
            return "filesystem";
        default:
            return "unknown";
    }
}

std::string detection_policy_to_string(detection_policy policy) {
    switch (policy) {
        case detection_policy::first_available:
            return "first_available";
        case detection_policy::all_available:
            return "all_available";
        default:
            return "unknown";
    }
}

result_void polling_config::validate() const {
    if (interval.count() <= 0) {
        return make_void_error(telemetry_error_code::invalid_interval,
                               "Polling interval must be positive");
    }
    if (interval > MAX_POLLING_INTERVAL) {
        return make_void_error(telemetry_error_code::invalid_interval,
                               "Polling interval exceeds one hour",
                               std::to_string(interval.count()) + "ms");
    }
    if (retained_samples == 0) {
        return make_void_error(telemetry_error_code::invalid_capacity,
                               "Retained sample count must be positive");
    }
    if (retained_samples > MAX_RETAINED_SAMPLES) {
        return make_void_error(telemetry_error_code::invalid_capacity,
                               "Retained sample count exceeds " +
                                   std::to_string(MAX_RETAINED_SAMPLES),
                               std::to_string(retained_samples));
    }
    if (sysfs_root.empty()) {
        return make_void_error(telemetry_error_code::invalid_configuration,
                               "sysfs root must not be empty");
    }
    if (driver_name.empty()) {
        return make_void_error(telemetry_error_code::invalid_configuration,
                               "Driver name must not be empty");
    }
    return make_void_success();
}

result<polling_config> polling_config::from_map(const config_map& config) {
    polling_config cfg;

    cfg.interval = config_parser::get_duration(config, "interval_ms", cfg.interval);
    cfg.retained_samples = config_parser::get<size_t>(config, "retained_samples",
                                                      cfg.retained_samples);
    cfg.sysfs_root = config_parser::get<std::string>(config, "sysfs_root", cfg.sysfs_root);
    cfg.driver_name = config_parser::get<std::string>(config, "driver_name", cfg.driver_name);
    cfg.management_library =
        config_parser::get<std::string>(config, "management_library", cfg.management_library);

    auto vendor = config_parser::get_optional<std::string>(config, "vendor");
    if (vendor) {
        if (*vendor == "auto") {
            cfg.vendor = backend_choice::auto_detect;
        } else if (*vendor == "native" || *vendor == "nvml") {
            cfg.vendor = backend_choice::native;
        } else if (*vendor == "filesystem" || *vendor == "sysfs") {
            cfg.vendor = backend_choice::filesystem;
        } else {
            return make_error_with_context<polling_config>(
                telemetry_error_code::invalid_vendor,
                "Unknown vendor override", *vendor);
        }
    }

    auto detection = config_parser::get_optional<std::string>(config, "detection");
    if (detection) {
        if (*detection == "first_available") {
            cfg.detection = detection_policy::first_available;
        } else if (*detection == "all_available") {
            cfg.detection = detection_policy::all_available;
        } else {
            return make_error_with_context<polling_config>(
                telemetry_error_code::invalid_configuration,
                "Unknown detection policy", *detection);
        }
    }

    auto validation = cfg.validate();
    if (validation.is_err()) {
        return common::Result<polling_config>::err(validation.error());
    }
    return make_success(std::move(cfg));
}

std::string polling_config::resolved_management_library() const {
    if (const char* env = std::getenv(NVML_PATH_ENV); env != nullptr && *env != '\0') {
        return env;
    }
    return management_library;
}

}  // namespace gpu_telemetry
