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


#include <gpu_telemetry/core/vendor_detector.h>

#include <gpu_telemetry/backends/native_management_backend.h>
#include <gpu_telemetry/backends/sysfs_backend.h>

#include <utility>

namespace gpu_telemetry {

std::vector<gpu_device> detection_result::devices() const {
    std::vector<gpu_device> all;
    for (const auto& entry : backends) {
        all.insert(all.end(), entry.devices.begin(), entry.devices.end());
    }
    return all;
}

vendor_detector::vendor_detector(const polling_config& config, logger_ptr logger)
    : config_(config), logger_(std::move(logger)) {
    std::string library_path = config_.resolved_management_library();
    native_factory_ = [library_path]() -> std::unique_ptr<vendor_backend> {
        return std::make_unique<native_management_backend>(make_nvml_factory(library_path));
    };

    std::string root = config_.sysfs_root;
    std::string driver = config_.driver_name;
    filesystem_factory_ = [root, driver]() -> std::unique_ptr<vendor_backend> {
        return std::make_unique<sysfs_backend>(root, driver);
    };
}

vendor_detector::vendor_detector(const polling_config& config, backend_factory native,
                                 backend_factory filesystem, logger_ptr logger)
    : config_(config),
      native_factory_(std::move(native)),
      filesystem_factory_(std::move(filesystem)),
      logger_(std::move(logger)) {}

bool vendor_detector::try_backend(const backend_factory& factory, const char* label,
                                  detection_result& out) {
    if (!factory) {
        out.reasons.push_back(std::string(label) + ": not configured");
        return false;
    }

    std::shared_ptr<vendor_backend> backend = factory();
    if (!backend) {
        out.reasons.push_back(std::string(label) + ": not constructed");
        return false;
    }

    auto init_result = backend->init();
    if (init_result.is_err()) {
        std::string reason = std::string(label) + ": " + init_result.error().message;
        if (init_result.error().details) {
            reason += " (" + *init_result.error().details + ")";
        }
        log_message(logger_, log_level::warning, "Backend unavailable - " + reason);
        out.reasons.push_back(std::move(reason));
        return false;
    }

    auto devices = backend->enumerate();
    if (devices.empty()) {
        std::string reason = std::string(label) + ": no devices";
        log_message(logger_, log_level::info, "Backend reported no devices - " + reason);
        out.reasons.push_back(std::move(reason));
        return false;
    }

    out.backends.push_back(detected_backend{std::move(backend), std::move(devices)});
    return true;
}

detection_result vendor_detector::detect() {
    detection_result result;

    switch (config_.vendor) {
        case backend_choice::native:
            try_backend(native_factory_, "native", result);
            break;
        case backend_choice::filesystem:
            try_backend(filesystem_factory_, "filesystem", result);
            break;
        case backend_choice::auto_detect:
        default: {
            bool found_native = try_backend(native_factory_, "native", result);
            if (!found_native || config_.detection == detection_policy::all_available) {
                try_backend(filesystem_factory_, "filesystem", result);
            }
            break;
        }
    }

    if (!result.backends.empty()) {
        result.presence = device_presence::detected;
    } else if (config_.vendor != backend_choice::auto_detect) {
        result.presence = device_presence::backend_unavailable;
    } else {
        result.presence = device_presence::no_gpu_detected;
    }

    std::string summary = "GPU detection (vendor=" + backend_choice_to_string(config_.vendor) +
                          ", policy=" + detection_policy_to_string(config_.detection) +
                          "): " + device_presence_to_string(result.presence);
    for (const auto& entry : result.backends) {
        summary += ", " + std::string(entry.backend->name()) + "=" +
                   std::to_string(entry.devices.size()) + " device(s)";
    }
    log_message(logger_, log_level::info, summary);

    return result;
}

}  // namespace gpu_telemetry
