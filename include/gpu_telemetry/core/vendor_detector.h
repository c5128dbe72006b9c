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
 * @file vendor_detector.h
 * @brief Startup selection of usable vendor backends
 *
 * Probing order is fixed: the native management backend first, the
 * filesystem backend second. A backend is usable when init() succeeds and
 * it reports at least one device. Finding nothing is not an error; the
 * result then carries device_presence::no_gpu_detected.
 *
 * Usage:
 * @code
 * vendor_detector detector(config, logger);
 * detection_result found = detector.detect();
 * for (const auto& device : found.devices()) { ... }
 * @endcode
 */

#include "../backends/vendor_backend.h"
#include "../config/polling_config.h"
#include "logging.h"
#include "telemetry_types.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace gpu_telemetry {

/**
 * @struct detected_backend
 * @brief A usable backend together with the devices it discovered
 */
struct detected_backend {
    std::shared_ptr<vendor_backend> backend;
    std::vector<gpu_device> devices;
};

/**
 * @struct detection_result
 * @brief Outcome of vendor detection
 */
struct detection_result {
    std::vector<detected_backend> backends;  ///< Usable backends, native first
    device_presence presence{device_presence::no_gpu_detected};
    std::vector<std::string> reasons;        ///< Why tried backends were skipped

    /**
     * @brief All detected devices in backend order
     */
    std::vector<gpu_device> devices() const;

    bool empty() const { return backends.empty(); }
};

/**
 * @class vendor_detector
 * @brief Selects vendor backends according to a polling_config
 */
class vendor_detector {
public:
    using backend_factory = std::function<std::unique_ptr<vendor_backend>()>;

    /**
     * @brief Detector building the production NVML and sysfs backends
     */
    explicit vendor_detector(const polling_config& config, logger_ptr logger = nullptr);

    /**
     * @brief Detector with injected backend factories
     * @param native Builds the native management backend (may be empty)
     * @param filesystem Builds the filesystem backend (may be empty)
     */
    vendor_detector(const polling_config& config, backend_factory native,
                    backend_factory filesystem, logger_ptr logger = nullptr);

    /**
     * @brief Try backends in order; deterministic for a fixed topology
     */
    detection_result detect();

private:
    bool try_backend(const backend_factory& factory, const char* label, detection_result& out);

    polling_config config_;
    backend_factory native_factory_;
    backend_factory filesystem_factory_;
    logger_ptr logger_;
};

}  // namespace gpu_telemetry
