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
 * @file gpu_monitor.h
 * @brief Single entry point owned by the presentation layer
 *
 * Construction runs vendor detection once and allocates one buffer per
 * detected device. start() begins periodic sampling; readers call
 * snapshot()/latest()/statistics() from any thread.
 *
 * Usage:
 * @code
 * gpu_monitor monitor(polling_config{}, logger);
 * if (monitor.presence() == device_presence::detected) {
 *     monitor.start();
 *     auto window = monitor.snapshot(monitor.devices().front().id);
 * }
 * @endcode
 */

#include "config/polling_config.h"
#include "core/logging.h"
#include "core/result_types.h"
#include "core/sampling_scheduler.h"
#include "core/telemetry_store.h"
#include "core/telemetry_types.h"
#include "core/vendor_detector.h"

#include <memory>
#include <string>
#include <vector>

namespace gpu_telemetry {

class gpu_monitor {
public:
    /**
     * @brief Detect devices with the production backends
     * @throws std::invalid_argument if @p config does not validate
     */
    explicit gpu_monitor(const polling_config& config, logger_ptr logger = nullptr);

    /**
     * @brief Detect devices with a caller-provided detector
     * @throws std::invalid_argument if @p config does not validate
     */
    gpu_monitor(const polling_config& config, vendor_detector& detector,
                logger_ptr logger = nullptr);

    /**
     * @brief Parse @p raw into a polling_config and build a monitor
     * @return The configuration error, or storage_allocation_failed when the
     *         sample buffers cannot be allocated, instead of throwing
     */
    static result<std::unique_ptr<gpu_monitor>> create(const config_map& raw,
                                                       logger_ptr logger = nullptr);

    ~gpu_monitor();

    gpu_monitor(const gpu_monitor&) = delete;
    gpu_monitor& operator=(const gpu_monitor&) = delete;

    const std::vector<gpu_device>& devices() const { return devices_; }
    device_presence presence() const { return detected_.presence; }
    const std::vector<std::string>& detection_reasons() const { return detected_.reasons; }

    result<std::vector<metric_snapshot>> snapshot(const std::string& device_id) const;
    result<metric_snapshot> latest(const std::string& device_id) const;
    result<time_series_statistics> statistics(const std::string& device_id,
                                              metric_kind kind) const;

    result_void start();
    result_void stop();
    result_void run_once();
    scheduler_state state() const;

    const polling_config& config() const { return config_; }

private:
    void build(vendor_detector& detector);

    polling_config config_;
    logger_ptr logger_;
    detection_result detected_;
    std::vector<gpu_device> devices_;
    std::unique_ptr<telemetry_store> store_;
    std::unique_ptr<sampling_scheduler> scheduler_;
};

}  // namespace gpu_telemetry
