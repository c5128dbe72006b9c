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


#include <gpu_telemetry/gpu_monitor.h>

#include <new>
#include <stdexcept>
#include <utility>

namespace gpu_telemetry {
namespace {

polling_config validated(const polling_config& config) {
    auto validation = config.validate();
    if (validation.is_err()) {
        throw std::invalid_argument("Invalid polling configuration: " +
                                    validation.error().message);
    }
    return config;
}

}  // anonymous namespace

gpu_monitor::gpu_monitor(const polling_config& config, logger_ptr logger)
    : config_(validated(config)), logger_(std::move(logger)) {
    vendor_detector detector(config_, logger_);
    build(detector);
}

gpu_monitor::gpu_monitor(const polling_config& config, vendor_detector& detector,
                         logger_ptr logger)
    : config_(validated(config)), logger_(std::move(logger)) {
    build(detector);
}

gpu_monitor::~gpu_monitor() {
    if (scheduler_) {
        auto stopped = scheduler_->stop();
        static_cast<void>(stopped);
    }
}

void gpu_monitor::build(vendor_detector& detector) {
    detected_ = detector.detect();
    devices_ = detected_.devices();
    store_ = std::make_unique<telemetry_store>(devices_, config_.retained_samples);
    scheduler_ = std::make_unique<sampling_scheduler>(targets_of(detected_), *store_,
                                                      config_.interval, logger_);
}

result<std::unique_ptr<gpu_monitor>> gpu_monitor::create(const config_map& raw,
                                                         logger_ptr logger) {
    auto config = polling_config::from_map(raw);
    if (config.is_err()) {
        return common::Result<std::unique_ptr<gpu_monitor>>::err(config.error());
    }

    try {
        return make_success(std::make_unique<gpu_monitor>(config.value(), std::move(logger)));
    } catch (const std::bad_alloc& e) {
        return make_error_with_context<std::unique_ptr<gpu_monitor>>(
            telemetry_error_code::storage_allocation_failed,
            "Sample buffers could not be allocated", e.what());
    } catch (const std::invalid_argument& e) {
        return make_error_with_context<std::unique_ptr<gpu_monitor>>(
            telemetry_error_code::invalid_configuration, "Monitor construction failed",
            e.what());
    }
}

result<std::vector<metric_snapshot>> gpu_monitor::snapshot(const std::string& device_id) const {
    return store_->snapshot(device_id);
}

result<metric_snapshot> gpu_monitor::latest(const std::string& device_id) const {
    return store_->latest(device_id);
}

result<time_series_statistics> gpu_monitor::statistics(const std::string& device_id,
                                                       metric_kind kind) const {
    return store_->statistics(device_id, kind);
}

result_void gpu_monitor::start() {
    return scheduler_->start();
}

result_void gpu_monitor::stop() {
    return scheduler_->stop();
}

result_void gpu_monitor::run_once() {
    return scheduler_->run_once();
}

scheduler_state gpu_monitor::state() const {
    return scheduler_->state();
}

}  // namespace gpu_telemetry
