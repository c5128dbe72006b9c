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


#include <gpu_telemetry/core/sampling_scheduler.h>

#include <gpu_telemetry/config/polling_config.h>
#include <gpu_telemetry/core/metric_normalizer.h>
#include <gpu_telemetry/core/vendor_detector.h>

#include <exception>
#include <stdexcept>
#include <utility>

namespace gpu_telemetry {
namespace {

std::array<field_status, 12> statuses_of(const raw_reading& raw) {
    return {raw.utilization.status,  raw.memory_used.status, raw.memory_total.status,
            raw.temperature.status,  raw.power.status,       raw.fan_rpm.status,
            raw.fan_duty.status,     raw.power_limit.status, raw.graphics_clock.status,
            raw.memory_clock.status, raw.pcie_tx.status,     raw.pcie_rx.status};
}

}  // anonymous namespace

std::string scheduler_state_to_string(scheduler_state state) {
    switch (state) {
        case scheduler_state::idle:
            return "idle";
        case scheduler_state::running:
            return "running";
        case scheduler_state::stopping:
            return "stopping";
        case scheduler_state::stopped:
            return "stopped";
        default:
            return "unknown";
    }
}

std::vector<poll_target> targets_of(const detection_result& detected) {
    std::vector<poll_target> targets;
    for (const auto& entry : detected.backends) {
        for (const auto& device : entry.devices) {
            targets.push_back(poll_target{entry.backend, device});
        }
    }
    return targets;
}

sampling_scheduler::sampling_scheduler(std::vector<poll_target> targets, telemetry_store& store,
                                       std::chrono::milliseconds interval, logger_ptr logger)
    : targets_(std::move(targets)),
      store_(store),
      interval_(interval),
      logger_(std::move(logger)) {
    if (interval_.count() <= 0) {
        throw std::invalid_argument("Sampling interval must be positive");
    }
    if (interval_ > MAX_POLLING_INTERVAL) {
        throw std::invalid_argument("Sampling interval exceeds one hour");
    }
}

sampling_scheduler::~sampling_scheduler() {
    auto stopped = stop();
    static_cast<void>(stopped);
}

result_void sampling_scheduler::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    scheduler_state current = state_.load();
    if (current == scheduler_state::running) {
        return make_void_error(telemetry_error_code::already_started,
                               "Sampling scheduler already running");
    }
    if (current != scheduler_state::idle) {
        return make_void_error(telemetry_error_code::already_stopped,
                               "Sampling scheduler cannot be restarted",
                               "state " + scheduler_state_to_string(current));
    }

    state_.store(scheduler_state::running);
    worker_ = std::thread([this]() { run_loop(); });

    log_message(logger_, log_level::info,
                "Sampling started: " + std::to_string(targets_.size()) + " device(s), interval " +
                    std::to_string(interval_.count()) + "ms");
    return make_void_success();
}

result_void sampling_scheduler::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    scheduler_state current = state_.load();
    if (current == scheduler_state::stopped) {
        return make_void_success();
    }
    if (current == scheduler_state::idle) {
        state_.store(scheduler_state::stopped);
        return make_void_success();
    }

    {
        std::unique_lock<std::mutex> lock(cv_mutex_);
        state_.store(scheduler_state::stopping);
        cv_.notify_all();
    }

    if (worker_.joinable()) {
        worker_.join();
    }
    state_.store(scheduler_state::stopped);

    log_message(logger_, log_level::info,
                "Sampling stopped after " + std::to_string(ticks_.load()) + " tick(s)");
    return make_void_success();
}

result_void sampling_scheduler::run_once() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    if (state_.load() == scheduler_state::running) {
        return make_void_error(telemetry_error_code::already_started,
                               "run_once rejected while the polling thread is running");
    }
    tick(false);
    return make_void_success();
}

void sampling_scheduler::run_loop() {
    clock::time_point next_tick = clock::now();

    while (!cancel_requested()) {
        tick(true);
        if (cancel_requested()) {
            break;
        }

        next_tick += interval_;
        clock::time_point now = clock::now();
        if (now > next_tick) {
            auto overrun = std::chrono::duration_cast<std::chrono::milliseconds>(now - next_tick);
            if (now - next_tick > interval_) {
                next_tick = now;
                reanchors_.fetch_add(1);
                log_message(logger_, log_level::debug,
                            "Tick overran by " + std::to_string(overrun.count()) +
                                "ms, schedule re-anchored");
            } else {
                log_message(logger_, log_level::debug,
                            "Tick overran by " + std::to_string(overrun.count()) + "ms");
            }
        }

        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_until(lock, next_tick, [this]() { return cancel_requested(); });
    }
}

void sampling_scheduler::tick(bool cancellable) {
    for (const auto& target : targets_) {
        if (cancellable && cancel_requested()) {
            return;
        }
        poll_device(target);
    }
    ticks_.fetch_add(1);
}

sampling_scheduler::clock::time_point sampling_scheduler::stamp_for(const std::string& device_id) {
    clock::time_point now = clock::now();
    auto it = last_stamp_.find(device_id);
    if (it != last_stamp_.end() && now <= it->second) {
        now = it->second + clock::duration(1);
    }
    last_stamp_[device_id] = now;
    return now;
}

void sampling_scheduler::poll_device(const poll_target& target) {
    const std::string& id = target.device.id;
    metric_snapshot snapshot;

    try {
        raw_reading raw = target.backend->poll(target.device);
        report_transitions(id, raw);
        snapshot = metric_normalizer::normalize(raw, stamp_for(id));
    } catch (const std::exception& e) {
        log_message(logger_, log_level::error,
                    "Polling " + id + " failed: " + e.what() + "; storing zero snapshot");
        snapshot = metric_snapshot{};
        snapshot.timestamp = stamp_for(id);
    } catch (...) {
        log_message(logger_, log_level::error,
                    "Polling " + id + " failed with a non-standard exception; "
                    "storing zero snapshot");
        snapshot = metric_snapshot{};
        snapshot.timestamp = stamp_for(id);
    }

    auto appended = store_.append(id, snapshot);
    if (appended.is_err()) {
        log_message(logger_, log_level::warning,
                    "Snapshot for " + id + " dropped: " + appended.error().message);
    }
}

void sampling_scheduler::report_transitions(const std::string& device_id,
                                            const raw_reading& raw) {
    field_statuses current = statuses_of(raw);

    auto [it, inserted] = last_status_.try_emplace(device_id);
    if (inserted) {
        it->second.fill(field_status::ok);
    }
    field_statuses& previous = it->second;

    for (size_t i = 0; i < FIELD_COUNT; ++i) {
        if (current[i] == previous[i]) {
            continue;
        }
        std::string metric = metric_kind_to_string(static_cast<metric_kind>(i));
        if (current[i] == field_status::ok) {
            log_message(logger_, log_level::debug,
                        device_id + ": " + metric + " readable again");
        } else {
            log_message(logger_, log_level::warning,
                        device_id + ": " + metric + " " + field_status_to_string(current[i]));
        }
        previous[i] = current[i];
    }
}

}  // namespace gpu_telemetry
