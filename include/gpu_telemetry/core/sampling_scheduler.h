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
 * @file sampling_scheduler.h
 * @brief Periodic poll, normalize and store cycle on a dedicated thread
 *
 * Lifecycle: idle -> running -> stopping -> stopped. A stopped scheduler
 * cannot be restarted; build a new one instead.
 *
 * Each tick polls every target sequentially, normalizes the reading and
 * appends it to the device's buffer. Ticks are scheduled on an absolute
 * timeline (next_tick += interval). When a tick overruns by more than one
 * interval the timeline is re-anchored to the current time instead of
 * bursting to catch up.
 *
 * Usage:
 * @code
 * sampling_scheduler scheduler(targets_of(detected), store, std::chrono::seconds(1), logger);
 * scheduler.start();
 * ...
 * scheduler.stop();
 * @endcode
 */

#include "../backends/vendor_backend.h"
#include "logging.h"
#include "result_types.h"
#include "telemetry_store.h"
#include "telemetry_types.h"

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace gpu_telemetry {

struct detection_result;

/**
 * @enum scheduler_state
 */
enum class scheduler_state {
    idle,
    running,
    stopping,
    stopped
};

std::string scheduler_state_to_string(scheduler_state state);

/**
 * @struct poll_target
 * @brief One device and the backend that polls it
 */
struct poll_target {
    std::shared_ptr<vendor_backend> backend;
    gpu_device device;
};

/**
 * @brief Flatten a detection result into poll targets, in detection order
 */
std::vector<poll_target> targets_of(const detection_result& detected);

class sampling_scheduler {
public:
    using clock = std::chrono::steady_clock;

    /**
     * @param targets Devices to poll each tick
     * @param store Destination buffers; must outlive the scheduler
     * @param interval Tick period
     * @param logger Optional logger
     * @throws std::invalid_argument if interval is not positive or exceeds
     *         MAX_POLLING_INTERVAL
     */
    sampling_scheduler(std::vector<poll_target> targets, telemetry_store& store,
                       std::chrono::milliseconds interval, logger_ptr logger = nullptr);

    /**
     * @brief Stops and joins the polling thread if still running
     */
    ~sampling_scheduler();

    sampling_scheduler(const sampling_scheduler&) = delete;
    sampling_scheduler& operator=(const sampling_scheduler&) = delete;
    sampling_scheduler(sampling_scheduler&&) = delete;
    sampling_scheduler& operator=(sampling_scheduler&&) = delete;

    /**
     * @brief Spawn the polling thread; the first tick runs immediately
     * @return already_started if running, already_stopped after stop()
     */
    result_void start();

    /**
     * @brief Request cancellation and join the polling thread
     *
     * Returns within one interval plus the duration of the poll in flight.
     * Stopping an idle or stopped scheduler succeeds.
     */
    result_void stop();

    /**
     * @brief Run a single tick on the calling thread
     * @return already_started while the polling thread is running
     */
    result_void run_once();

    scheduler_state state() const { return state_.load(); }
    bool is_running() const { return state_.load() == scheduler_state::running; }

    std::chrono::milliseconds interval() const { return interval_; }

    /// Completed ticks, including run_once() calls
    uint64_t tick_count() const { return ticks_.load(); }

    /// Ticks whose timeline was re-anchored after an overrun
    uint64_t reanchor_count() const { return reanchors_.load(); }

private:
    static constexpr size_t FIELD_COUNT = 12;
    using field_statuses = std::array<field_status, FIELD_COUNT>;

    void run_loop();
    void tick(bool cancellable);
    void poll_device(const poll_target& target);
    void report_transitions(const std::string& device_id, const raw_reading& raw);
    clock::time_point stamp_for(const std::string& device_id);
    bool cancel_requested() const { return state_.load() != scheduler_state::running; }

    std::vector<poll_target> targets_;
    telemetry_store& store_;
    std::chrono::milliseconds interval_;
    logger_ptr logger_;

    std::atomic<scheduler_state> state_{scheduler_state::idle};
    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> reanchors_{0};

    std::mutex lifecycle_mutex_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    std::thread worker_;

    // Touched only by the thread currently executing a tick
    std::map<std::string, field_statuses> last_status_;
    std::map<std::string, clock::time_point> last_stamp_;
};

}  // namespace gpu_telemetry
