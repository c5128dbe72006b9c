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
 * @file time_series_buffer.h
 * @brief Fixed-capacity, thread-safe ring buffer of metric snapshots
 *
 * One writer (the sampling scheduler) appends, any number of readers copy
 * out ordered snapshots. A single mutex guards the ring, so a reader never
 * sees a snapshot that is only partially written.
 */

#include "../core/error_codes.h"
#include "../core/result_types.h"
#include "../core/telemetry_types.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace gpu_telemetry {

/**
 * @struct snapshot_buffer_config
 * @brief Configuration for snapshot buffer
 */
struct snapshot_buffer_config {
    size_t max_samples = 300;

    result_void validate() const {
        if (max_samples == 0) {
            return make_void_error(telemetry_error_code::invalid_capacity,
                                   "Max samples must be positive");
        }
        return make_void_success();
    }
};

/**
 * @struct time_series_statistics
 * @brief Statistics calculated over one metric of the retained window
 */
struct time_series_statistics {
    double min_value = (std::numeric_limits<double>::max)();
    double max_value = (std::numeric_limits<double>::lowest)();
    double avg = 0.0;
    double stddev = 0.0;
    double p95 = 0.0;
    double p99 = 0.0;
    size_t sample_count = 0;
    std::chrono::steady_clock::time_point oldest_timestamp;
    std::chrono::steady_clock::time_point newest_timestamp;
};

/**
 * @namespace detail
 * @brief Internal implementation details - not part of public API
 * @internal
 */
namespace detail {

/**
 * @brief Calculate percentile from sorted values
 * @param sorted_values Pre-sorted vector of values
 * @param percentile Percentile to calculate (0-100)
 * @return Calculated percentile value
 * @internal
 */
inline double calculate_percentile(const std::vector<double>& sorted_values,
                                   double percentile) {
    if (sorted_values.empty()) {
        return 0.0;
    }
    if (sorted_values.size() == 1) {
        return sorted_values[0];
    }

    double rank = (percentile / 100.0) * (sorted_values.size() - 1);
    size_t lower_idx = static_cast<size_t>(rank);
    size_t upper_idx = lower_idx + 1;
    double fraction = rank - lower_idx;

    if (upper_idx >= sorted_values.size()) {
        return sorted_values[lower_idx];
    }

    return sorted_values[lower_idx] +
           fraction * (sorted_values[upper_idx] - sorted_values[lower_idx]);
}

/**
 * @brief Calculate ring buffer actual index from logical index
 * @param logical_index Logical index (0 to count-1)
 * @param head Next write position
 * @param count Current element count
 * @param capacity Buffer capacity
 * @return Actual index in buffer
 * @internal
 */
inline size_t ring_buffer_index(size_t logical_index, size_t head,
                                size_t count, size_t capacity) noexcept {
    if (count < capacity) {
        return logical_index;
    }
    return (head + logical_index) % capacity;
}

/**
 * @brief Calculate basic statistics from a vector of double values
 * @internal
 */
inline time_series_statistics calculate_basic_statistics(
    const std::vector<double>& values,
    std::chrono::steady_clock::time_point oldest_timestamp,
    std::chrono::steady_clock::time_point newest_timestamp) {

    time_series_statistics stats;
    stats.sample_count = values.size();

    if (values.empty()) {
        stats.min_value = 0.0;
        stats.max_value = 0.0;
        return stats;
    }

    stats.oldest_timestamp = oldest_timestamp;
    stats.newest_timestamp = newest_timestamp;

    double sum = 0.0;
    for (double val : values) {
        sum += val;
        stats.min_value = (std::min)(stats.min_value, val);
        stats.max_value = (std::max)(stats.max_value, val);
    }
    stats.avg = sum / values.size();

    double variance = 0.0;
    for (double val : values) {
        double diff = val - stats.avg;
        variance += diff * diff;
    }
    stats.stddev = std::sqrt(variance / values.size());

    std::vector<double> sorted_values = values;
    std::sort(sorted_values.begin(), sorted_values.end());
    stats.p95 = calculate_percentile(sorted_values, 95.0);
    stats.p99 = calculate_percentile(sorted_values, 99.0);

    return stats;
}

}  // namespace detail

/**
 * @class snapshot_buffer
 * @brief Thread-safe ring buffer of metric_snapshot with statistics
 *
 * Timestamps are strictly increasing: append() rejects a snapshot that is
 * not newer than the newest one already stored, so the ring is always in
 * time order and readers never need to sort.
 */
class snapshot_buffer {
  private:
    mutable std::mutex mutex_;
    std::vector<metric_snapshot> buffer_;
    size_t head_ = 0;
    size_t count_ = 0;
    snapshot_buffer_config config_;

    size_t get_actual_index(size_t logical_index) const noexcept {
        return detail::ring_buffer_index(logical_index, head_, count_, config_.max_samples);
    }

    size_t latest_index() const noexcept {
        return (head_ == 0) ? config_.max_samples - 1 : head_ - 1;
    }

  public:
    explicit snapshot_buffer(const snapshot_buffer_config& config = {}) : config_(config) {
        auto validation = config_.validate();
        if (validation.is_err()) {
            throw std::invalid_argument("Invalid snapshot_buffer configuration: " +
                                        validation.error().message);
        }
        buffer_.resize(config_.max_samples);
    }

    snapshot_buffer(const snapshot_buffer&) = delete;
    snapshot_buffer& operator=(const snapshot_buffer&) = delete;
    snapshot_buffer(snapshot_buffer&&) = delete;
    snapshot_buffer& operator=(snapshot_buffer&&) = delete;

    /**
     * @brief Append a snapshot, evicting the oldest one when full
     * @param snapshot Fully normalized snapshot
     * @return Error out_of_order_sample if the timestamp is not strictly newer
     */
    result_void append(const metric_snapshot& snapshot) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (count_ > 0 && snapshot.timestamp <= buffer_[latest_index()].timestamp) {
            return make_void_error(telemetry_error_code::out_of_order_sample);
        }

        buffer_[head_] = snapshot;
        head_ = (head_ + 1) % config_.max_samples;

        if (count_ < config_.max_samples) {
            ++count_;
        }
        return make_void_success();
    }

    /**
     * @brief Get all retained snapshots, oldest first
     */
    std::vector<metric_snapshot> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<metric_snapshot> result;
        result.reserve(count_);

        for (size_t i = 0; i < count_; ++i) {
            result.push_back(buffer_[get_actual_index(i)]);
        }
        return result;
    }

    /**
     * @brief Get snapshots taken at or after a specific time, oldest first
     */
    std::vector<metric_snapshot> snapshot_since(
        std::chrono::steady_clock::time_point since) const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<metric_snapshot> result;
        result.reserve(count_);

        for (size_t i = 0; i < count_; ++i) {
            const auto& sample = buffer_[get_actual_index(i)];
            if (sample.timestamp >= since) {
                result.push_back(sample);
            }
        }
        return result;
    }

    /**
     * @brief Get snapshots within a duration from now
     */
    template <typename Duration>
    std::vector<metric_snapshot> snapshot_within(Duration duration) const {
        return snapshot_since(std::chrono::steady_clock::now() - duration);
    }

    /**
     * @brief Get the newest snapshot
     * @return Result containing the newest snapshot or storage_empty
     */
    result<metric_snapshot> latest() const {
        std::lock_guard<std::mutex> lock(mutex_);

        if (count_ == 0) {
            return make_error<metric_snapshot>(telemetry_error_code::storage_empty,
                                               "No samples available");
        }
        return make_success(buffer_[latest_index()]);
    }

    /**
     * @brief Get statistics for one metric over the retained window
     */
    time_series_statistics statistics(metric_kind kind) const {
        return calculate_statistics(snapshot(), kind);
    }

    size_t size() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

    bool empty() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_ == 0;
    }

    size_t capacity() const noexcept { return config_.max_samples; }

    void clear() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        head_ = 0;
        count_ = 0;
    }

    size_t memory_footprint() const noexcept {
        return sizeof(snapshot_buffer) + config_.max_samples * sizeof(metric_snapshot);
    }

  private:
    static time_series_statistics calculate_statistics(
        const std::vector<metric_snapshot>& samples, metric_kind kind) {
        if (samples.empty()) {
            time_series_statistics stats;
            stats.sample_count = 0;
            stats.min_value = 0.0;
            stats.max_value = 0.0;
            return stats;
        }

        std::vector<double> values;
        values.reserve(samples.size());
        for (const auto& sample : samples) {
            values.push_back(sample.value_of(kind));
        }

        return detail::calculate_basic_statistics(
            values,
            samples.front().timestamp,
            samples.back().timestamp);
    }
};

}  // namespace gpu_telemetry
