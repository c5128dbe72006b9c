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
 * @file metric_normalizer.h
 * @brief Conversion of raw backend readings into canonical snapshots
 *
 * Zero-fallback lives here and only here: every field that a backend could
 * not read becomes 0, every supported field is scaled to its canonical unit
 * and clamped to its valid range.
 *
 * Usage:
 * @code
 * raw_reading raw = backend.poll(device);
 * metric_snapshot snap = metric_normalizer::normalize(raw, std::chrono::steady_clock::now());
 * @endcode
 */

#include "telemetry_types.h"

#include <chrono>

namespace gpu_telemetry {

class metric_normalizer {
   public:
    /**
     * @brief Normalize a raw reading
     * @param raw Reading in vendor-native units
     * @param timestamp Monotonic timestamp to stamp the snapshot with
     * @return Fully populated snapshot
     */
    static metric_snapshot normalize(const raw_reading& raw,
                                     std::chrono::steady_clock::time_point timestamp);

    /**
     * @brief Collapse an optional reading to a finite, non-negative value
     * @param field The raw field
     * @param scale Multiplier to the canonical unit
     * @return Scaled value, or 0 when unsupported, negative or not finite
     */
    static double value_or_zero(const raw_field& field, double scale = 1.0);

    /**
     * @brief Same as value_or_zero, additionally capped at @p upper
     */
    static double clamped(const raw_field& field, double scale, double upper);
};

}  // namespace gpu_telemetry
