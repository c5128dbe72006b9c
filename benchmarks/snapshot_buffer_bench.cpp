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

/**
 * @file snapshot_buffer_bench.cpp
 * @brief Cost of the per-tick hot path: normalize, append, and reader copies
 */

#include <benchmark/benchmark.h>
#include <gpu_telemetry/core/metric_normalizer.h>
#include <gpu_telemetry/utils/time_series_buffer.h>

#include <chrono>

using namespace gpu_telemetry;

namespace {

raw_reading filesystem_reading() {
    raw_reading raw;
    raw.utilization = raw_field::of(45.0);
    raw.memory_used = raw_field::of(1073741824.0);
    raw.memory_total = raw_field::of(8589934592.0);
    raw.temperature = raw_field::of(65000.0);
    raw.power = raw_field::of(150000000.0);
    raw.fan_rpm = raw_field::failed(field_status::unsupported);
    raw.fan_duty = raw_field::of(128.0);
    raw.scale.temperature = 1e-3;
    raw.scale.power = 1e-6;
    raw.scale.clock = 1e-6;
    raw.scale.fan_duty = 100.0 / 255.0;
    return raw;
}

void fill(snapshot_buffer& buffer, size_t count) {
    auto base = std::chrono::steady_clock::now();
    for (size_t i = 0; i < count; ++i) {
        metric_snapshot snap;
        snap.timestamp = base + std::chrono::milliseconds(i);
        snap.utilization_percent = static_cast<double>(i % 100);
        static_cast<void>(buffer.append(snap));
    }
}

}  // namespace

//-----------------------------------------------------------------------------
// Normalization
//-----------------------------------------------------------------------------

static void BM_Normalize(benchmark::State& state) {
    raw_reading raw = filesystem_reading();
    auto now = std::chrono::steady_clock::now();

    for (auto _ : state) {
        auto snap = metric_normalizer::normalize(raw, now);
        benchmark::DoNotOptimize(snap);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetLabel("normalize");
}
BENCHMARK(BM_Normalize);

//-----------------------------------------------------------------------------
// Buffer append / read
//-----------------------------------------------------------------------------

static void BM_BufferAppend(benchmark::State& state) {
    snapshot_buffer_config config;
    config.max_samples = static_cast<size_t>(state.range(0));
    snapshot_buffer buffer(config);

    auto timestamp = std::chrono::steady_clock::now();
    metric_snapshot snap;

    for (auto _ : state) {
        timestamp += std::chrono::microseconds(1);
        snap.timestamp = timestamp;
        auto result = buffer.append(snap);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetLabel("append");
}
BENCHMARK(BM_BufferAppend)->Arg(300)->Arg(3600);

static void BM_BufferSnapshot(benchmark::State& state) {
    snapshot_buffer_config config;
    config.max_samples = static_cast<size_t>(state.range(0));
    snapshot_buffer buffer(config);
    fill(buffer, config.max_samples);

    for (auto _ : state) {
        auto samples = buffer.snapshot();
        benchmark::DoNotOptimize(samples.data());
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
    state.SetLabel("snapshot");
}
BENCHMARK(BM_BufferSnapshot)->Arg(300)->Arg(3600);

static void BM_BufferStatistics(benchmark::State& state) {
    snapshot_buffer_config config;
    config.max_samples = 300;
    snapshot_buffer buffer(config);
    fill(buffer, config.max_samples);

    for (auto _ : state) {
        auto stats = buffer.statistics(metric_kind::utilization_percent);
        benchmark::DoNotOptimize(stats);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetLabel("statistics");
}
BENCHMARK(BM_BufferStatistics);
