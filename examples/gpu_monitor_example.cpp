/**
 * @file gpu_monitor_example.cpp
 * @brief Poll every detected GPU for a few seconds and print the results
 *
 * Usage:
 *   ./gpu_monitor_example [interval_ms] [duration_s]
 *
 * GPU_TELEMETRY_NVML_PATH selects a specific NVIDIA management library.
 */

#include <gpu_telemetry/gpu_monitor.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace gpu_telemetry;
using namespace common::interfaces;

/**
 * @brief Simple logger implementation for demonstration
 */
class simple_console_logger : public ILogger {
private:
    log_level min_level_ = log_level::info;
    std::atomic<size_t> log_count_{0};

public:
    explicit simple_console_logger(log_level min = log_level::info)
        : min_level_(min) {}

    common::VoidResult log(log_level level, const std::string& message) override {
        if (!is_enabled(level)) {
            return common::ok();
        }

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);

        std::tm tm_buf;
        localtime_r(&time, &tm_buf);

        std::cout << "[" << std::put_time(&tm_buf, "%H:%M:%S")
                  << "] [" << to_string(level) << "] "
                  << message << std::endl;

        log_count_++;
        return common::ok();
    }

    common::VoidResult log(log_level level, const std::string& message,
                          const std::string& file, int line, const std::string& function) override {
        return log(level, message + " [" + file + ":" + std::to_string(line) + " " + function + "]");
    }

    common::VoidResult log(const log_entry& entry) override {
        return log(entry.level, entry.message, entry.file, entry.line, entry.function);
    }

    bool is_enabled(log_level level) const override {
        return static_cast<int>(level) >= static_cast<int>(min_level_);
    }

    common::VoidResult set_level(log_level level) override {
        min_level_ = level;
        return common::ok();
    }

    log_level get_level() const override {
        return min_level_;
    }

    common::VoidResult flush() override {
        std::cout << std::flush;
        return common::ok();
    }
};

void print_latest(const gpu_monitor& monitor, const gpu_device& device) {
    auto latest = monitor.latest(device.id);
    if (latest.is_err()) {
        std::cout << "  no samples: " << latest.error().message << std::endl;
        return;
    }

    const auto& snap = latest.value();
    std::cout << std::fixed << std::setprecision(1);
    std::cout << "  utilization: " << snap.utilization_percent << " %" << std::endl;
    std::cout << "  memory:      " << snap.memory_used_bytes / (1024 * 1024) << " / "
              << snap.memory_total_bytes / (1024 * 1024) << " MiB" << std::endl;
    std::cout << "  temperature: " << snap.temperature_celsius << " C" << std::endl;
    std::cout << "  power:       " << snap.power_watts << " W (limit "
              << snap.power_limit_watts << " W)" << std::endl;
    std::cout << "  fan:         " << snap.fan_rpm << " RPM, " << snap.fan_percent << " %"
              << std::endl;
    std::cout << "  clocks:      " << snap.graphics_clock_mhz << " / "
              << snap.memory_clock_mhz << " MHz" << std::endl;
    std::cout << "  pcie:        tx " << snap.pcie_tx_mbps << " MB/s, rx "
              << snap.pcie_rx_mbps << " MB/s" << std::endl;
}

void print_statistics(const gpu_monitor& monitor, const gpu_device& device) {
    for (auto kind : {metric_kind::utilization_percent, metric_kind::temperature_celsius,
                      metric_kind::power_watts}) {
        auto stats = monitor.statistics(device.id, kind);
        if (stats.is_err()) {
            continue;
        }
        const auto& s = stats.value();
        std::cout << "  " << std::left << std::setw(28) << metric_kind_to_string(kind)
                  << " min=" << s.min_value << " avg=" << s.avg << " max=" << s.max_value
                  << " p95=" << s.p95 << " (n=" << s.sample_count << ")" << std::endl;
    }
}

int main(int argc, char** argv) {
    std::string interval = argc > 1 ? argv[1] : "500";
    int duration_s = argc > 2 ? std::atoi(argv[2]) : 3;

    auto logger = std::make_shared<simple_console_logger>(log_level::info);

    config_map config = {
        {"interval_ms", interval},
        {"retained_samples", "120"},
        {"vendor", "auto"},
        {"detection", "all_available"},
    };

    auto created = gpu_monitor::create(config, logger);
    if (created.is_err()) {
        auto code = error_code_of(created);
        std::cerr << "Failed to create monitor: " << created.error().message << std::endl;
        std::cerr << "  " << get_error_details(code) << std::endl;
        return 1;
    }
    auto monitor = std::move(created.value());

    std::cout << "\n=== Detection ===" << std::endl;
    std::cout << "presence: " << device_presence_to_string(monitor->presence()) << std::endl;
    for (const auto& reason : monitor->detection_reasons()) {
        std::cout << "  reason: " << reason << std::endl;
    }
    for (const auto& device : monitor->devices()) {
        std::cout << "  " << device.id << " [" << vendor_tag_to_string(device.vendor) << "] "
                  << device.name;
        if (!device.driver_version.empty()) {
            std::cout << " (driver " << device.driver_version << ")";
        }
        std::cout << " vbios " << device.vbios_version;
        if (device.pcie_gen > 0) {
            std::cout << " PCIe gen" << device.pcie_gen << " x" << device.pcie_width;
        }
        std::cout << std::endl;
    }

    if (monitor->devices().empty()) {
        std::cout << "Nothing to poll." << std::endl;
        return 0;
    }

    auto started = monitor->start();
    if (started.is_err()) {
        std::cerr << "Failed to start sampling: " << started.error().message << std::endl;
        return 1;
    }

    std::cout << "scheduler: " << scheduler_state_to_string(monitor->state()) << std::endl;
    std::this_thread::sleep_for(std::chrono::seconds(duration_s));

    auto stopped = monitor->stop();
    if (stopped.is_err()) {
        std::cerr << "Failed to stop sampling: " << stopped.error().message << std::endl;
    }
    std::cout << "scheduler: " << scheduler_state_to_string(monitor->state()) << std::endl;

    for (const auto& device : monitor->devices()) {
        std::cout << "\n=== " << device.id << " ===" << std::endl;
        print_latest(*monitor, device);
        print_statistics(*monitor, device);
    }

    return 0;
}
