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


#include <gpu_telemetry/backends/sysfs_backend.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace gpu_telemetry {
namespace {

namespace fs = std::filesystem;

constexpr double MILLI = 1e-3;
constexpr double MICRO = 1e-6;
constexpr double HZ_TO_MHZ = 1e-6;
constexpr double PWM_TO_PERCENT = 100.0 / 255.0;
constexpr const char* UNKNOWN_VBIOS = "N/A";

// Per-lane transfer rate in GT/s of each PCIe generation
constexpr double PCIE_GENERATION_RATES[] = {2.5, 5.0, 8.0, 16.0, 32.0, 64.0};

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

/**
 * Read the first line of a sysfs file
 * @return Trimmed content or empty string on failure
 */
std::string read_sysfs_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return "";
    }
    std::string content;
    std::getline(file, content);
    return trim(content);
}

/**
 * Strip the 0x prefix of a PCI id node ("0x1002" -> "1002")
 */
std::string read_pci_id(const fs::path& path) {
    std::string id = read_sysfs_file(path);
    if (id.size() > 2 && id[0] == '0' && (id[1] == 'x' || id[1] == 'X')) {
        id = id.substr(2);
    }
    for (auto& c : id) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return id;
}

/**
 * Parse the numeric suffix of "cardN"; -1 when the name is not a card node
 */
long card_number(const std::string& name) {
    if (name.rfind("card", 0) != 0 || name.size() == 4) {
        return -1;
    }
    long number = 0;
    for (size_t i = 4; i < name.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(name[i]))) {
            return -1;
        }
        number = number * 10 + (name[i] - '0');
    }
    return number;
}

/**
 * Find the hwmon directory of a GPU device, lowest hwmonN first
 */
fs::path find_hwmon_path(const fs::path& device_dir) {
    std::error_code ec;
    fs::path hwmon_base = device_dir / "hwmon";
    if (!fs::is_directory(hwmon_base, ec)) {
        return {};
    }

    std::vector<fs::path> candidates;
    for (fs::directory_iterator it(hwmon_base, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name.rfind("hwmon", 0) == 0 && it->is_directory(ec)) {
            candidates.push_back(it->path());
        }
    }
    if (candidates.empty()) {
        return {};
    }
    std::sort(candidates.begin(), candidates.end());
    return candidates.front();
}

/**
 * Map a current_link_speed node ("8.0 GT/s PCIe") to its PCIe generation
 * @return 0 when the content is missing or not a known rate
 */
uint32_t pcie_generation_of(const std::string& link_speed) {
    if (link_speed.empty()) {
        return 0;
    }
    double rate = 0.0;
    try {
        rate = std::stod(link_speed);
    } catch (const std::exception&) {
        return 0;
    }
    uint32_t generation = 0;
    for (double known : PCIE_GENERATION_RATES) {
        ++generation;
        if (std::abs(rate - known) < 0.05) {
            return generation;
        }
    }
    return 0;
}

uint32_t read_link_width(const fs::path& path) {
    raw_field width = read_numeric_node(path);
    if (!width.supported() || *width.value < 1.0 || *width.value > 64.0) {
        return 0;
    }
    return static_cast<uint32_t>(*width.value);
}

raw_field read_hwmon(const fs::path& hwmon, const char* node) {
    if (hwmon.empty()) {
        return raw_field::failed(field_status::unsupported);
    }
    return read_numeric_node(hwmon / node);
}

}  // anonymous namespace

field_status open_failure_status(int error_number) {
    if (error_number == EACCES || error_number == EPERM) {
        return field_status::permission_denied;
    }
    return field_status::unsupported;
}

raw_field read_numeric_node(const std::filesystem::path& path) {
    errno = 0;
    std::ifstream file(path);
    if (!file.is_open()) {
        return raw_field::failed(open_failure_status(errno));
    }

    std::stringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        return raw_field::failed(field_status::unsupported);
    }

    std::string text = trim(content.str());
    if (text.empty()) {
        return raw_field::failed(field_status::parse_error);
    }

    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            return raw_field::failed(field_status::parse_error);
        }
        return raw_field::of(value);
    } catch (const std::exception&) {
        return raw_field::failed(field_status::parse_error);
    }
}

sysfs_backend::sysfs_backend(std::filesystem::path sysfs_root, std::string driver_name)
    : root_(std::move(sysfs_root)), driver_name_(std::move(driver_name)) {}

auto sysfs_backend::drm_path() const -> std::filesystem::path {
    return root_ / "class" / "drm";
}

auto sysfs_backend::init() -> result_void {
    std::error_code ec;
    if (!fs::is_directory(drm_path(), ec)) {
        return make_void_error(telemetry_error_code::backend_unavailable,
                               "DRM sysfs directory not found", drm_path().string());
    }
    devices_ = discover();
    initialized_ = true;
    return make_void_success();
}

auto sysfs_backend::bound_driver(const std::filesystem::path& device_dir) const -> std::string {
    std::error_code ec;
    fs::path link = fs::read_symlink(device_dir / "driver", ec);
    if (!ec && !link.empty()) {
        return link.filename().string();
    }

    std::ifstream uevent(device_dir / "uevent");
    std::string line;
    while (std::getline(uevent, line)) {
        if (line.rfind("DRIVER=", 0) == 0) {
            return trim(line.substr(7));
        }
    }
    return "";
}

auto sysfs_backend::discover() const -> std::vector<gpu_device> {
    std::vector<std::pair<long, fs::path>> cards;

    std::error_code ec;
    for (fs::directory_iterator it(drm_path(), ec), end; !ec && it != end; it.increment(ec)) {
        // Match card0, card1, etc. but not card0-DP-1 connectors
        long number = card_number(it->path().filename().string());
        if (number >= 0) {
            cards.emplace_back(number, it->path());
        }
    }
    std::sort(cards.begin(), cards.end());

    std::vector<gpu_device> devices;
    for (const auto& [number, card_path] : cards) {
        fs::path device_dir = card_path / "device";
        if (bound_driver(device_dir) != driver_name_) {
            continue;
        }

        gpu_device info;
        info.id = card_path.filename().string();
        info.vendor = gpu_vendor_tag::filesystem_exposed;
        info.index = static_cast<uint32_t>(number);
        info.device_path = device_dir.string();

        info.name = read_sysfs_file(device_dir / "product_name");
        if (info.name.empty()) {
            std::string vendor_id = read_pci_id(device_dir / "vendor");
            std::string device_id = read_pci_id(device_dir / "device");
            info.name = (vendor_id.empty() || device_id.empty())
                            ? "AMD GPU"
                            : "AMD GPU [" + vendor_id + ":" + device_id + "]";
        }

        info.driver_version = read_sysfs_file(device_dir / "driver" / "module" / "version");

        info.vbios_version = read_sysfs_file(device_dir / "vbios_version");
        if (info.vbios_version.empty()) {
            info.vbios_version = UNKNOWN_VBIOS;
        }
        info.pcie_gen = pcie_generation_of(read_sysfs_file(device_dir / "current_link_speed"));
        info.pcie_width = read_link_width(device_dir / "current_link_width");
        devices.push_back(std::move(info));
    }
    return devices;
}

auto sysfs_backend::poll(const gpu_device& device) -> raw_reading {
    raw_reading raw;
    raw.scale.temperature = MILLI;
    raw.scale.power = MICRO;
    raw.scale.clock = HZ_TO_MHZ;
    raw.scale.fan_duty = PWM_TO_PERCENT;

    if (device.device_path.empty()) {
        return raw;
    }

    const fs::path device_dir(device.device_path);
    raw.utilization = read_numeric_node(device_dir / "gpu_busy_percent");
    raw.memory_used = read_numeric_node(device_dir / "mem_info_vram_used");
    raw.memory_total = read_numeric_node(device_dir / "mem_info_vram_total");

    const fs::path hwmon = find_hwmon_path(device_dir);
    raw.temperature = read_hwmon(hwmon, "temp1_input");

    raw.power = read_hwmon(hwmon, "power1_average");
    if (!raw.power.supported()) {
        raw_field fallback = read_hwmon(hwmon, "power1_input");
        if (fallback.supported() || raw.power.status == field_status::unsupported) {
            raw.power = fallback;
        }
    }

    raw.fan_rpm = read_hwmon(hwmon, "fan1_input");
    raw.fan_duty = read_hwmon(hwmon, "pwm1");
    raw.power_limit = read_hwmon(hwmon, "power1_cap");
    raw.graphics_clock = read_hwmon(hwmon, "freq1_input");
    raw.memory_clock = read_hwmon(hwmon, "freq2_input");

    // amdgpu exposes no PCIe throughput counters
    raw.pcie_tx = raw_field::failed(field_status::unsupported);
    raw.pcie_rx = raw_field::failed(field_status::unsupported);
    return raw;
}

}  // namespace gpu_telemetry
