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
 * @file sysfs_backend.h
 * @brief Vendor backend reading amdgpu telemetry from DRM sysfs and hwmon
 *
 * Layout read per device (paths relative to <root>/class/drm/cardN):
 *
 * | metric        | node                                     | unit  |
 * |---------------|------------------------------------------|-------|
 * | utilization   | device/gpu_busy_percent                  | %     |
 * | memory        | device/mem_info_vram_used, _vram_total   | bytes |
 * | temperature   | device/hwmon/hwmonN/temp1_input          | m°C   |
 * | power         | hwmonN/power1_average, else power1_input | µW    |
 * | fan           | hwmonN/fan1_input, pwm1                  | RPM, 0-255 |
 * | power cap     | hwmonN/power1_cap                        | µW    |
 * | clocks        | hwmonN/freq1_input, freq2_input          | Hz    |
 *
 * The root is configurable so that tests can point the backend at a
 * simulated tree.
 */

#include "vendor_backend.h"

#include <filesystem>
#include <string>
#include <vector>

namespace gpu_telemetry {

/**
 * @brief Read one numeric sysfs node
 *
 * Content is parsed as a number, optionally surrounded by whitespace or
 * terminated by a newline. Missing nodes are unsupported, unreadable ones
 * permission_denied, anything that is not a number parse_error.
 */
raw_field read_numeric_node(const std::filesystem::path& path);

/**
 * @brief Map the errno of a failed node open to a field_status
 *
 * EACCES and EPERM are permission_denied; every other error means the
 * node is unsupported.
 */
field_status open_failure_status(int error_number);

/**
 * @class sysfs_backend
 * @brief Filesystem-exposed telemetry for one kernel driver
 *
 * Devices are the cardN entries of <root>/class/drm whose bound driver
 * (device/driver symlink, else DRIVER= in device/uevent) equals the
 * configured driver name, in ascending card order.
 */
class sysfs_backend : public vendor_backend {
public:
    sysfs_backend(std::filesystem::path sysfs_root, std::string driver_name);
    ~sysfs_backend() override = default;

    auto name() const -> std::string_view override { return "sysfs"; }
    auto vendor() const -> gpu_vendor_tag override { return gpu_vendor_tag::filesystem_exposed; }

    /**
     * @return backend_unavailable when <root>/class/drm does not exist
     */
    auto init() -> result_void override;
    auto enumerate() const -> std::vector<gpu_device> override { return devices_; }
    auto poll(const gpu_device& device) -> raw_reading override;
    auto is_available() const -> bool override { return initialized_; }

private:
    auto drm_path() const -> std::filesystem::path;
    auto discover() const -> std::vector<gpu_device>;
    auto bound_driver(const std::filesystem::path& device_dir) const -> std::string;

    std::filesystem::path root_;
    std::string driver_name_;
    std::vector<gpu_device> devices_;
    bool initialized_{false};
};

}  // namespace gpu_telemetry
