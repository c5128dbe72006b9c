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


#include <gpu_telemetry/backends/nvml_library.h>

#include <dlfcn.h>

#include <sstream>
#include <utility>

namespace gpu_telemetry {
namespace {

// Subset of nvml.h, declared locally because the header is not required
// at build time.
using nvmlReturn_t = int;
using nvmlDevice_t = void*;

constexpr nvmlReturn_t NVML_SUCCESS = 0;
constexpr nvmlReturn_t NVML_ERROR_NOT_SUPPORTED = 3;
constexpr unsigned int NVML_TEMPERATURE_GPU = 0;
constexpr unsigned int NVML_CLOCK_GRAPHICS = 0;
constexpr unsigned int NVML_CLOCK_MEM = 2;
constexpr unsigned int NVML_PCIE_UTIL_TX_BYTES = 0;
constexpr unsigned int NVML_PCIE_UTIL_RX_BYTES = 1;

constexpr unsigned int NVML_DEVICE_NAME_BUFFER_SIZE = 96;
constexpr unsigned int NVML_DEVICE_UUID_BUFFER_SIZE = 80;
constexpr unsigned int NVML_DRIVER_VERSION_BUFFER_SIZE = 80;
constexpr unsigned int NVML_DEVICE_VBIOS_VERSION_BUFFER_SIZE = 32;

struct nvmlMemory_t {
    unsigned long long total;
    unsigned long long free;
    unsigned long long used;
};

struct nvmlUtilization_t {
    unsigned int gpu;
    unsigned int memory;
};

field_status status_of(nvmlReturn_t ret) {
    return ret == NVML_ERROR_NOT_SUPPORTED ? field_status::unsupported
                                           : field_status::query_failed;
}

template <typename T>
T resolve_symbol(void* handle, const char* symbol_name) {
    // Clear any previous error
    dlerror();
    void* symbol = dlsym(handle, symbol_name);
    if (dlerror() != nullptr) {
        return nullptr;
    }
    return reinterpret_cast<T>(symbol);
}

}  // anonymous namespace

struct nvml_library::entry_points {
    nvmlReturn_t (*init)() = nullptr;
    nvmlReturn_t (*shutdown)() = nullptr;
    nvmlReturn_t (*get_count)(unsigned int*) = nullptr;
    nvmlReturn_t (*get_handle_by_index)(unsigned int, nvmlDevice_t*) = nullptr;

    nvmlReturn_t (*get_name)(nvmlDevice_t, char*, unsigned int) = nullptr;
    nvmlReturn_t (*get_uuid)(nvmlDevice_t, char*, unsigned int) = nullptr;
    nvmlReturn_t (*get_driver_version)(char*, unsigned int) = nullptr;
    nvmlReturn_t (*get_utilization)(nvmlDevice_t, nvmlUtilization_t*) = nullptr;
    nvmlReturn_t (*get_memory)(nvmlDevice_t, nvmlMemory_t*) = nullptr;
    nvmlReturn_t (*get_temperature)(nvmlDevice_t, unsigned int, unsigned int*) = nullptr;
    nvmlReturn_t (*get_power_usage)(nvmlDevice_t, unsigned int*) = nullptr;
    nvmlReturn_t (*get_power_limit)(nvmlDevice_t, unsigned int*) = nullptr;
    nvmlReturn_t (*get_fan_speed)(nvmlDevice_t, unsigned int, unsigned int*) = nullptr;
    nvmlReturn_t (*get_clock)(nvmlDevice_t, unsigned int, unsigned int*) = nullptr;
    nvmlReturn_t (*get_vbios_version)(nvmlDevice_t, char*, unsigned int) = nullptr;
    nvmlReturn_t (*get_pcie_generation)(nvmlDevice_t, unsigned int*) = nullptr;
    nvmlReturn_t (*get_pcie_width)(nvmlDevice_t, unsigned int*) = nullptr;
    nvmlReturn_t (*get_pcie_throughput)(nvmlDevice_t, unsigned int, unsigned int*) = nullptr;

    void resolve(void* handle) {
        init = resolve_symbol<decltype(init)>(handle, "nvmlInit_v2");
        shutdown = resolve_symbol<decltype(shutdown)>(handle, "nvmlShutdown");
        get_count = resolve_symbol<decltype(get_count)>(handle, "nvmlDeviceGetCount_v2");
        get_handle_by_index = resolve_symbol<decltype(get_handle_by_index)>(
            handle, "nvmlDeviceGetHandleByIndex_v2");

        get_name = resolve_symbol<decltype(get_name)>(handle, "nvmlDeviceGetName");
        get_uuid = resolve_symbol<decltype(get_uuid)>(handle, "nvmlDeviceGetUUID");
        get_driver_version = resolve_symbol<decltype(get_driver_version)>(
            handle, "nvmlSystemGetDriverVersion");
        get_utilization = resolve_symbol<decltype(get_utilization)>(
            handle, "nvmlDeviceGetUtilizationRates");
        get_memory = resolve_symbol<decltype(get_memory)>(handle, "nvmlDeviceGetMemoryInfo");
        get_temperature = resolve_symbol<decltype(get_temperature)>(
            handle, "nvmlDeviceGetTemperature");
        get_power_usage = resolve_symbol<decltype(get_power_usage)>(
            handle, "nvmlDeviceGetPowerUsage");
        get_power_limit = resolve_symbol<decltype(get_power_limit)>(
            handle, "nvmlDeviceGetPowerManagementLimit");
        get_fan_speed = resolve_symbol<decltype(get_fan_speed)>(
            handle, "nvmlDeviceGetFanSpeed_v2");
        get_clock = resolve_symbol<decltype(get_clock)>(handle, "nvmlDeviceGetClockInfo");
        get_vbios_version = resolve_symbol<decltype(get_vbios_version)>(
            handle, "nvmlDeviceGetVbiosVersion");
        get_pcie_generation = resolve_symbol<decltype(get_pcie_generation)>(
            handle, "nvmlDeviceGetCurrPcieLinkGeneration");
        get_pcie_width = resolve_symbol<decltype(get_pcie_width)>(
            handle, "nvmlDeviceGetCurrPcieLinkWidth");
        get_pcie_throughput = resolve_symbol<decltype(get_pcie_throughput)>(
            handle, "nvmlDeviceGetPcieThroughput");
    }

    const char* first_missing_mandatory() const {
        if (!init) return "nvmlInit_v2";
        if (!shutdown) return "nvmlShutdown";
        if (!get_count) return "nvmlDeviceGetCount_v2";
        if (!get_handle_by_index) return "nvmlDeviceGetHandleByIndex_v2";
        return nullptr;
    }
};

auto nvml_library::default_candidates() -> std::vector<std::string> {
    return {"libnvidia-ml.so.1", "libnvidia-ml.so"};
}

auto nvml_library::load(const std::string& path) -> result<std::unique_ptr<nvml_library>> {
    std::vector<std::string> candidates;
    if (path.empty()) {
        candidates = default_candidates();
    } else {
        candidates.push_back(path);
    }

    std::ostringstream failures;
    for (const auto& candidate : candidates) {
        void* handle = dlopen(candidate.c_str(), RTLD_LAZY | RTLD_LOCAL);
        if (!handle) {
            const char* error = dlerror();
            failures << "dlopen failed for '" << candidate << "': "
                     << (error ? error : "unknown error") << "; ";
            continue;
        }

        auto api = std::make_unique<entry_points>();
        api->resolve(handle);
        if (const char* missing = api->first_missing_mandatory()) {
            dlclose(handle);
            return make_error_with_context<std::unique_ptr<nvml_library>>(
                telemetry_error_code::symbol_not_found,
                "Mandatory NVML entry point missing", std::string(missing));
        }

        return make_success(std::unique_ptr<nvml_library>(
            new nvml_library(handle, std::move(api))));
    }

    return make_error_with_context<std::unique_ptr<nvml_library>>(
        telemetry_error_code::library_not_found, "NVML could not be loaded", failures.str());
}

nvml_library::nvml_library(void* handle, std::unique_ptr<entry_points> api)
    : handle_(handle), api_(std::move(api)) {}

nvml_library::~nvml_library() {
    if (initialized_) {
        api_->shutdown();
    }
    if (handle_) {
        dlclose(handle_);
    }
}

auto nvml_library::initialize() -> result_void {
    if (initialized_) {
        return make_void_success();
    }
    nvmlReturn_t ret = api_->init();
    if (ret != NVML_SUCCESS) {
        return make_void_error(telemetry_error_code::backend_init_failed,
                               "nvmlInit_v2 failed", "nvml return code " + std::to_string(ret));
    }
    initialized_ = true;
    return make_void_success();
}

auto nvml_library::device_count() -> result<uint32_t> {
    unsigned int count = 0;
    nvmlReturn_t ret = api_->get_count(&count);
    if (ret != NVML_SUCCESS) {
        return make_error_with_context<uint32_t>(telemetry_error_code::query_failed,
                                                 "nvmlDeviceGetCount_v2 failed",
                                                 "nvml return code " + std::to_string(ret));
    }
    return make_success(static_cast<uint32_t>(count));
}

auto nvml_library::device_handle(uint32_t index, void** device) -> bool {
    return api_->get_handle_by_index(index, device) == NVML_SUCCESS;
}

auto nvml_library::device_name(uint32_t index) -> result<std::string> {
    nvmlDevice_t dev{};
    if (!api_->get_name || !device_handle(index, &dev)) {
        return make_error<std::string>(telemetry_error_code::query_failed);
    }
    char name[NVML_DEVICE_NAME_BUFFER_SIZE] = {};
    if (api_->get_name(dev, name, sizeof(name)) != NVML_SUCCESS || name[0] == '\0') {
        return make_error<std::string>(telemetry_error_code::query_failed);
    }
    return make_success(std::string(name));
}

auto nvml_library::device_uuid(uint32_t index) -> result<std::string> {
    nvmlDevice_t dev{};
    if (!api_->get_uuid || !device_handle(index, &dev)) {
        return make_error<std::string>(telemetry_error_code::query_failed);
    }
    char uuid[NVML_DEVICE_UUID_BUFFER_SIZE] = {};
    if (api_->get_uuid(dev, uuid, sizeof(uuid)) != NVML_SUCCESS) {
        return make_error<std::string>(telemetry_error_code::query_failed);
    }
    return make_success(std::string(uuid));
}

auto nvml_library::driver_version() -> result<std::string> {
    char version[NVML_DRIVER_VERSION_BUFFER_SIZE] = {};
    if (!api_->get_driver_version ||
        api_->get_driver_version(version, sizeof(version)) != NVML_SUCCESS) {
        return make_error<std::string>(telemetry_error_code::query_failed);
    }
    return make_success(std::string(version));
}

auto nvml_library::vbios_version(uint32_t index) -> result<std::string> {
    nvmlDevice_t dev{};
    if (!api_->get_vbios_version || !device_handle(index, &dev)) {
        return make_error<std::string>(telemetry_error_code::query_failed);
    }
    char version[NVML_DEVICE_VBIOS_VERSION_BUFFER_SIZE] = {};
    if (api_->get_vbios_version(dev, version, sizeof(version)) != NVML_SUCCESS ||
        version[0] == '\0') {
        return make_error<std::string>(telemetry_error_code::query_failed);
    }
    return make_success(std::string(version));
}

auto nvml_library::link_property(uint32_t index, nvml_link_query query) -> result<uint32_t> {
    nvmlDevice_t dev{};
    if (!query || !device_handle(index, &dev)) {
        return make_error<uint32_t>(telemetry_error_code::query_failed);
    }
    unsigned int value = 0;
    if (query(dev, &value) != NVML_SUCCESS) {
        return make_error<uint32_t>(telemetry_error_code::query_failed);
    }
    return make_success(static_cast<uint32_t>(value));
}

auto nvml_library::pcie_link_generation(uint32_t index) -> result<uint32_t> {
    return link_property(index, api_->get_pcie_generation);
}

auto nvml_library::pcie_link_width(uint32_t index) -> result<uint32_t> {
    return link_property(index, api_->get_pcie_width);
}

auto nvml_library::utilization(uint32_t index) -> raw_field {
    nvmlDevice_t dev{};
    if (!api_->get_utilization) {
        return raw_field::failed(field_status::unsupported);
    }
    if (!device_handle(index, &dev)) {
        return raw_field::failed(field_status::query_failed);
    }
    nvmlUtilization_t util{};
    nvmlReturn_t ret = api_->get_utilization(dev, &util);
    if (ret != NVML_SUCCESS) {
        return raw_field::failed(status_of(ret));
    }
    return raw_field::of(static_cast<double>(util.gpu));
}

auto nvml_library::memory(uint32_t index) -> memory_reading {
    nvmlDevice_t dev{};
    if (!api_->get_memory) {
        return {raw_field::failed(field_status::unsupported),
                raw_field::failed(field_status::unsupported)};
    }
    if (!device_handle(index, &dev)) {
        return {raw_field::failed(field_status::query_failed),
                raw_field::failed(field_status::query_failed)};
    }
    nvmlMemory_t mem{};
    nvmlReturn_t ret = api_->get_memory(dev, &mem);
    if (ret != NVML_SUCCESS) {
        return {raw_field::failed(status_of(ret)), raw_field::failed(status_of(ret))};
    }
    return {raw_field::of(static_cast<double>(mem.used)),
            raw_field::of(static_cast<double>(mem.total))};
}

auto nvml_library::temperature(uint32_t index) -> raw_field {
    nvmlDevice_t dev{};
    if (!api_->get_temperature) {
        return raw_field::failed(field_status::unsupported);
    }
    if (!device_handle(index, &dev)) {
        return raw_field::failed(field_status::query_failed);
    }
    unsigned int celsius = 0;
    nvmlReturn_t ret = api_->get_temperature(dev, NVML_TEMPERATURE_GPU, &celsius);
    if (ret != NVML_SUCCESS) {
        return raw_field::failed(status_of(ret));
    }
    return raw_field::of(static_cast<double>(celsius));
}

auto nvml_library::power_usage(uint32_t index) -> raw_field {
    nvmlDevice_t dev{};
    if (!api_->get_power_usage) {
        return raw_field::failed(field_status::unsupported);
    }
    if (!device_handle(index, &dev)) {
        return raw_field::failed(field_status::query_failed);
    }
    unsigned int milliwatts = 0;
    nvmlReturn_t ret = api_->get_power_usage(dev, &milliwatts);
    if (ret != NVML_SUCCESS) {
        return raw_field::failed(status_of(ret));
    }
    return raw_field::of(static_cast<double>(milliwatts));
}

auto nvml_library::power_limit(uint32_t index) -> raw_field {
    nvmlDevice_t dev{};
    if (!api_->get_power_limit) {
        return raw_field::failed(field_status::unsupported);
    }
    if (!device_handle(index, &dev)) {
        return raw_field::failed(field_status::query_failed);
    }
    unsigned int milliwatts = 0;
    nvmlReturn_t ret = api_->get_power_limit(dev, &milliwatts);
    if (ret != NVML_SUCCESS) {
        return raw_field::failed(status_of(ret));
    }
    return raw_field::of(static_cast<double>(milliwatts));
}

auto nvml_library::fan_speed(uint32_t index) -> raw_field {
    nvmlDevice_t dev{};
    if (!api_->get_fan_speed) {
        return raw_field::failed(field_status::unsupported);
    }
    if (!device_handle(index, &dev)) {
        return raw_field::failed(field_status::query_failed);
    }
    unsigned int percent = 0;
    nvmlReturn_t ret = api_->get_fan_speed(dev, 0, &percent);
    if (ret != NVML_SUCCESS) {
        return raw_field::failed(status_of(ret));
    }
    return raw_field::of(static_cast<double>(percent));
}

auto nvml_library::clock(uint32_t index, unsigned int clock_type) -> raw_field {
    nvmlDevice_t dev{};
    if (!api_->get_clock) {
        return raw_field::failed(field_status::unsupported);
    }
    if (!device_handle(index, &dev)) {
        return raw_field::failed(field_status::query_failed);
    }
    unsigned int mhz = 0;
    nvmlReturn_t ret = api_->get_clock(dev, clock_type, &mhz);
    if (ret != NVML_SUCCESS) {
        return raw_field::failed(status_of(ret));
    }
    return raw_field::of(static_cast<double>(mhz));
}

auto nvml_library::graphics_clock(uint32_t index) -> raw_field {
    return clock(index, NVML_CLOCK_GRAPHICS);
}

auto nvml_library::memory_clock(uint32_t index) -> raw_field {
    return clock(index, NVML_CLOCK_MEM);
}

auto nvml_library::pcie_throughput(uint32_t index, unsigned int counter) -> raw_field {
    nvmlDevice_t dev{};
    if (!api_->get_pcie_throughput) {
        return raw_field::failed(field_status::unsupported);
    }
    if (!device_handle(index, &dev)) {
        return raw_field::failed(field_status::query_failed);
    }
    unsigned int kilobytes_per_second = 0;
    nvmlReturn_t ret = api_->get_pcie_throughput(dev, counter, &kilobytes_per_second);
    if (ret != NVML_SUCCESS) {
        return raw_field::failed(status_of(ret));
    }
    return raw_field::of(static_cast<double>(kilobytes_per_second));
}

auto nvml_library::pcie_tx_throughput(uint32_t index) -> raw_field {
    return pcie_throughput(index, NVML_PCIE_UTIL_TX_BYTES);
}

auto nvml_library::pcie_rx_throughput(uint32_t index) -> raw_field {
    return pcie_throughput(index, NVML_PCIE_UTIL_RX_BYTES);
}

}  // namespace gpu_telemetry
