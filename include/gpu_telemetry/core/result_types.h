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
 * @file result_types.h
 * @brief Result pattern type definitions for the telemetry core
 *
 * This file provides Result pattern types on top of common_system's Result
 * implementation, so that telemetry errors travel through the same
 * error management as the rest of the ecosystem.
 *
 * - result<T>     -> common::Result<T>
 * - result_void   -> common::VoidResult
 */

#include "error_codes.h"
#include <kcenon/common/patterns/result.h>

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace gpu_telemetry {

/**
 * @struct error_info
 * @brief Extended error information with context
 *
 * Provides telemetry-specific error information that converts to and from
 * common_system's error_info.
 */
struct error_info {
    telemetry_error_code code;
    std::string message;
    std::optional<std::string> context{std::nullopt};

    error_info(telemetry_error_code c,
               const std::string& msg = "",
               const std::optional<std::string>& ctx = std::nullopt)
        : code(c)
        , message(msg.empty() ? error_code_to_string(c) : msg)
        , context(ctx) {}

    /**
     * @brief Get formatted error string
     * @return Formatted error message with context information
     */
    std::string to_string() const {
        std::string result = "[" + error_code_to_string(code) + "] " + message;
        if (context.has_value()) {
            result += " Context: " + context.value();
        }
        return result;
    }

    /**
     * @brief Convert to common_system error_info
     */
    common::error_info to_common_error() const {
        common::error_info info(static_cast<int>(code), message, "gpu_telemetry");
        if (context) {
            info.details = context;
        }
        return info;
    }

    /**
     * @brief Create from common_system error_info
     */
    static error_info from_common_error(const common::error_info& common_err) {
        error_info info(static_cast<telemetry_error_code>(common_err.code),
                        common_err.message);
        if (common_err.details) {
            info.context = common_err.details;
        }
        return info;
    }
};

template<typename T>
using result = common::Result<T>;

using result_void = common::VoidResult;

/**
 * @brief Create a successful result
 */
template<typename T>
common::Result<std::decay_t<T>> make_success(T&& value) {
    return common::ok<std::decay_t<T>>(std::forward<T>(value));
}

/**
 * @brief Create an error result
 * @tparam T The expected value type
 * @param code The error code
 * @param message Optional error message
 */
template<typename T>
common::Result<T> make_error(telemetry_error_code code,
                             const std::string& message = "") {
    error_info err(code, message);
    return common::Result<T>::err(err.to_common_error());
}

/**
 * @brief Create an error result with context
 */
template<typename T>
common::Result<T> make_error_with_context(telemetry_error_code code,
                                          const std::string& message,
                                          const std::string& context) {
    error_info err(code, message, context);
    return common::Result<T>::err(err.to_common_error());
}

/**
 * @brief Create a VoidResult with error
 */
inline common::VoidResult make_void_error(telemetry_error_code code,
                                          const std::string& message = "",
                                          const std::optional<std::string>& context = std::nullopt) {
    error_info err(code, message, context);
    return common::VoidResult::err(err.to_common_error());
}

/**
 * @brief Create a successful VoidResult
 */
inline common::VoidResult make_void_success() {
    return common::VoidResult(std::monostate{});
}

/**
 * @brief Extract the telemetry error code carried by a failed result
 */
template<typename R>
telemetry_error_code error_code_of(const R& r) {
    return static_cast<telemetry_error_code>(r.error().code);
}

} // namespace gpu_telemetry
