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
 * @file config_parser.h
 * @brief Typed parsing of string configuration maps
 *
 * The surrounding application hands the core a flat key/value map. This
 * utility turns those strings into typed values with defaults, so that
 * polling_config::from_map() stays declarative.
 *
 * Usage:
 * @code
 * config_map config = {{"interval_ms", "500"}, {"retained_samples", "600"}};
 *
 * auto interval = config_parser::get_duration(config, "interval_ms",
 *                                             std::chrono::milliseconds(1000));
 * size_t capacity = config_parser::get<size_t>(config, "retained_samples", 300);
 * @endcode
 */

#include <cctype>
#include <chrono>
#include <optional>
#include <ratio>
#include <string>
#include <type_traits>
#include <stdexcept>
#include <unordered_map>

namespace gpu_telemetry {

/**
 * @brief Type alias for configuration map
 */
using config_map = std::unordered_map<std::string, std::string>;

/**
 * @class config_parser
 * @brief Unified configuration parsing utility
 */
class config_parser {
   public:
    /**
     * @brief Get a configuration value with type conversion
     * @tparam T The target type (bool, int, size_t, double, std::string, etc.)
     * @param config The configuration map
     * @param key The configuration key to look up
     * @param default_value The default value if key is not found or parsing fails
     * @return The parsed value or default
     */
    template <typename T>
    static T get(const config_map& config, const std::string& key, const T& default_value) {
        auto it = config.find(key);
        if (it == config.end()) {
            return default_value;
        }
        return parse_value<T>(it->second, default_value);
    }

    /**
     * @brief Get a configuration value as optional
     * @return Optional containing the value if found and parseable, empty otherwise
     */
    template <typename T>
    static std::optional<T> get_optional(const config_map& config, const std::string& key) {
        auto it = config.find(key);
        if (it == config.end()) {
            return std::nullopt;
        }
        return parse_value_optional<T>(it->second);
    }

    static bool has_key(const config_map& config, const std::string& key) {
        return config.find(key) != config.end();
    }

    /**
     * @brief Get a configuration value clamped to [min_value, max_value]
     */
    template <typename T>
    static T get_clamped(const config_map& config, const std::string& key, const T& default_value,
                         const T& min_value, const T& max_value) {
        static_assert(std::is_arithmetic_v<T>, "get_clamped requires arithmetic type");
        T value = get<T>(config, key, default_value);
        if (value < min_value) {
            return min_value;
        }
        if (value > max_value) {
            return max_value;
        }
        return value;
    }

    /**
     * @brief Get a duration value from configuration
     *
     * Supported formats:
     * - Plain number: interpreted as the Duration's unit
     * - With suffix: 100ms, 5s, 2m (milliseconds, seconds, minutes)
     *
     * Suffixed values beyond the Duration's range saturate to its max or min.
     */
    template <typename Duration>
    static Duration get_duration(const config_map& config, const std::string& key,
                                 const Duration& default_value) {
        auto it = config.find(key);
        if (it == config.end()) {
            return default_value;
        }
        return parse_duration<Duration>(it->second, default_value);
    }

   private:
    template <typename T>
    static T parse_value(const std::string& str, const T& default_value) {
        auto parsed = parse_value_optional<T>(str);
        return parsed ? *parsed : default_value;
    }

    template <typename T>
    static std::optional<T> parse_value_optional(const std::string& str) {
        try {
            if constexpr (std::is_same_v<T, bool>) {
                return parse_bool(str);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return str;
            } else if constexpr (std::is_integral_v<T>) {
                return parse_integral<T>(str);
            } else if constexpr (std::is_floating_point_v<T>) {
                return static_cast<T>(std::stod(str));
            } else {
                return std::nullopt;
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    /**
     * @brief Parse boolean value from string ("true", "1", "yes", "on" -> true)
     */
    static bool parse_bool(const std::string& str) {
        std::string lower = str;
        for (auto& c : lower) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
    }

    template <typename T>
    static T parse_integral(const std::string& str) {
        if constexpr (std::is_signed_v<T>) {
            return static_cast<T>(std::stoll(str));
        } else {
            // stoull accepts "-1" and wraps it; reject negatives explicitly
            if (str.find('-') != std::string::npos) {
                throw std::invalid_argument("negative value for unsigned key");
            }
            return static_cast<T>(std::stoull(str));
        }
    }

    /**
     * @brief Convert a count of Source units to Duration, saturating at the
     *        representable range instead of overflowing
     */
    template <typename Duration, typename Source>
    static Duration saturating_duration(long long value) {
        using ratio = std::ratio_divide<typename Source::period, typename Duration::period>;
        long double ticks = static_cast<long double>(value) * ratio::num / ratio::den;
        if (ticks >= static_cast<long double>((Duration::max)().count())) {
            return (Duration::max)();
        }
        if (ticks <= static_cast<long double>((Duration::min)().count())) {
            return (Duration::min)();
        }
        return std::chrono::duration_cast<Duration>(Source(value));
    }

    template <typename Duration>
    static Duration parse_duration(const std::string& str, const Duration& default_value) {
        try {
            size_t suffix_start = str.find_first_not_of("0123456789-");
            if (suffix_start == std::string::npos) {
                return Duration(std::stoll(str));
            }

            long long value = std::stoll(str.substr(0, suffix_start));
            std::string suffix = str.substr(suffix_start);
            while (!suffix.empty() && std::isspace(static_cast<unsigned char>(suffix.front()))) {
                suffix.erase(0, 1);
            }
            for (auto& c : suffix) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }

            if (suffix == "ms") {
                return saturating_duration<Duration, std::chrono::milliseconds>(value);
            } else if (suffix == "s" || suffix == "sec") {
                return saturating_duration<Duration, std::chrono::seconds>(value);
            } else if (suffix == "m" || suffix == "min") {
                return saturating_duration<Duration, std::chrono::minutes>(value);
            }
            return default_value;
        } catch (const std::exception&) {
            return default_value;
        }
    }
};

}  // namespace gpu_telemetry
