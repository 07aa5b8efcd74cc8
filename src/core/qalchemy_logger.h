/*
 * <Qalchemy Logging System>
 * Copyright (C) 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#pragma once

#include <chrono>
#include <string>
#include <type_traits>

#include <fmt/color.h>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

/*! \brief Verbosity-controlled console logger
 *
 * Verbosity levels:
 * - 0: silent, nothing but errors
 * - 1: results and warnings (default)
 * - 2: informational output, parameter summaries
 * - 3: verbose, per-reference decisions of the predictors
 */
class QalchemyLogger {
public:
    enum class OutputFormat {
        TERMINAL,
        RAW,
        MARKDOWN
    };

private:
    static int m_verbosity;
    static bool m_use_colors;
    static OutputFormat m_format;
    static std::chrono::high_resolution_clock::time_point m_start_time;

public:
    // Configuration methods
    static void set_verbosity(int level) { m_verbosity = level; }
    static void set_colors(bool enable) { m_use_colors = enable; }
    static void set_format(OutputFormat fmt) { m_format = fmt; }
    static int get_verbosity() { return m_verbosity; }
    static bool colors_enabled() { return m_use_colors; }

    // Initialize logger with environment detection (NO_COLOR, TERM)
    static void initialize(int verbosity = 1, bool auto_detect_colors = true);

    // Core logging functions with verbosity control
    static void error(const std::string& msg);
    static void warn(const std::string& msg);
    static void success(const std::string& msg);
    static void info(const std::string& msg);
    static void verbose(const std::string& msg);

    // Parameter logging with different types
    static void param(const std::string& key, const std::string& value);
    static void param(const std::string& key, int value);
    static void param(const std::string& key, double value);
    static void param(const std::string& key, bool value);

    // JSON parameter table printing
    static void param_table(const json& parameters, const std::string& title = "Parameters");

    // Special formatting functions
    static void header(const std::string& title);

    // Unit-aware output functions
    static void energy_rel(double value_eh, const std::string& label);
    static void energy_abs(double value_eh, const std::string& label);
    static void length(double value_angstrom, const std::string& label);

    template <typename... Args>
    static void error_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        error(fmt::format(format_str, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        warn(fmt::format(format_str, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void success_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        success(fmt::format(format_str, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        info(fmt::format(format_str, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void verbose_fmt(fmt::format_string<Args...> format_str, Args&&... args)
    {
        // Skip formatting entirely below the verbose level, the predictors call this per reference
        if (m_verbosity < 3)
            return;
        verbose(fmt::format(format_str, std::forward<Args>(args)...));
    }

    // Template-based param function for any type
    template <typename T>
    static void param_value(const std::string& key, const T& value)
    {
        if constexpr (std::is_same_v<T, std::string>) {
            param(key, value);
        } else if constexpr (std::is_same_v<T, bool>) {
            param(key, value);
        } else if constexpr (std::is_integral_v<T>) {
            param(key, static_cast<int>(value));
        } else if constexpr (std::is_floating_point_v<T>) {
            param(key, static_cast<double>(value));
        } else {
            param(key, fmt::format("{}", value));
        }
    }

private:
    static void log_colored(fmt::color color, const std::string& prefix, const std::string& msg, bool to_stderr = false);
    static void log_plain(const std::string& msg);
    static std::string format_json_value(const json& value);
    static std::string get_elapsed_time();
};
