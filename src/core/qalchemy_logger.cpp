/*
 * <Qalchemy Logging System Implementation>
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

#include "src/core/qalchemy_logger.h"
#include "src/core/units.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <fmt/format.h>

int QalchemyLogger::m_verbosity = 1;
bool QalchemyLogger::m_use_colors = true;
QalchemyLogger::OutputFormat QalchemyLogger::m_format = QalchemyLogger::OutputFormat::TERMINAL;
std::chrono::high_resolution_clock::time_point QalchemyLogger::m_start_time = std::chrono::high_resolution_clock::now();

void QalchemyLogger::initialize(int verbosity, bool auto_detect_colors)
{
    m_verbosity = verbosity;
    m_start_time = std::chrono::high_resolution_clock::now();

    if (auto_detect_colors) {
        const char* no_color = std::getenv("NO_COLOR");
        const char* term = std::getenv("TERM");
        m_use_colors = (no_color == nullptr) && (term == nullptr || std::strcmp(term, "dumb") != 0);
    }
}

void QalchemyLogger::error(const std::string& msg)
{
    // errors are never suppressed
    log_colored(fmt::color::red, "[ERROR]", msg, true);
}

void QalchemyLogger::warn(const std::string& msg)
{
    if (m_verbosity < 1)
        return;
    log_colored(fmt::color::orange, "[WARN]", msg, true);
}

void QalchemyLogger::success(const std::string& msg)
{
    if (m_verbosity < 1)
        return;
    log_colored(fmt::color::green, "[OK]", msg);
}

void QalchemyLogger::info(const std::string& msg)
{
    if (m_verbosity < 2)
        return;
    log_colored(fmt::color::steel_blue, "[INFO]", msg);
}

void QalchemyLogger::verbose(const std::string& msg)
{
    if (m_verbosity < 3)
        return;
    log_plain(fmt::format("  {} {}", get_elapsed_time(), msg));
}

void QalchemyLogger::param(const std::string& key, const std::string& value)
{
    if (m_verbosity < 2)
        return;
    if (m_format == OutputFormat::MARKDOWN)
        log_plain(fmt::format("| {} | {} |", key, value));
    else
        log_plain(fmt::format("  {:<28} {}", key + ":", value));
}

void QalchemyLogger::param(const std::string& key, int value)
{
    param(key, std::to_string(value));
}

void QalchemyLogger::param(const std::string& key, double value)
{
    param(key, fmt::format("{:.6g}", value));
}

void QalchemyLogger::param(const std::string& key, bool value)
{
    param(key, std::string(value ? "true" : "false"));
}

void QalchemyLogger::param_table(const json& parameters, const std::string& title)
{
    if (m_verbosity < 3)
        return;

    header(title);
    if (m_format == OutputFormat::MARKDOWN) {
        log_plain("| Parameter | Value |");
        log_plain("|---|---|");
    }
    for (const auto& item : parameters.items()) {
        param(item.key(), format_json_value(item.value()));
    }
}

void QalchemyLogger::header(const std::string& title)
{
    if (m_verbosity < 2)
        return;
    if (m_format == OutputFormat::MARKDOWN) {
        log_plain(fmt::format("## {}", title));
        return;
    }
    std::string line(title.size() + 8, '=');
    log_plain(line);
    if (m_use_colors && m_format == OutputFormat::TERMINAL)
        fmt::print(fmt::emphasis::bold, "    {}\n", title);
    else
        log_plain(fmt::format("    {}", title));
    log_plain(line);
}

void QalchemyLogger::energy_rel(double value_eh, const std::string& label)
{
    if (m_verbosity < 2)
        return;
    param(label, fmt::format("{:+.6f} Eh ({:+.4f} eV, {:+.3f} kcal/mol)", value_eh,
                     Energy::hartree_to_ev(value_eh), Energy::hartree_to_kcalmol(value_eh)));
}

void QalchemyLogger::energy_abs(double value_eh, const std::string& label)
{
    if (m_verbosity < 2)
        return;
    param(label, fmt::format("{:.8f} Eh", value_eh));
}

void QalchemyLogger::length(double value_angstrom, const std::string& label)
{
    if (m_verbosity < 2)
        return;
    param(label, fmt::format("{:.5f} Å ({:.5f} Bohr)", value_angstrom, Length::angstrom_to_bohr(value_angstrom)));
}

void QalchemyLogger::log_colored(fmt::color color, const std::string& prefix, const std::string& msg, bool to_stderr)
{
    std::FILE* stream = to_stderr ? stderr : stdout;
    if (m_format == OutputFormat::RAW) {
        fmt::print(stream, "{}\n", msg);
    } else if (m_use_colors && m_format == OutputFormat::TERMINAL) {
        fmt::print(stream, fmt::fg(color), "{} ", prefix);
        fmt::print(stream, "{}\n", msg);
    } else {
        fmt::print(stream, "{} {}\n", prefix, msg);
    }
}

void QalchemyLogger::log_plain(const std::string& msg)
{
    fmt::print("{}\n", msg);
}

std::string QalchemyLogger::format_json_value(const json& value)
{
    if (value.is_string())
        return value.get<std::string>();
    if (value.is_boolean())
        return value.get<bool>() ? "true" : "false";
    if (value.is_number_float())
        return fmt::format("{:.6g}", value.get<double>());
    return value.dump();
}

std::string QalchemyLogger::get_elapsed_time()
{
    auto now = std::chrono::high_resolution_clock::now();
    double seconds = std::chrono::duration<double>(now - m_start_time).count();
    return fmt::format("[{:8.3f}s]", seconds);
}
