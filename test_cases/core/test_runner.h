/*
 * <Minimal test runner shared by the qalchemy test executables>
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

#include <cmath>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace TestSupport {

inline bool isClose(double a, double b, double atol = 1e-9)
{
    return std::abs(a - b) <= atol;
}

inline void require(bool condition, const std::string& msg)
{
    if (!condition)
        throw std::runtime_error(msg);
}

inline void requireClose(double expected, double actual, const std::string& msg, double atol = 1e-9)
{
    if (!isClose(expected, actual, atol))
        throw std::runtime_error(fmt::format("{}: expected {:.10f}, got {:.10f}", msg, expected, actual));
}

/*! \brief Passes only if call() throws exactly an Exception (or a subclass) */
template <typename Exception>
void requireThrows(const std::function<void()>& call, const std::string& msg)
{
    try {
        call();
    } catch (const Exception&) {
        return;
    } catch (const std::exception& e) {
        throw std::runtime_error(msg + ": unexpected exception type: " + e.what());
    }
    throw std::runtime_error(msg + ": nothing was thrown");
}

class TestRunner {
public:
    void run_test(const std::string& name, std::function<void()> test)
    {
        try {
            test();
            std::cout << "✓ " << name << " passed\n";
            m_passed++;
        } catch (const std::exception& e) {
            std::cerr << "✗ " << name << " failed: " << e.what() << "\n";
            m_failed++;
        }
    }

    void summary() const
    {
        std::cout << "\nTest Summary:\n";
        std::cout << "Passed: " << m_passed << "\n";
        std::cout << "Failed: " << m_failed << "\n";
        std::cout << "Total:  " << (m_passed + m_failed) << "\n";
    }

    int get_exit_code() const
    {
        return m_failed > 0 ? 1 : 0;
    }

private:
    int m_passed = 0;
    int m_failed = 0;
};

} // namespace TestSupport
