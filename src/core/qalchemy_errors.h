/*
 * <Exception types of the quantum alchemy prediction engine>
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

#include <stdexcept>
#include <string>

namespace qalchemy {

/**
 * @brief Malformed table row (inconsistent electron count, missing column)
 */
class DataError : public std::runtime_error {
public:
    explicit DataError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Requested electronic state does not exist and ignore_one_row is off
 */
class StateSelectionError : public std::runtime_error {
public:
    explicit StateSelectionError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Atomic numbers of reference and target cannot be related by a lambda
 */
class LambdaError : public std::runtime_error {
public:
    explicit LambdaError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Initial and final references disagree (row counts, lambda values)
 *
 * Always fatal: continuing would mix references of different states.
 */
class ReferenceConsistencyError : public std::runtime_error {
public:
    explicit ReferenceConsistencyError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Polynomial fit around the curve minimum is under-determined
 */
class FitError : public std::runtime_error {
public:
    explicit FitError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace qalchemy
