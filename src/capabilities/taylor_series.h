/*
 * <Quantum alchemy Taylor series (QATS) evaluation>
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

#include <vector>

namespace TaylorSeries {

/**
 * @brief Truncated Taylor series sum_{i=0..order} c[i] * lambda^i
 * @param poly_coeffs Coefficients in increasing degree
 * @param order Highest order included, 0 <= order < poly_coeffs.size()
 * @param lambda_values Perturbations to evaluate at
 * @return One energy per lambda value
 * @throws std::out_of_range if order is outside the available coefficients
 */
std::vector<double> evaluate(const std::vector<double>& poly_coeffs, int order, const std::vector<double>& lambda_values);

/**
 * @brief Scalar overload, the lambda is treated as a sequence of length one
 */
std::vector<double> evaluate(const std::vector<double>& poly_coeffs, int order, double lambda_value);

/**
 * @brief Highest order available from the coefficients (size - 1)
 */
int maxOrder(const std::vector<double>& poly_coeffs);

} // namespace TaylorSeries
