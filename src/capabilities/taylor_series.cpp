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

#include "taylor_series.h"

#include <stdexcept>
#include <string>

namespace TaylorSeries {

std::vector<double> evaluate(const std::vector<double>& poly_coeffs, int order, const std::vector<double>& lambda_values)
{
    if (order < 0 || order >= static_cast<int>(poly_coeffs.size())) {
        throw std::out_of_range("Taylor series order " + std::to_string(order) + " requested, but only "
            + std::to_string(poly_coeffs.size()) + " coefficients are available");
    }

    std::vector<double> energies;
    energies.reserve(lambda_values.size());
    for (double lambda : lambda_values) {
        // Horner scheme from the highest included order down
        double energy = 0.0;
        for (int i = order; i >= 0; --i)
            energy = energy * lambda + poly_coeffs[i];
        energies.push_back(energy);
    }
    return energies;
}

std::vector<double> evaluate(const std::vector<double>& poly_coeffs, int order, double lambda_value)
{
    return evaluate(poly_coeffs, order, std::vector<double>{ lambda_value });
}

int maxOrder(const std::vector<double>& poly_coeffs)
{
    return static_cast<int>(poly_coeffs.size()) - 1;
}

} // namespace TaylorSeries
