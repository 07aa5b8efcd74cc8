/*
 * <Local polynomial fits of bonding curves>
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

#include "src/core/global.h"

namespace qalchemy {

/*! \brief Equilibrium bond length (Angstrom) and energy (Hartree) */
struct Equilibrium {
    double bond_length = 0.0;
    double energy = 0.0;
};

/*! \brief Polynomial in the shifted variable t = x - center
 *
 * coefficients are in increasing degree.
 */
struct FittedPolynomial {
    Vector coefficients;
    double center = 0.0;

    double operator()(double x) const;
    int order() const { return static_cast<int>(coefficients.size()) - 1; }
};

class PolynomialFitter {
public:
    virtual ~PolynomialFitter() = default;

    /*! \brief Least-squares fit of a polynomial of the given order
     * \throws FitError if fewer than order + 1 points are given
     */
    virtual FittedPolynomial fit(const Vector& x, const Vector& y, int order) const = 0;

    /*! \brief Minimum of the polynomial within [lower, upper] */
    virtual Equilibrium minimum(const FittedPolynomial& polynomial, double lower, double upper) const = 0;
};

/*! \brief Vandermonde least squares and companion-matrix root finding
 *
 * The fit is solved with a column-pivoting Householder QR around the mean of x.
 * minimum() returns the lowest interior stationary point with positive
 * curvature; if there is none, the lower of the two interval ends.
 */
class LeastSquaresPolynomialFitter : public PolynomialFitter {
public:
    FittedPolynomial fit(const Vector& x, const Vector& y, int order) const override;
    Equilibrium minimum(const FittedPolynomial& polynomial, double lower, double upper) const override;
};

namespace Polynomial {

double evaluate(const Vector& coefficients, double t);
Vector derivative(const Vector& coefficients);

/*! \brief Real roots from the eigenvalues of the companion matrix */
std::vector<double> realRoots(const Vector& coefficients);

} // namespace Polynomial

} // namespace qalchemy
