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

#include "polynomial_fit.h"

#include "src/core/qalchemy_errors.h"

#include <cmath>
#include <complex>
#include <limits>
#include <stdexcept>
#include <utility>

#include <Eigen/Eigenvalues>

#include <fmt/format.h>

namespace qalchemy {

namespace Polynomial {

double evaluate(const Vector& coefficients, double t)
{
    double value = 0.0;
    for (Eigen::Index i = coefficients.size() - 1; i >= 0; --i)
        value = value * t + coefficients(i);
    return value;
}

Vector derivative(const Vector& coefficients)
{
    if (coefficients.size() <= 1)
        return Vector::Zero(1);
    Vector result(coefficients.size() - 1);
    for (Eigen::Index i = 1; i < coefficients.size(); ++i)
        result(i - 1) = static_cast<double>(i) * coefficients(i);
    return result;
}

std::vector<double> realRoots(const Vector& coefficients)
{
    // Strip vanishing leading coefficients, they would blow up the companion matrix
    const double scale = coefficients.size() > 0 ? coefficients.cwiseAbs().maxCoeff() : 0.0;
    Eigen::Index degree = coefficients.size() - 1;
    while (degree > 0 && std::abs(coefficients(degree)) <= 1e-14 * scale)
        --degree;

    std::vector<double> roots;
    if (degree < 1)
        return roots;

    if (degree == 1) {
        roots.push_back(-coefficients(0) / coefficients(1));
        return roots;
    }

    Eigen::MatrixXd companion = Eigen::MatrixXd::Zero(degree, degree);
    for (Eigen::Index i = 1; i < degree; ++i)
        companion(i, i - 1) = 1.0;
    for (Eigen::Index i = 0; i < degree; ++i)
        companion(i, degree - 1) = -coefficients(i) / coefficients(degree);

    Eigen::EigenSolver<Eigen::MatrixXd> solver(companion, false);
    const Eigen::VectorXcd eigenvalues = solver.eigenvalues();
    const Vector slope = derivative(coefficients.head(degree + 1));
    for (Eigen::Index i = 0; i < eigenvalues.size(); ++i) {
        const std::complex<double> root = eigenvalues(i);
        if (std::abs(root.imag()) > 1e-6 * (1.0 + std::abs(root.real())))
            continue;

        // Nearly vanishing leading coefficients spoil the eigenvalues, polish with Newton steps
        double t = root.real();
        for (int step = 0; step < 5; ++step) {
            const double d = evaluate(slope, t);
            if (d == 0.0)
                break;
            t -= evaluate(coefficients, t) / d;
        }
        roots.push_back(t);
    }
    return roots;
}

} // namespace Polynomial

double FittedPolynomial::operator()(double x) const
{
    return Polynomial::evaluate(coefficients, x - center);
}

FittedPolynomial LeastSquaresPolynomialFitter::fit(const Vector& x, const Vector& y, int order) const
{
    if (order < 0)
        throw std::invalid_argument("Polynomial order must not be negative");
    if (x.size() != y.size())
        throw std::invalid_argument(fmt::format("Fit needs as many x ({}) as y ({}) values", x.size(), y.size()));
    if (x.size() < order + 1) {
        throw FitError(fmt::format("Fitting a polynomial of order {} needs at least {} points, only {} available; "
                                   "widen the bond length range or lower the polynomial order",
            order, order + 1, x.size()));
    }

    FittedPolynomial polynomial;
    polynomial.center = x.mean();

    Matrix vandermonde(x.size(), order + 1);
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        const double t = x(i) - polynomial.center;
        double power = 1.0;
        for (int j = 0; j <= order; ++j) {
            vandermonde(i, j) = power;
            power *= t;
        }
    }

    polynomial.coefficients = vandermonde.colPivHouseholderQr().solve(y);
    return polynomial;
}

Equilibrium LeastSquaresPolynomialFitter::minimum(const FittedPolynomial& polynomial, double lower, double upper) const
{
    if (lower > upper)
        std::swap(lower, upper);

    const Vector first = Polynomial::derivative(polynomial.coefficients);
    const Vector second = Polynomial::derivative(first);
    const double span = upper - lower;
    const double tolerance = 1e-10 * (1.0 + span);

    Equilibrium best;
    best.energy = std::numeric_limits<double>::infinity();
    bool found = false;
    for (double t : Polynomial::realRoots(first)) {
        const double x = t + polynomial.center;
        if (!std::isfinite(x) || x < lower - tolerance || x > upper + tolerance)
            continue;
        if (Polynomial::evaluate(second, t) <= 0.0)
            continue;
        const double energy = polynomial(x);
        if (energy < best.energy) {
            best.bond_length = x;
            best.energy = energy;
            found = true;
        }
    }
    if (found)
        return best;

    QalchemyLogger::verbose_fmt("No interior minimum of the fitted polynomial in [{:.4f}, {:.4f}], using the lower of the interval ends", lower, upper);
    const double e_lower = polynomial(lower);
    const double e_upper = polynomial(upper);
    if (e_lower <= e_upper)
        return { lower, e_lower };
    return { upper, e_upper };
}

} // namespace qalchemy
