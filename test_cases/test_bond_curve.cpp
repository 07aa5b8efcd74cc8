/*
 * <Tests of bonding curves, polynomial fits and equilibria>
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

#include "src/capabilities/bond_curve.h"

#include "core/synthetic_tables.h"
#include "core/test_runner.h"

#include <algorithm>
#include <stdexcept>

using namespace TestSupport;
using namespace qalchemy;

namespace {

const LeastSquaresPolynomialFitter fitter{};

/* (b - 1)^2 sampled from first to last in steps of 0.1 */
BondCurve quadratic(double first, double last)
{
    std::vector<double> x, y;
    for (double b = first; b <= last + 1e-9; b += 0.1) {
        x.push_back(b);
        y.push_back((b - 1.0) * (b - 1.0));
    }
    BondCurve curve;
    curve.bond_lengths = StdVector2Vector(x);
    curve.energies = StdVector2Vector(y);
    return curve;
}

EquilibriumSettings quadraticSettings()
{
    EquilibriumSettings settings;
    settings.n_points = 2;
    settings.poly_order = 2;
    return settings;
}

void test_polynomial_helpers()
{
    Vector c(3);
    c << -1.0, 0.0, 1.0; // t^2 - 1
    requireClose(3.0, Polynomial::evaluate(c, 2.0), "evaluate");

    const Vector slope = Polynomial::derivative(c);
    require(slope.size() == 2, "derivative degree");
    requireClose(0.0, slope(0), "constant of the derivative");
    requireClose(2.0, slope(1), "slope of the derivative");

    std::vector<double> roots = Polynomial::realRoots(c);
    std::sort(roots.begin(), roots.end());
    require(roots.size() == 2, "two real roots");
    requireClose(-1.0, roots[0], "first root", 1e-10);
    requireClose(1.0, roots[1], "second root", 1e-10);

    Vector complex_only(3);
    complex_only << 1.0, 0.0, 1.0; // t^2 + 1
    require(Polynomial::realRoots(complex_only).empty(), "no real roots");
}

void test_fit_recovers_polynomial()
{
    const BondCurve curve = quadratic(0.6, 1.4);
    const FittedPolynomial polynomial = fitter.fit(curve.bond_lengths, curve.energies, 2);
    require(polynomial.order() == 2, "order");
    for (int i = 0; i < curve.size(); ++i)
        requireClose(curve.energies(i), polynomial(curve.bond_lengths(i)), "reproduces the samples", 1e-10);

    requireThrows<FitError>([&] { fitter.fit(curve.bond_lengths.head(2), curve.energies.head(2), 2); }, "two points for a parabola");
    requireThrows<std::invalid_argument>([&] { fitter.fit(curve.bond_lengths, curve.energies.head(3), 2); }, "size mismatch");
}

void test_minimum_without_stationary_point()
{
    Vector line(2);
    line << 0.5, 1.0; // 0.5 + t
    FittedPolynomial polynomial;
    polynomial.coefficients = line;
    polynomial.center = 0.0;

    const Equilibrium lower_end = fitter.minimum(polynomial, 0.0, 1.0);
    requireClose(0.0, lower_end.bond_length, "increasing: lower bound");
    requireClose(0.5, lower_end.energy, "energy at the lower bound");

    polynomial.coefficients(1) = -1.0;
    requireClose(1.0, fitter.minimum(polynomial, 0.0, 1.0).bond_length, "decreasing: upper bound");
}

void test_quadratic_equilibrium()
{
    const Equilibrium equilibrium = dimerMinimum(quadratic(0.6, 1.4), quadraticSettings(), fitter);
    requireClose(1.0, equilibrium.bond_length, "bond length", 1e-6);
    requireClose(0.0, equilibrium.energy, "energy", 1e-6);
}

void test_window_clipped_at_curve_end()
{
    // Lowest sample is the first one, the window holds 1.0, 1.1, 1.2
    const Equilibrium equilibrium = dimerMinimum(quadratic(1.0, 1.6), quadraticSettings(), fitter);
    requireClose(1.0, equilibrium.bond_length, "bond length", 1e-6);
}

void test_outliers_removed()
{
    BondCurve curve = quadratic(0.6, 2.0);
    const int n = curve.size();
    curve.bond_lengths.conservativeResize(n + 1);
    curve.energies.conservativeResize(n + 1);
    curve.bond_lengths(n) = 2.1;
    curve.energies(n) = 1000.0;

    const BondCurve cleaned = removeOutliers(curve, 3.0);
    require(cleaned.size() == n, "only the spike is dropped");
    require(cleaned.energies.maxCoeff() < 2.0, "spike gone");

    EquilibriumSettings settings = quadraticSettings();
    settings.remove_outliers = true;
    const Equilibrium equilibrium = dimerMinimum(curve, settings, fitter);
    requireClose(1.0, equilibrium.bond_length, "bond length", 1e-6);
    requireClose(0.0, equilibrium.energy, "energy", 1e-6);
}

void test_constant_curve_keeps_all_points()
{
    BondCurve flat = quadratic(0.6, 1.4);
    flat.energies.setConstant(-1.0);
    require(removeOutliers(flat, 3.0).size() == flat.size(), "no outliers without spread");
}

void test_underdetermined_window()
{
    EquilibriumSettings settings;
    settings.n_points = 2;
    settings.poly_order = 4;
    requireThrows<FitError>([&] { dimerMinimum(quadratic(0.9, 1.1), settings, fitter); }, "three samples for order 4");
    requireThrows<FitError>([&] { dimerMinimum(BondCurve(), settings, fitter); }, "empty curve");
}

void test_curve_from_qc_rows_is_sorted()
{
    const QCTable singlet = SyntheticTables::dimerQC().forSystem("c.o").filter([](const QCRow& row) {
        return row.charge == 0 && row.multiplicity == 1;
    });
    const BondCurve curve = dimerCurve(singlet);
    require(curve.size() == static_cast<int>(SyntheticTables::bondLengths().size()), "all bond lengths");
    for (int i = 1; i < curve.size(); ++i)
        require(curve.bond_lengths(i - 1) < curve.bond_lengths(i), "ascending bond lengths");
    requireClose(SyntheticTables::parabola(-113.0, 1.10, 0.9), curve.energies(0), "energy of the shortest bond");

    const json report = curve.toJson();
    require(report["bond_lengths"].size() == SyntheticTables::bondLengths().size(), "JSON columns");
}

void test_curve_at_lambda()
{
    const QCTable nn = SyntheticTables::dimerQC().forSystem("n.n").filter([](const QCRow& row) {
        return row.charge == 0;
    });
    const BondCurve perturbed = dimerCurve(nn, 1);
    require(perturbed.size() == static_cast<int>(SyntheticTables::bondLengths().size()), "lambda 1 rows");
    requireClose(SyntheticTables::parabola(-113.01, 1.10, 1.1), perturbed.energies(2), "alchemical energy");
}

void test_curve_from_taylor_series()
{
    const QATSTable bf = SyntheticTables::dimerQATS().forSystem("b.f");
    const BondCurve order0 = dimerCurve(bf, -1, 0);
    const BondCurve order2 = dimerCurve(bf, -1, 2);
    requireClose(SyntheticTables::parabola(-124.0, 1.27, 0.9), order0.energies(0), "QATS-0");
    requireClose(SyntheticTables::parabola(-124.0, 1.27, 0.9) - 11.0 + 0.1, order2.energies(0), "QATS-2");
}

void test_invalid_curve_rows()
{
    const QCTable co = SyntheticTables::dimerQC().forSystem("c.o").filter([](const QCRow& row) { return row.charge == 0; });
    requireThrows<std::invalid_argument>([&] { dimerCurve(co); }, "two multiplicities");

    const QCTable carbon = SyntheticTables::atomQC().forSystem("c").filter([](const QCRow& row) {
        return row.charge == 0 && row.multiplicity == 3;
    });
    requireThrows<std::invalid_argument>([&] { dimerCurve(carbon); }, "atom");

    QCRow row = SyntheticTables::qcRow("c.o", { 6, 8 }, 0, 1, 0, -113.0);
    requireThrows<DataError>([&] { dimerCurve(QCTable(std::vector<QCRow>{ row })); }, "missing bond length");
}

}

int main()
{
    QalchemyLogger::set_verbosity(0);
    TestRunner runner;

    runner.run_test("Polynomial helpers", test_polynomial_helpers);
    runner.run_test("Fit recovers the polynomial", test_fit_recovers_polynomial);
    runner.run_test("Minimum without stationary point", test_minimum_without_stationary_point);
    runner.run_test("Quadratic equilibrium", test_quadratic_equilibrium);
    runner.run_test("Window clipped at the curve end", test_window_clipped_at_curve_end);
    runner.run_test("Outliers removed", test_outliers_removed);
    runner.run_test("Constant curve keeps all points", test_constant_curve_keeps_all_points);
    runner.run_test("Underdetermined window", test_underdetermined_window);
    runner.run_test("Curve from QC rows is sorted", test_curve_from_qc_rows_is_sorted);
    runner.run_test("Curve at a lambda", test_curve_at_lambda);
    runner.run_test("Curve from the Taylor series", test_curve_from_taylor_series);
    runner.run_test("Invalid curve rows", test_invalid_curve_rows);

    runner.summary();
    return runner.get_exit_code();
}
