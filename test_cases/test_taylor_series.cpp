/*
 * <Tests of the truncated Taylor series evaluation>
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

#include "src/capabilities/taylor_series.h"

#include "core/test_runner.h"

#include <stdexcept>
#include <vector>

using namespace TestSupport;

namespace {

const std::vector<std::vector<double>> coefficient_sets = {
    { -37.8 },
    { -37.8, 5.1 },
    { -53.9, 10.0, -0.5, 0.01 },
    { 1.0, -2.0, 3.0, -4.0, 5.0, -6.0 },
};

double fullPolynomial(const std::vector<double>& c, double lambda)
{
    double value = 0.0;
    double power = 1.0;
    for (double coefficient : c) {
        value += coefficient * power;
        power *= lambda;
    }
    return value;
}

void test_highest_order_is_full_polynomial()
{
    const std::vector<double> lambdas = { -2.0, -1.0, -0.5, 0.0, 0.3, 1.0, 2.5 };
    for (const auto& c : coefficient_sets) {
        const std::vector<double> values = TaylorSeries::evaluate(c, TaylorSeries::maxOrder(c), lambdas);
        require(values.size() == lambdas.size(), "one value per lambda");
        for (size_t i = 0; i < lambdas.size(); ++i)
            requireClose(fullPolynomial(c, lambdas[i]), values[i], "full order", 1e-9);
    }
}

void test_zero_lambda_gives_anchor()
{
    for (const auto& c : coefficient_sets) {
        for (int order = 0; order <= TaylorSeries::maxOrder(c); ++order)
            requireClose(c[0], TaylorSeries::evaluate(c, order, 0.0).front(), "lambda 0");
    }
}

void test_truncation()
{
    const std::vector<double> c = { -53.9, 10.0, -0.5, 0.01 };
    requireClose(-53.9, TaylorSeries::evaluate(c, 0, -1.0).front(), "order 0");
    requireClose(-63.9, TaylorSeries::evaluate(c, 1, -1.0).front(), "order 1");
    requireClose(-64.4, TaylorSeries::evaluate(c, 2, -1.0).front(), "order 2");
    requireClose(-64.41, TaylorSeries::evaluate(c, 3, -1.0).front(), "order 3");
}

void test_scalar_lambda_gives_one_value()
{
    const std::vector<double> values = TaylorSeries::evaluate({ 1.0, 1.0 }, 1, 2.0);
    require(values.size() == 1, "scalar lambda is a sequence of one");
    requireClose(3.0, values.front(), "value");
}

void test_order_out_of_range()
{
    const std::vector<double> c = { 1.0, 2.0, 3.0 };
    requireThrows<std::out_of_range>([&] { TaylorSeries::evaluate(c, 3, 1.0); }, "order == size");
    requireThrows<std::out_of_range>([&] { TaylorSeries::evaluate(c, -1, 1.0); }, "negative order");
    requireThrows<std::out_of_range>([&] { TaylorSeries::evaluate({}, 0, 1.0); }, "no coefficients");
}

}

int main()
{
    TestRunner runner;

    runner.run_test("Highest order equals the full polynomial", test_highest_order_is_full_polynomial);
    runner.run_test("Lambda 0 returns the zeroth coefficient", test_zero_lambda_gives_anchor);
    runner.run_test("Truncation per order", test_truncation);
    runner.run_test("Scalar lambda", test_scalar_lambda_gives_one_value);
    runner.run_test("Order out of range", test_order_out_of_range);

    runner.summary();
    return runner.get_exit_code();
}
