/*
 * <Bonding curves of dimers and their equilibrium>
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

#include "bond_curve.h"

#include "taylor_series.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace qalchemy {

namespace {

template <typename Row>
void checkSingleDimerState(const RowTable<Row>& rows)
{
    if (rows.empty())
        return;
    if (rows.systems().size() != 1 || rows.charges().size() != 1 || rows.multiplicities().size() != 1) {
        throw std::invalid_argument(fmt::format("A bonding curve needs rows of one state, got {} systems, {} charges and {} multiplicities",
            rows.systems().size(), rows.charges().size(), rows.multiplicities().size()));
    }
    if (!rows.front().isDimer())
        throw std::invalid_argument(fmt::format("{} is not a dimer", rows.front().system));
}

template <typename Row>
double bondLength(const Row& row)
{
    if (!row.bond_length)
        throw DataError("Dimer row " + describe(row) + " has no bond length");
    return *row.bond_length;
}

BondCurve fromSamples(std::vector<std::pair<double, double>> samples)
{
    std::sort(samples.begin(), samples.end(),
        [](const std::pair<double, double>& a, const std::pair<double, double>& b) { return a.first < b.first; });

    BondCurve curve;
    curve.bond_lengths.resize(samples.size());
    curve.energies.resize(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        curve.bond_lengths(i) = samples[i].first;
        curve.energies(i) = samples[i].second;
    }
    return curve;
}

}

json BondCurve::toJson() const
{
    json result;
    result["bond_lengths"] = Vector2StdVector(bond_lengths);
    result["energies"] = Vector2StdVector(energies);
    return result;
}

EquilibriumSettings EquilibriumSettings::fromConfig(const ConfigManager& config)
{
    EquilibriumSettings settings;
    settings.n_points = config.get<int>("equilibrium.n_points");
    settings.poly_order = config.get<int>("equilibrium.poly_order");
    settings.remove_outliers = config.get<bool>("equilibrium.remove_outliers");
    settings.zscore_cutoff = config.get<double>("equilibrium.zscore_cutoff");
    if (settings.n_points < 0 || settings.poly_order < 0)
        throw std::invalid_argument("n_points and poly_order must not be negative");
    return settings;
}

BondCurve dimerCurve(const QCTable& rows, std::optional<int> lambda)
{
    checkSingleDimerState(rows);

    std::vector<std::pair<double, double>> samples;
    for (const auto& row : rows) {
        if (lambda && row.lambda_value != *lambda)
            continue;
        samples.emplace_back(bondLength(row), row.electronic_energy);
    }
    return fromSamples(std::move(samples));
}

BondCurve dimerCurve(const QATSTable& rows, int lambda, int order)
{
    checkSingleDimerState(rows);

    std::vector<std::pair<double, double>> samples;
    for (const auto& row : rows)
        samples.emplace_back(bondLength(row), TaylorSeries::evaluate(row.poly_coeffs, order, lambda).front());
    return fromSamples(std::move(samples));
}

BondCurve removeOutliers(const BondCurve& curve, double zscore_cutoff)
{
    if (curve.empty())
        return curve;

    const double mean = curve.energies.mean();
    const double std_dev = std::sqrt((curve.energies.array() - mean).square().mean());
    if (std_dev == 0.0)
        return curve;

    std::vector<std::pair<double, double>> kept;
    for (int i = 0; i < curve.size(); ++i) {
        const double zscore = std::abs(curve.energies(i) - mean) / std_dev;
        if (zscore > zscore_cutoff) {
            QalchemyLogger::verbose_fmt("Dropping outlier at {:.4f} A (E = {:.6f} Eh, z = {:.2f})", curve.bond_lengths(i), curve.energies(i), zscore);
            continue;
        }
        kept.emplace_back(curve.bond_lengths(i), curve.energies(i));
    }
    return fromSamples(std::move(kept));
}

Equilibrium dimerMinimum(const BondCurve& curve, const EquilibriumSettings& settings, const PolynomialFitter& fitter)
{
    const BondCurve used = settings.remove_outliers ? removeOutliers(curve, settings.zscore_cutoff) : curve;
    if (used.empty())
        throw FitError("Cannot locate the equilibrium of an empty bonding curve");

    Eigen::Index anchor = 0;
    used.energies.minCoeff(&anchor);

    const int first = std::max(0, static_cast<int>(anchor) - settings.n_points);
    const int last = std::min(used.size() - 1, static_cast<int>(anchor) + settings.n_points);
    const int count = last - first + 1;

    const FittedPolynomial polynomial = fitter.fit(used.bond_lengths.segment(first, count), used.energies.segment(first, count), settings.poly_order);
    return fitter.minimum(polynomial, used.bond_lengths(first), used.bond_lengths(last));
}

} // namespace qalchemy
