/*
 * <Computed alchemical energies of a reference system>
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

#include "alchemical_scan.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

namespace qalchemy {

std::vector<std::optional<double>> alchemicalEnergies(const QCTable& qc, const StateSelector& selector,
    const std::string& ref_label, int ref_charge, const IntList& lambdas, const AlchemicalScanSettings& settings)
{
    QCTable rows = qc.forSystem(ref_label).inBasis(settings.basis_set).filter([ref_charge, &lambdas](const QCRow& row) {
        return row.charge == ref_charge && std::find(lambdas.begin(), lambdas.end(), row.lambda_value) != lambdas.end();
    });

    if (!rows.empty() && rows.front().isDimer()) {
        if (!settings.bond_length)
            throw std::invalid_argument(fmt::format("{} is a dimer, alchemical energies need a bond length", ref_label));
        const double bond_length = *settings.bond_length;
        rows = rows.filter([bond_length](const QCRow& row) {
            return row.bond_length && std::abs(*row.bond_length - bond_length) < 1e-8;
        });
    }

    if (rows.multiplicities().size() > 1) {
        const std::optional<int> multiplicity = selector.multiplicity(rows, settings.excitation_level, settings.ignore_one_row);
        if (!multiplicity)
            return std::vector<std::optional<double>>(lambdas.size());
        rows = rows.filter([&multiplicity](const QCRow& row) { return row.multiplicity == *multiplicity; });
    }

    std::vector<std::optional<double>> energies;
    energies.reserve(lambdas.size());
    for (int lambda : lambdas) {
        const QCTable matches = rows.filter([lambda](const QCRow& row) { return row.lambda_value == lambda; });
        if (matches.size() > 1)
            throw ReferenceConsistencyError(fmt::format("{} with charge {} has {} calculations at lambda {}", ref_label, ref_charge, matches.size(), lambda));
        if (matches.empty()) {
            QalchemyLogger::verbose_fmt("No calculation of {} with charge {} at lambda {}", ref_label, ref_charge, lambda);
            energies.emplace_back(std::nullopt);
        } else {
            energies.emplace_back(matches.front().electronic_energy);
        }
    }
    return energies;
}

} // namespace qalchemy
