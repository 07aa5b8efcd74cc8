/*
 * <Synthetic QC and QATS tables for the qalchemy tests>
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

#include <optional>
#include <string>
#include <vector>

#include "src/core/alchemy_data.h"

/*
 * Atoms (aug-cc-pV5Z)
 *   target c:    charge 0 triplet -37.80, singlet -37.75; charge 1 doublet -37.40, quartet -37.20
 *   reference n: lambda -1 towards c; QATS for the cation (triplet, singlet) and dication (doublet),
 *                computed alchemical points at lambda -1
 *   reference b: lambda +1 towards c; QATS for the anion (triplet) and neutral atom (doublet),
 *                no alchemical points
 *
 * Dimers (cc-pV5Z), bond lengths 0.9 ... 1.5 A
 *   target c.o:    charge 0 singlet -113.0 + 0.5 (r - 1.10)^2, triplet 0.3 Eh higher;
 *                  charge 1 doublet -112.5 + 0.5 (r - 1.12)^2
 *   reference n.n: lambda +1 under the counter policy, QATS for charge 0 and 1 and computed
 *                  alchemical points at lambda +1
 *   reference b.f: only charge 0, never usable for charge changes
 */
namespace SyntheticTables {

using namespace qalchemy;

inline const std::string atom_basis = "aug-cc-pV5Z";
inline const std::string dimer_basis = "cc-pV5Z";

inline QCRow qcRow(const std::string& system, const IntList& atomic_numbers, int charge, int multiplicity,
    int lambda, double energy, std::optional<double> bond_length = std::nullopt, const std::string& basis = atom_basis)
{
    QCRow row;
    row.system = system;
    row.atomic_numbers = atomic_numbers;
    row.charge = charge;
    row.multiplicity = multiplicity;
    row.n_electrons = electronCount(atomic_numbers, charge);
    row.basis_set = basis;
    row.lambda_value = lambda;
    row.bond_length = bond_length;
    row.electronic_energy = energy;
    return row;
}

inline QATSRow qatsRow(const std::string& system, const IntList& atomic_numbers, int charge, int multiplicity,
    const std::vector<double>& coefficients, std::optional<double> bond_length = std::nullopt, const std::string& basis = atom_basis)
{
    QATSRow row;
    row.system = system;
    row.atomic_numbers = atomic_numbers;
    row.charge = charge;
    row.multiplicity = multiplicity;
    row.n_electrons = electronCount(atomic_numbers, charge);
    row.basis_set = basis;
    row.bond_length = bond_length;
    row.poly_coeffs = coefficients;
    return row;
}

inline std::vector<QCRow> atomQCRows()
{
    return {
        qcRow("c", { 6 }, 0, 3, 0, -37.80),
        qcRow("c", { 6 }, 0, 1, 0, -37.75),
        qcRow("c", { 6 }, 1, 2, 0, -37.40),
        qcRow("c", { 6 }, 1, 4, 0, -37.20),

        qcRow("n", { 7 }, 1, 3, 0, -53.90),
        qcRow("n", { 7 }, 1, 1, 0, -53.80),
        qcRow("n", { 7 }, 2, 2, 0, -52.90),
        qcRow("n", { 7 }, 1, 3, -1, -37.79),
        qcRow("n", { 7 }, 1, 1, -1, -37.74),
        qcRow("n", { 7 }, 2, 2, -1, -37.41),

        qcRow("b", { 5 }, -1, 3, 0, -24.65),
        qcRow("b", { 5 }, 0, 2, 0, -24.60),
    };
}

inline std::vector<QATSRow> atomQATSRows()
{
    return {
        qatsRow("n", { 7 }, 1, 3, { -53.90, 10.0, -0.50, 0.01 }),
        qatsRow("n", { 7 }, 1, 1, { -53.80, 10.1, -0.40, 0.02 }),
        qatsRow("n", { 7 }, 2, 2, { -52.90, 10.5, -0.45, 0.01 }),

        qatsRow("b", { 5 }, -1, 3, { -24.65, 13.0, 0.15 }),
        qatsRow("b", { 5 }, 0, 2, { -24.60, 12.6, 0.20 }),
    };
}

inline QCTable atomQC() { return QCTable(atomQCRows()); }
inline QATSTable atomQATS() { return QATSTable(atomQATSRows()); }

inline std::vector<double> bondLengths()
{
    return { 0.9, 1.0, 1.1, 1.2, 1.3, 1.4, 1.5 };
}

inline double parabola(double minimum, double r0, double r)
{
    return minimum + 0.5 * (r - r0) * (r - r0);
}

inline std::vector<QCRow> dimerQCRows()
{
    std::vector<QCRow> rows;
    // Reverse order, curves have to be sorted by bond length
    std::vector<double> lengths = bondLengths();
    for (auto it = lengths.rbegin(); it != lengths.rend(); ++it) {
        const double r = *it;
        rows.push_back(qcRow("c.o", { 6, 8 }, 0, 1, 0, parabola(-113.0, 1.10, r), r, dimer_basis));
        rows.push_back(qcRow("c.o", { 6, 8 }, 0, 3, 0, parabola(-112.7, 1.20, r), r, dimer_basis));
        rows.push_back(qcRow("c.o", { 6, 8 }, 1, 2, 0, parabola(-112.5, 1.12, r), r, dimer_basis));

        rows.push_back(qcRow("n.n", { 7, 7 }, 0, 1, 0, parabola(-109.0, 1.10, r), r, dimer_basis));
        rows.push_back(qcRow("n.n", { 7, 7 }, 1, 2, 0, parabola(-108.4, 1.12, r), r, dimer_basis));
        rows.push_back(qcRow("n.n", { 7, 7 }, 0, 1, 1, parabola(-113.01, 1.10, r), r, dimer_basis));
        rows.push_back(qcRow("n.n", { 7, 7 }, 1, 2, 1, parabola(-112.5, 1.12, r), r, dimer_basis));

        rows.push_back(qcRow("b.f", { 5, 9 }, 0, 1, 0, parabola(-124.0, 1.27, r), r, dimer_basis));
    }
    return rows;
}

inline std::vector<QATSRow> dimerQATSRows()
{
    std::vector<QATSRow> rows;
    for (double r : bondLengths()) {
        rows.push_back(qatsRow("n.n", { 7, 7 }, 0, 1, { parabola(-109.0, 1.10, r), -4.0, 0.0 }, r, dimer_basis));
        rows.push_back(qatsRow("n.n", { 7, 7 }, 1, 2, { parabola(-108.4, 1.12, r), -4.1, 0.0 }, r, dimer_basis));
        rows.push_back(qatsRow("b.f", { 5, 9 }, 0, 1, { parabola(-124.0, 1.27, r), 11.0, 0.1 }, r, dimer_basis));
    }
    return rows;
}

inline QCTable dimerQC() { return QCTable(dimerQCRows()); }
inline QATSTable dimerQATS() { return QATSTable(dimerQATSRows()); }

} // namespace SyntheticTables
