/*
 * <Quantum chemistry and QATS tables for quantum alchemy predictions>
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

#include "alchemy_data.h"
#include "elements.h"

#include <cmath>
#include <limits>

#include <fmt/format.h>

namespace qalchemy {

namespace {

template <typename T>
T required(const json& row, const char* key)
{
    if (!row.contains(key) || row.at(key).is_null())
        throw DataError(fmt::format("Row is missing required column '{}': {}", key, row.dump()));
    try {
        return row.at(key).get<T>();
    } catch (const json::exception& e) {
        throw DataError(fmt::format("Column '{}' has an unexpected type: {}", key, e.what()));
    }
}

// Fills the identifying columns shared by QC and QATS rows
template <typename Row>
void readIdentity(const json& row, Row& result)
{
    result.system = required<std::string>(row, "system");
    result.charge = required<int>(row, "charge");
    result.multiplicity = required<int>(row, "multiplicity");
    result.basis_set = required<std::string>(row, "basis_set");

    if (row.contains("atomic_numbers") && !row.at("atomic_numbers").is_null()) {
        result.atomic_numbers = required<IntList>(row, "atomic_numbers");
    } else {
        result.atomic_numbers = Elements::SystemLabel2Elements(result.system);
        if (result.atomic_numbers.empty())
            throw DataError("Cannot derive atomic numbers from system label '" + result.system + "'");
    }

    const int derived = electronCount(result.atomic_numbers, result.charge);
    if (row.contains("n_electrons") && !row.at("n_electrons").is_null()) {
        result.n_electrons = required<int>(row, "n_electrons");
        if (result.n_electrons != derived)
            throw DataError(fmt::format("Row of '{}' with charge {} lists {} electrons, atomic numbers give {}",
                result.system, result.charge, result.n_electrons, derived));
    } else {
        result.n_electrons = derived;
    }

    if (row.contains("bond_length") && !row.at("bond_length").is_null())
        result.bond_length = required<double>(row, "bond_length");
}

template <typename Row>
json writeIdentity(const Row& row)
{
    json result;
    result["system"] = row.system;
    result["atomic_numbers"] = row.atomic_numbers;
    result["charge"] = row.charge;
    result["multiplicity"] = row.multiplicity;
    result["n_electrons"] = row.n_electrons;
    result["basis_set"] = row.basis_set;
    if (row.bond_length)
        result["bond_length"] = *row.bond_length;
    else
        result["bond_length"] = nullptr;
    return result;
}

template <typename Row>
std::string describeIdentity(const Row& row)
{
    std::string text = fmt::format("{} (charge {}, multiplicity {}, {}", row.system, row.charge, row.multiplicity, row.basis_set);
    if (row.bond_length)
        text += fmt::format(", r = {:.4f}", *row.bond_length);
    return text;
}

}

double QATSRow::stateEnergy() const
{
    if (poly_coeffs.empty())
        return std::numeric_limits<double>::quiet_NaN();
    return poly_coeffs[0];
}

QCRow QCRow::fromJson(const json& row)
{
    QCRow result;
    readIdentity(row, result);
    result.lambda_value = row.contains("lambda_value") && !row.at("lambda_value").is_null()
        ? required<int>(row, "lambda_value")
        : 0;
    result.electronic_energy = required<double>(row, "electronic_energy");
    return result;
}

json QCRow::toJson() const
{
    json result = writeIdentity(*this);
    result["lambda_value"] = lambda_value;
    result["electronic_energy"] = electronic_energy;
    return result;
}

QATSRow QATSRow::fromJson(const json& row)
{
    QATSRow result;
    readIdentity(row, result);
    result.poly_coeffs = required<std::vector<double>>(row, "poly_coeffs");
    if (result.poly_coeffs.empty())
        throw DataError("QATS row of '" + result.system + "' has no polynomial coefficients");
    return result;
}

json QATSRow::toJson() const
{
    json result = writeIdentity(*this);
    result["poly_coeffs"] = poly_coeffs;
    return result;
}

std::string describe(const QCRow& row)
{
    return describeIdentity(row) + fmt::format(", lambda {})", row.lambda_value);
}

std::string describe(const QATSRow& row)
{
    return describeIdentity(row) + fmt::format(", {} coefficients)", row.poly_coeffs.size());
}

std::vector<QATSRow> checkTaylorAnchors(const QCTable& qc, const QATSTable& qats, double tolerance)
{
    std::vector<QATSRow> mismatched;
    for (const auto& fit : qats) {
        if (fit.poly_coeffs.empty())
            continue;
        auto anchor = qc.filter([&fit](const QCRow& row) {
            return row.system == fit.system && row.charge == fit.charge
                && row.multiplicity == fit.multiplicity && row.basis_set == fit.basis_set
                && row.lambda_value == 0 && row.bond_length == fit.bond_length;
        });
        if (anchor.empty())
            continue;

        const double deviation = std::abs(anchor.front().electronic_energy - fit.poly_coeffs[0]);
        if (deviation > tolerance) {
            QalchemyLogger::warn_fmt("Taylor series of {} is not anchored at its lambda = 0 energy (deviation {:.3e} Eh)",
                describe(fit), deviation);
            mismatched.push_back(fit);
        }
    }
    return mismatched;
}

} // namespace qalchemy
