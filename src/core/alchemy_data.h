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

#pragma once

#include <numeric>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "src/core/global.h"
#include "src/core/qalchemy_errors.h"

namespace qalchemy {

/*! \brief One exact quantum chemistry calculation
 *
 * lambda_value is the nuclear charge perturbation the energy was computed at,
 * 0 is the unperturbed system. bond_length is only set for dimers (Angstrom).
 */
struct QCRow {
    std::string system;
    IntList atomic_numbers;
    int charge = 0;
    int multiplicity = 1;
    int n_electrons = 0;
    std::string basis_set;
    int lambda_value = 0;
    std::optional<double> bond_length;
    double electronic_energy = 0.0;

    bool isDimer() const { return atomic_numbers.size() == 2; }

    // Rows that take part in ranking electronic states
    bool atReferencePoint() const { return lambda_value == 0; }
    double stateEnergy() const { return electronic_energy; }

    static QCRow fromJson(const json& row);
    json toJson() const;
};

/*! \brief Fitted alchemical Taylor series of one system
 *
 * poly_coeffs are in increasing degree, poly_coeffs[0] is the lambda = 0 energy.
 */
struct QATSRow {
    std::string system;
    IntList atomic_numbers;
    int charge = 0;
    int multiplicity = 1;
    int n_electrons = 0;
    std::string basis_set;
    std::optional<double> bond_length;
    std::vector<double> poly_coeffs;

    bool isDimer() const { return atomic_numbers.size() == 2; }

    bool atReferencePoint() const { return true; }
    double stateEnergy() const;

    static QATSRow fromJson(const json& row);
    json toJson() const;
};

/*! \brief sum(atomic_numbers) - charge */
inline int electronCount(const IntList& atomic_numbers, int charge)
{
    return std::accumulate(atomic_numbers.begin(), atomic_numbers.end(), 0) - charge;
}

std::string describe(const QCRow& row);
std::string describe(const QATSRow& row);

/*! \brief Immutable, ordered view on table rows
 *
 * Every selection returns a new table, the source table is never modified.
 * Construction from rows validates the electron count identity of each row.
 */
template <typename Row>
class RowTable {
public:
    using const_iterator = typename std::vector<Row>::const_iterator;

    RowTable() = default;
    explicit RowTable(std::vector<Row> rows)
        : m_rows(std::move(rows))
    {
        for (const auto& row : m_rows)
            validate(row);
    }

    static RowTable fromJson(const json& rows)
    {
        if (!rows.is_array())
            throw DataError("Table must be given as a JSON array of rows");
        std::vector<Row> parsed;
        parsed.reserve(rows.size());
        for (const auto& row : rows)
            parsed.push_back(Row::fromJson(row));
        return RowTable(std::move(parsed));
    }

    json toJson() const
    {
        json rows = json::array();
        for (const auto& row : m_rows)
            rows.push_back(row.toJson());
        return rows;
    }

    template <typename Predicate>
    RowTable filter(Predicate&& predicate) const
    {
        RowTable result;
        for (const auto& row : m_rows) {
            if (predicate(row))
                result.m_rows.push_back(row);
        }
        return result;
    }

    RowTable forSystem(const std::string& label) const
    {
        return filter([&label](const Row& row) { return row.system == label; });
    }

    RowTable inBasis(const std::string& basis_set) const
    {
        return filter([&basis_set](const Row& row) { return row.basis_set == basis_set; });
    }

    RowTable withElectrons(int n_electrons) const
    {
        return filter([n_electrons](const Row& row) { return row.n_electrons == n_electrons; });
    }

    /*! \brief Sorted system labels present in the table */
    std::set<std::string> systems() const
    {
        std::set<std::string> labels;
        for (const auto& row : m_rows)
            labels.insert(row.system);
        return labels;
    }

    std::set<int> multiplicities() const
    {
        std::set<int> values;
        for (const auto& row : m_rows)
            values.insert(row.multiplicity);
        return values;
    }

    std::set<int> charges() const
    {
        std::set<int> values;
        for (const auto& row : m_rows)
            values.insert(row.charge);
        return values;
    }

    RowTable merged(const RowTable& other) const
    {
        RowTable result = *this;
        result.m_rows.insert(result.m_rows.end(), other.m_rows.begin(), other.m_rows.end());
        return result;
    }

    size_t size() const { return m_rows.size(); }
    bool empty() const { return m_rows.empty(); }
    const Row& front() const { return m_rows.front(); }
    const Row& operator[](size_t index) const { return m_rows[index]; }
    const_iterator begin() const { return m_rows.begin(); }
    const_iterator end() const { return m_rows.end(); }
    const std::vector<Row>& rows() const { return m_rows; }

private:
    static void validate(const Row& row)
    {
        if (row.atomic_numbers.empty())
            throw DataError("Row of system '" + row.system + "' has no atomic numbers");
        if (electronCount(row.atomic_numbers, row.charge) != row.n_electrons)
            throw DataError("Row " + describe(row) + " violates n_electrons = sum(atomic_numbers) - charge");
    }

    std::vector<Row> m_rows;
};

typedef RowTable<QCRow> QCTable;
typedef RowTable<QATSRow> QATSTable;

/*! \brief QATS rows whose zeroth coefficient does not match the lambda = 0 QC energy
 *
 * Rows without a matching QC calculation are not reported.
 */
std::vector<QATSRow> checkTaylorAnchors(const QCTable& qc, const QATSTable& qats, double tolerance = 1e-6);

} // namespace qalchemy
