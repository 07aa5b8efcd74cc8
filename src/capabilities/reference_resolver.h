/*
 * <Resolution of quantum alchemy reference systems>
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

#include <memory>
#include <string>
#include <vector>

#include "src/core/alchemy_data.h"

#include "lambda_calculator.h"
#include "state_selection.h"

namespace qalchemy {

/*! \brief What a predictor needs from the reference systems
 *
 * initial and final describe the two endpoints of an energy difference, either
 * two electron counts (charge changes) or two electronic states of the same
 * electron count (multiplicity gaps).
 */
struct ReferenceRequest {
    std::string target_label;
    IntList target_atomic_numbers;
    int initial_electrons = 0;
    int final_electrons = 0;
    int initial_excitation = 0;
    int final_excitation = 0;
    std::string basis_set;
    LambdaPolicy policy;
    bool ignore_one_row = true;
};

/*! \brief State-selected reference rows for both endpoints
 *
 * Both tables contain the same systems with the same number of rows per system.
 */
template <typename Row>
struct ResolvedReferences {
    RowTable<Row> initial;
    RowTable<Row> final_state;

    std::vector<std::string> systems() const
    {
        const auto labels = initial.systems();
        return std::vector<std::string>(labels.begin(), labels.end());
    }
    bool empty() const { return initial.empty(); }
};

/*! \brief Finds the reference systems shared by both endpoints of a prediction
 *
 * Both tables are held by reference and must outlive the resolver.
 */
class ReferenceResolver {
public:
    ReferenceResolver(const QCTable& qc, const QATSTable& qats,
        std::shared_ptr<const StateSelector> selector, std::shared_ptr<const LambdaCalculator> lambda);
    ReferenceResolver(QCTable&& qc, const QATSTable& qats,
        std::shared_ptr<const StateSelector> selector, std::shared_ptr<const LambdaCalculator> lambda)
        = delete;
    ReferenceResolver(const QCTable& qc, QATSTable&& qats,
        std::shared_ptr<const StateSelector> selector, std::shared_ptr<const LambdaCalculator> lambda)
        = delete;
    ReferenceResolver(QCTable&& qc, QATSTable&& qats,
        std::shared_ptr<const StateSelector> selector, std::shared_ptr<const LambdaCalculator> lambda)
        = delete;

    /*! \brief Rows of all other systems with n_electrons in basis_set
     *
     * QC candidates are restricted to unperturbed (lambda = 0) rows.
     */
    static QATSTable candidates(const QATSTable& table, const std::string& target_label, int n_electrons, const std::string& basis_set);
    static QCTable candidates(const QCTable& table, const std::string& target_label, int n_electrons, const std::string& basis_set);

    /*! \brief References usable for both endpoints, taken from the QATS table
     * \throws ReferenceConsistencyError if a system keeps a different number of
     *         rows for the two endpoints
     * \throws StateSelectionError from the selector unless ignore_one_row is set
     */
    ResolvedReferences<QATSRow> resolveQATS(const ReferenceRequest& request) const;

    /*! \brief Same as resolveQATS(), with unperturbed QC rows as the selection source */
    ResolvedReferences<QCRow> resolveQC(const ReferenceRequest& request) const;

private:
    template <typename Row>
    ResolvedReferences<Row> resolve(const RowTable<Row>& table, const ReferenceRequest& request) const;

    const QCTable& m_qc;
    const QATSTable& m_qats;
    std::shared_ptr<const StateSelector> m_selector;
    std::shared_ptr<const LambdaCalculator> m_lambda;
};

} // namespace qalchemy
