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

#include "reference_resolver.h"

#include <set>
#include <stdexcept>

#include <fmt/format.h>

namespace qalchemy {

namespace {

template <typename Row>
RowTable<Row> restrictTo(const RowTable<Row>& rows, const std::set<std::string>& systems)
{
    return rows.filter([&systems](const Row& row) { return systems.count(row.system) > 0; });
}

std::set<std::string> intersection(const std::set<std::string>& a, const std::set<std::string>& b)
{
    std::set<std::string> result;
    for (const auto& label : a) {
        if (b.count(label))
            result.insert(label);
    }
    return result;
}

}

ReferenceResolver::ReferenceResolver(const QCTable& qc, const QATSTable& qats,
    std::shared_ptr<const StateSelector> selector, std::shared_ptr<const LambdaCalculator> lambda)
    : m_qc(qc)
    , m_qats(qats)
    , m_selector(std::move(selector))
    , m_lambda(std::move(lambda))
{
    if (!m_selector || !m_lambda)
        throw std::invalid_argument("ReferenceResolver needs a state selector and a lambda calculator");
}

QATSTable ReferenceResolver::candidates(const QATSTable& table, const std::string& target_label, int n_electrons, const std::string& basis_set)
{
    return table.filter([&](const QATSRow& row) {
        return row.system != target_label && row.n_electrons == n_electrons && row.basis_set == basis_set;
    });
}

QCTable ReferenceResolver::candidates(const QCTable& table, const std::string& target_label, int n_electrons, const std::string& basis_set)
{
    return table.filter([&](const QCRow& row) {
        return row.system != target_label && row.n_electrons == n_electrons && row.basis_set == basis_set
            && row.lambda_value == 0;
    });
}

template <typename Row>
ResolvedReferences<Row> ReferenceResolver::resolve(const RowTable<Row>& table, const ReferenceRequest& request) const
{
    RowTable<Row> initial = candidates(table, request.target_label, request.initial_electrons, request.basis_set);
    RowTable<Row> final_state = candidates(table, request.target_label, request.final_electrons, request.basis_set);

    // References need data for both endpoints and a perturbation the policy can express
    std::set<std::string> usable;
    for (const auto& label : intersection(initial.systems(), final_state.systems())) {
        const Row reference = initial.forSystem(label).front();
        if (!m_lambda->compatible(reference.atomic_numbers, request.target_atomic_numbers, request.policy)) {
            QalchemyLogger::verbose_fmt("Reference {} cannot be perturbed into {} with the current lambda policy", label, request.target_label);
            continue;
        }
        usable.insert(label);
    }

    initial = m_selector->select(restrictTo(initial, usable), request.initial_excitation, request.ignore_one_row);
    final_state = m_selector->select(restrictTo(final_state, usable), request.final_excitation, request.ignore_one_row);

    // Selection may drop a system on one side only
    const std::set<std::string> surviving = intersection(initial.systems(), final_state.systems());
    ResolvedReferences<Row> result{ restrictTo(initial, surviving), restrictTo(final_state, surviving) };

    for (const auto& label : surviving) {
        const size_t n_initial = result.initial.forSystem(label).size();
        const size_t n_final = result.final_state.forSystem(label).size();
        if (n_initial != n_final) {
            throw ReferenceConsistencyError(fmt::format("Reference {} for {} has {} row(s) for {} electrons (state {}) but {} row(s) for {} electrons (state {})",
                label, request.target_label, n_initial, request.initial_electrons, request.initial_excitation,
                n_final, request.final_electrons, request.final_excitation));
        }
    }

    QalchemyLogger::verbose_fmt("{} reference system(s) resolved for {} ({} -> {} electrons)",
        surviving.size(), request.target_label, request.initial_electrons, request.final_electrons);
    return result;
}

ResolvedReferences<QATSRow> ReferenceResolver::resolveQATS(const ReferenceRequest& request) const
{
    return resolve(m_qats, request);
}

ResolvedReferences<QCRow> ReferenceResolver::resolveQC(const ReferenceRequest& request) const
{
    return resolve(m_qc, request);
}

} // namespace qalchemy
