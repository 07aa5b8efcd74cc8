/*
 * <Energy differences of atoms from quantum chemistry and quantum alchemy>
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

#include "atom_predictor.h"

#include "taylor_series.h"

#include <stdexcept>

#include <fmt/format.h>

namespace qalchemy {

namespace {

// An atom has exactly one row per electronic state
std::optional<QCRow> onlyRow(const QCTable& rows, const std::string& what)
{
    if (rows.empty())
        return std::nullopt;
    if (rows.front().isDimer())
        throw std::invalid_argument(fmt::format("{} is a dimer, use DimerPredictor", rows.front().system));
    if (rows.size() > 1)
        throw ReferenceConsistencyError(fmt::format("{} has {} rows for one electronic state, expected one", what, rows.size()));
    return rows.front();
}

}

AtomPredictor::AtomPredictor(const QCTable& qc, const QATSTable& qats, const json& controller, PredictionServices services)
    : m_qc(qc)
    , m_services(std::move(services))
    , m_resolver(qc, qats, m_services.selector, m_services.lambda)
    , m_config("atom_prediction", controller)
{
    m_basis_set = m_config.get<std::string>("basis_set");
    m_ignore_one_row = m_config.get<bool>("ignore_one_row");
    m_excitation_level = m_config.get<int>("excitation_level");
    m_mode.use_ts = m_config.get<bool>("use_ts");
    m_mode.return_qats_vs_qa = m_config.get<bool>("return_qats_vs_qa");
    m_mode.change_signs = m_config.get<bool>("change_signs");
    m_mode.considered_lambdas = m_config.get<IntList>("considered_lambdas");
    m_mode.validate();

    QalchemyLogger::param_table(m_config.exportConfig(), "Atom prediction");
}

QCTable AtomPredictor::targetRows(const std::string& target, int charge) const
{
    const QCTable rows = m_qc.forSystem(target).inBasis(m_basis_set).filter([charge](const QCRow& row) {
        return row.charge == charge && row.atReferencePoint();
    });
    if (!rows.empty() && rows.front().isDimer())
        throw std::invalid_argument(fmt::format("{} is a dimer, use DimerPredictor", target));
    return rows;
}

std::optional<QCRow> AtomPredictor::groundState(const QCTable& rows) const
{
    if (rows.empty())
        return std::nullopt;
    const QCRow& first = rows.front();
    return onlyRow(m_services.selector->select(rows, 0, m_ignore_one_row),
        fmt::format("{} with {} electrons", first.system, first.n_electrons));
}

void AtomPredictor::checkDeltaCharge(int delta_charge) const
{
    if (delta_charge == 0)
        throw std::invalid_argument("delta_charge must not be zero");
    if (delta_charge < 0 && !m_mode.change_signs)
        QalchemyLogger::warn("Adding electrons without change_signs reports negative electron affinities");
}

std::optional<double> AtomPredictor::energyChangeChargeQC(const std::string& target, int delta_charge, int initial_charge) const
{
    checkDeltaCharge(delta_charge);

    const std::optional<QCRow> initial = groundState(targetRows(target, initial_charge));
    if (!initial) {
        QalchemyLogger::verbose_fmt("No QC data for {} with charge {} in {}", target, initial_charge, m_basis_set);
        return std::nullopt;
    }

    const int final_electrons = initial->n_electrons - delta_charge;
    const QCTable final_rows = m_qc.forSystem(target).inBasis(m_basis_set).withElectrons(final_electrons).filter([](const QCRow& row) {
        return row.atReferencePoint();
    });
    const std::optional<QCRow> final_state = groundState(final_rows);
    if (!final_state) {
        QalchemyLogger::verbose_fmt("No QC data for {} with {} electrons in {}", target, final_electrons, m_basis_set);
        return std::nullopt;
    }

    const double difference = m_mode.sign() * (final_state->electronic_energy - initial->electronic_energy);
    QalchemyLogger::energy_rel(difference, fmt::format("{} QC energy change ({:+d} charge)", target, delta_charge));
    return difference;
}

std::vector<ReferencePrediction> AtomPredictor::energyChangeChargeQA(const std::string& target, int delta_charge, int initial_charge) const
{
    checkDeltaCharge(delta_charge);

    const std::optional<QCRow> initial = groundState(targetRows(target, initial_charge));
    if (!initial) {
        QalchemyLogger::verbose_fmt("No QC data for {} with charge {} in {}", target, initial_charge, m_basis_set);
        return {};
    }

    ReferenceRequest request;
    request.target_label = target;
    request.target_atomic_numbers = initial->atomic_numbers;
    request.initial_electrons = initial->n_electrons;
    request.final_electrons = initial->n_electrons - delta_charge;
    request.basis_set = m_basis_set;
    request.ignore_one_row = m_ignore_one_row;
    return referencePredictions(request);
}

std::optional<double> AtomPredictor::multiplicityGapQC(const std::string& target, int charge) const
{
    if (m_excitation_level < 1)
        throw std::invalid_argument("Multiplicity gaps need an excitation level of at least 1");

    const QCTable rows = targetRows(target, charge);
    if (rows.size() < 2) {
        QalchemyLogger::verbose_fmt("{} with charge {} has fewer than two states in {}", target, charge, m_basis_set);
        return std::nullopt;
    }

    const std::string what = fmt::format("{} with charge {}", target, charge);
    const std::optional<QCRow> ground = onlyRow(m_services.selector->select(rows, 0, m_ignore_one_row), what);
    const std::optional<QCRow> excited = onlyRow(m_services.selector->select(rows, m_excitation_level, m_ignore_one_row), what);
    if (!ground || !excited)
        return std::nullopt;

    const double gap = m_mode.sign() * (excited->electronic_energy - ground->electronic_energy);
    QalchemyLogger::energy_rel(gap, fmt::format("{} QC multiplicity gap", target));
    return gap;
}

std::vector<ReferencePrediction> AtomPredictor::multiplicityGapQA(const std::string& target, int charge) const
{
    if (m_excitation_level < 1)
        throw std::invalid_argument("Multiplicity gaps need an excitation level of at least 1");

    const QCTable rows = targetRows(target, charge);
    if (rows.size() < 2) {
        QalchemyLogger::verbose_fmt("{} with charge {} has fewer than two states in {}", target, charge, m_basis_set);
        return {};
    }
    const QCRow& first = rows.front();

    ReferenceRequest request;
    request.target_label = target;
    request.target_atomic_numbers = first.atomic_numbers;
    request.initial_electrons = first.n_electrons;
    request.final_electrons = first.n_electrons;
    request.initial_excitation = 0;
    request.final_excitation = m_excitation_level;
    request.basis_set = m_basis_set;
    request.ignore_one_row = m_ignore_one_row;
    return referencePredictions(request);
}

std::vector<ReferencePrediction> AtomPredictor::referencePredictions(const ReferenceRequest& request) const
{
    ReferenceEnergies energies;
    energies.taylor = [](const QATSTable& rows, int lambda, int order) {
        return TaylorSeries::evaluate(rows.front().poly_coeffs, order, lambda).front();
    };
    energies.alchemical = [this](const std::string& reference, int charge, int multiplicity, int lambda) {
        return alchemicalEnergy(reference, charge, multiplicity, lambda);
    };
    return predictFromReferences(m_resolver.resolveQATS(request), request, *m_services.lambda, m_mode, energies);
}

std::optional<double> AtomPredictor::alchemicalEnergy(const std::string& system, int charge, int multiplicity, int lambda) const
{
    const QCTable rows = m_qc.forSystem(system).inBasis(m_basis_set).filter([charge, multiplicity, lambda](const QCRow& row) {
        return row.lambda_value == lambda && row.charge == charge && row.multiplicity == multiplicity;
    });
    if (rows.empty())
        return std::nullopt;
    if (rows.size() > 1) {
        throw ReferenceConsistencyError(fmt::format("{} has {} QC rows at lambda {} with charge {} and multiplicity {}",
            system, rows.size(), lambda, charge, multiplicity));
    }
    return rows.front().electronic_energy;
}

} // namespace qalchemy
