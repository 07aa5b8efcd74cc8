/*
 * <Energy differences of dimers from bonding curve minima>
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

#include "dimer_predictor.h"

#include <stdexcept>

#include <fmt/format.h>

namespace qalchemy {

json ReferenceCurves::toJson() const
{
    json result;
    result["reference"] = reference;
    result["lambda"] = lambda;
    result["curves"] = json::array();
    for (const auto& curve : curves)
        result["curves"].push_back(curve.toJson());
    return result;
}

json ReferenceEquilibria::toJson() const
{
    json result;
    result["reference"] = reference;
    result["lambda"] = lambda;
    result["bond_lengths"] = json::array();
    result["energies"] = json::array();
    for (const auto& equilibrium : equilibria) {
        result["bond_lengths"].push_back(equilibrium.bond_length);
        result["energies"].push_back(equilibrium.energy);
    }
    return result;
}

DimerPredictor::DimerPredictor(const QCTable& qc, const QATSTable& qats, const json& controller, PredictionServices services)
    : m_qc(qc)
    , m_services(std::move(services))
    , m_resolver(qc, qats, m_services.selector, m_services.lambda)
    , m_config(std::vector<std::string>{ "dimer_prediction", "equilibrium" }, controller)
{
    if (!m_services.fitter)
        throw std::invalid_argument("DimerPredictor needs a polynomial fitter");

    m_basis_set = m_config.get<std::string>("basis_set");
    m_ignore_one_row = m_config.get<bool>("ignore_one_row");
    m_excitation_level = m_config.get<int>("excitation_level");
    m_mode.use_ts = m_config.get<bool>("use_ts");
    m_mode.return_qats_vs_qa = m_config.get<bool>("return_qats_vs_qa");
    m_mode.change_signs = m_config.get<bool>("change_signs");
    m_mode.considered_lambdas = m_config.get<IntList>("considered_lambdas");
    m_mode.validate();
    m_policy = LambdaPolicy::fromConfig(m_config.get<int>("lambda_specific_atom"), m_config.get<std::string>("lambda_direction"));
    m_settings = EquilibriumSettings::fromConfig(m_config);

    QalchemyLogger::param_table(m_config.exportConfig(), "Dimer prediction");
}

QCTable DimerPredictor::targetRows(const std::string& target, int charge) const
{
    return m_qc.forSystem(target).inBasis(m_basis_set).filter([charge](const QCRow& row) {
        return row.charge == charge && row.atReferencePoint();
    });
}

QCTable DimerPredictor::targetState(const QCTable& rows, int excitation_level) const
{
    if (rows.empty())
        return rows;
    if (!rows.front().isDimer())
        throw std::invalid_argument(fmt::format("{} is not a dimer, use AtomPredictor", rows.front().system));

    const std::optional<int> multiplicity = m_services.selector->multiplicity(rows, excitation_level, m_ignore_one_row);
    if (!multiplicity)
        return QCTable();
    return rows.filter([&multiplicity](const QCRow& row) { return row.multiplicity == *multiplicity; });
}

double DimerPredictor::equilibriumEnergy(const BondCurve& curve) const
{
    return dimerMinimum(curve, m_settings, *m_services.fitter).energy;
}

void DimerPredictor::requirePolicy() const
{
    if (!m_policy.isSet())
        throw std::invalid_argument("Alchemical dimer predictions need lambda_specific_atom or lambda_direction");
}

QCTable DimerPredictor::alchemicalRows(const std::string& system, int charge, int multiplicity, int lambda) const
{
    return m_qc.forSystem(system).inBasis(m_basis_set).filter([charge, multiplicity, lambda](const QCRow& row) {
        return row.charge == charge && row.multiplicity == multiplicity && row.lambda_value == lambda;
    });
}

std::optional<double> DimerPredictor::energyChangeChargeQC(const std::string& target, int delta_charge, int initial_charge) const
{
    if (delta_charge == 0)
        throw std::invalid_argument("delta_charge must not be zero");

    const QCTable initial = targetState(targetRows(target, initial_charge), 0);
    if (initial.empty()) {
        QalchemyLogger::verbose_fmt("No QC data for {} with charge {} in {}", target, initial_charge, m_basis_set);
        return std::nullopt;
    }

    const int final_electrons = initial.front().n_electrons - delta_charge;
    const QCTable final_rows = m_qc.forSystem(target).inBasis(m_basis_set).withElectrons(final_electrons).filter([](const QCRow& row) {
        return row.atReferencePoint();
    });
    const QCTable final_state = targetState(final_rows, 0);
    if (final_state.empty()) {
        QalchemyLogger::verbose_fmt("No QC data for {} with {} electrons in {}", target, final_electrons, m_basis_set);
        return std::nullopt;
    }

    const double e_initial = equilibriumEnergy(dimerCurve(initial));
    const double e_final = equilibriumEnergy(dimerCurve(final_state));
    const double difference = m_mode.sign() * (e_final - e_initial);
    QalchemyLogger::energy_rel(difference, fmt::format("{} QC energy change ({:+d} charge)", target, delta_charge));
    return difference;
}

std::vector<ReferencePrediction> DimerPredictor::energyChangeChargeQA(const std::string& target, int delta_charge, int initial_charge) const
{
    if (delta_charge == 0)
        throw std::invalid_argument("delta_charge must not be zero");
    requirePolicy();

    const QCTable initial = targetState(targetRows(target, initial_charge), 0);
    if (initial.empty()) {
        QalchemyLogger::verbose_fmt("No QC data for {} with charge {} in {}", target, initial_charge, m_basis_set);
        return {};
    }

    ReferenceRequest request;
    request.target_label = target;
    request.target_atomic_numbers = initial.front().atomic_numbers;
    request.initial_electrons = initial.front().n_electrons;
    request.final_electrons = initial.front().n_electrons - delta_charge;
    request.basis_set = m_basis_set;
    request.policy = m_policy;
    request.ignore_one_row = m_ignore_one_row;

    ReferenceEnergies energies;
    energies.taylor = [this](const QATSTable& rows, int lambda, int order) {
        return equilibriumEnergy(dimerCurve(rows, lambda, order));
    };
    energies.alchemical = [this](const std::string& reference, int charge, int multiplicity, int lambda) -> std::optional<double> {
        const QCTable rows = alchemicalRows(reference, charge, multiplicity, lambda);
        if (rows.empty())
            return std::nullopt;
        return equilibriumEnergy(dimerCurve(rows, lambda));
    };
    return predictFromReferences(m_resolver.resolveQATS(request), request, *m_services.lambda, m_mode, energies);
}

std::vector<ReferenceCurves> DimerPredictor::bondingCurves(const std::string& target, int charge, CurveMethod method) const
{
    const QCTable state = targetState(targetRows(target, charge), m_excitation_level);
    if (state.empty()) {
        QalchemyLogger::verbose_fmt("No state {} of {} with charge {} in {}", m_excitation_level, target, charge, m_basis_set);
        return {};
    }

    if (method == CurveMethod::QC)
        return { ReferenceCurves{ target, 0, { dimerCurve(state) } } };

    requirePolicy();

    ReferenceRequest request;
    request.target_label = target;
    request.target_atomic_numbers = state.front().atomic_numbers;
    request.initial_electrons = state.front().n_electrons;
    request.final_electrons = state.front().n_electrons;
    request.initial_excitation = m_excitation_level;
    request.final_excitation = m_excitation_level;
    request.basis_set = m_basis_set;
    request.policy = m_policy;
    request.ignore_one_row = m_ignore_one_row;

    std::vector<ReferenceCurves> result;
    if (m_mode.use_ts) {
        const ResolvedReferences<QATSRow> references = m_resolver.resolveQATS(request);
        for (const auto& label : references.systems()) {
            const QATSTable rows = references.initial.forSystem(label);
            const int lambda = m_services.lambda->lambda(rows.front().atomic_numbers, request.target_atomic_numbers, m_policy);
            if (!m_mode.considers(lambda))
                continue;

            ReferenceCurves curves{ label, lambda, {} };
            const int orders = commonOrders(rows, rows);
            for (int order = 0; order < orders; ++order)
                curves.curves.push_back(dimerCurve(rows, lambda, order));
            result.push_back(std::move(curves));
        }
        return result;
    }

    const ResolvedReferences<QCRow> references = m_resolver.resolveQC(request);
    for (const auto& label : references.systems()) {
        const QCRow reference = references.initial.forSystem(label).front();
        const int lambda = m_services.lambda->lambda(reference.atomic_numbers, request.target_atomic_numbers, m_policy);
        if (!m_mode.considers(lambda))
            continue;

        const QCTable rows = alchemicalRows(label, reference.charge, reference.multiplicity, lambda);
        if (rows.empty()) {
            QalchemyLogger::verbose_fmt("Skipping reference {}: no QC calculations at lambda {}", label, lambda);
            continue;
        }
        result.push_back(ReferenceCurves{ label, lambda, { dimerCurve(rows, lambda) } });
    }
    return result;
}

std::vector<ReferenceEquilibria> DimerPredictor::equilibria(const std::string& target, int charge, CurveMethod method) const
{
    std::vector<ReferenceEquilibria> result;
    for (const auto& curves : bondingCurves(target, charge, method)) {
        ReferenceEquilibria entry{ curves.reference, curves.lambda, {} };
        for (const auto& curve : curves.curves) {
            const Equilibrium minimum = dimerMinimum(curve, m_settings, *m_services.fitter);
            const std::string what = fmt::format("{} curve {}", curves.reference, entry.equilibria.size());
            QalchemyLogger::length(minimum.bond_length, fmt::format("{} equilibrium bond length", what));
            QalchemyLogger::energy_abs(minimum.energy, fmt::format("{} equilibrium energy", what));
            entry.equilibria.push_back(minimum);
        }
        result.push_back(std::move(entry));
    }
    return result;
}

} // namespace qalchemy
