/*
 * <Shared building blocks of the energy-difference predictors>
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

#include "prediction_services.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>

namespace qalchemy {

PredictionServices PredictionServices::defaults()
{
    PredictionServices services;
    services.selector = std::make_shared<EnergyOrderedStateSelector>();
    services.lambda = std::make_shared<NuclearChargeLambda>();
    services.fitter = std::make_shared<LeastSquaresPolynomialFitter>();
    return services;
}

json ReferencePrediction::toJson() const
{
    json result;
    result["reference"] = reference;
    result["lambda"] = lambda;
    result["predictions"] = predictions;
    result["initial_charge"] = initial_charge;
    result["final_charge"] = final_charge;
    result["initial_multiplicity"] = initial_multiplicity;
    result["final_multiplicity"] = final_multiplicity;
    return result;
}

bool PredictionMode::considers(int lambda) const
{
    if (considered_lambdas.empty())
        return true;
    return std::find(considered_lambdas.begin(), considered_lambdas.end(), lambda) != considered_lambdas.end();
}

void PredictionMode::validate() const
{
    if (return_qats_vs_qa && !use_ts)
        throw std::invalid_argument("return_qats_vs_qa compares Taylor series predictions and requires use_ts");
}

json toJson(const std::vector<ReferencePrediction>& predictions)
{
    json result = json::array();
    for (const auto& prediction : predictions)
        result.push_back(prediction.toJson());
    return result;
}

int commonOrders(const QATSTable& initial, const QATSTable& final_state)
{
    size_t orders = std::numeric_limits<size_t>::max();
    for (const auto& row : initial)
        orders = std::min(orders, row.poly_coeffs.size());
    for (const auto& row : final_state)
        orders = std::min(orders, row.poly_coeffs.size());
    return orders == std::numeric_limits<size_t>::max() ? 0 : static_cast<int>(orders);
}

std::vector<ReferencePrediction> predictFromReferences(const ResolvedReferences<QATSRow>& references, const ReferenceRequest& request,
    const LambdaCalculator& lambda, const PredictionMode& mode, const ReferenceEnergies& energies)
{
    std::vector<ReferencePrediction> predictions;
    for (const auto& label : references.systems()) {
        const QATSTable ref_initial = references.initial.forSystem(label);
        const QATSTable ref_final = references.final_state.forSystem(label);

        const int lambda_initial = lambda.lambda(ref_initial.front().atomic_numbers, request.target_atomic_numbers, request.policy);
        const int lambda_final = lambda.lambda(ref_final.front().atomic_numbers, request.target_atomic_numbers, request.policy);
        if (lambda_initial != lambda_final) {
            throw ReferenceConsistencyError(fmt::format("Reference {} gives lambda {} for the initial and {} for the final state of {}",
                label, lambda_initial, lambda_final, request.target_label));
        }
        if (!mode.considers(lambda_initial)) {
            QalchemyLogger::verbose_fmt("Skipping reference {}: lambda {} is not considered", label, lambda_initial);
            continue;
        }

        ReferencePrediction prediction;
        prediction.reference = label;
        prediction.lambda = lambda_initial;
        prediction.initial_charge = ref_initial.front().charge;
        prediction.final_charge = ref_final.front().charge;
        prediction.initial_multiplicity = ref_initial.front().multiplicity;
        prediction.final_multiplicity = ref_final.front().multiplicity;

        if (mode.use_ts) {
            const int orders = commonOrders(ref_initial, ref_final);
            for (int order = 0; order < orders; ++order) {
                const double e_initial = energies.taylor(ref_initial, lambda_initial, order);
                const double e_final = energies.taylor(ref_final, lambda_final, order);
                prediction.predictions.push_back(mode.sign() * (e_final - e_initial));
            }
        }

        if (!mode.use_ts || mode.return_qats_vs_qa) {
            const std::optional<double> e_initial = energies.alchemical(label, prediction.initial_charge, prediction.initial_multiplicity, lambda_initial);
            const std::optional<double> e_final = energies.alchemical(label, prediction.final_charge, prediction.final_multiplicity, lambda_initial);
            if (!e_initial || !e_final) {
                QalchemyLogger::verbose_fmt("Skipping reference {}: no QC calculation at lambda {}", label, lambda_initial);
                continue;
            }
            const double e_diff = mode.sign() * (*e_final - *e_initial);
            if (mode.return_qats_vs_qa) {
                for (double& value : prediction.predictions)
                    value -= e_diff;
            } else {
                prediction.predictions = { e_diff };
            }
        }

        if (!prediction.predictions.empty())
            QalchemyLogger::energy_rel(prediction.predictions.back(), fmt::format("{} from {} (lambda {})", request.target_label, label, lambda_initial));
        predictions.push_back(std::move(prediction));
    }

    QalchemyLogger::info_fmt("{} prediction(s) for {} from {} reference(s)", predictions.size(), request.target_label, references.systems().size());
    return predictions;
}

} // namespace qalchemy
