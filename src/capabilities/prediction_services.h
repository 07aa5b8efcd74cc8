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

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "src/core/global.h"

#include "lambda_calculator.h"
#include "polynomial_fit.h"
#include "reference_resolver.h"
#include "state_selection.h"

namespace qalchemy {

/*! \brief Exchangeable strategies used by the predictors */
struct PredictionServices {
    std::shared_ptr<const StateSelector> selector;
    std::shared_ptr<const LambdaCalculator> lambda;
    std::shared_ptr<const PolynomialFitter> fitter;

    /*! \brief Energy ordered states, nuclear charge lambdas, least-squares fits */
    static PredictionServices defaults();
};

/*! \brief Prediction of one reference system
 *
 * predictions holds one value per Taylor order (QATS-0, QATS-1, ...) or a single
 * value for a direct alchemical lookup. With return_qats_vs_qa it holds the
 * difference QATS-n minus the direct lookup per order.
 */
struct ReferencePrediction {
    std::string reference;
    int lambda = 0;
    std::vector<double> predictions;
    int initial_charge = 0;
    int final_charge = 0;
    int initial_multiplicity = 0;
    int final_multiplicity = 0;

    json toJson() const;
};

/*! \brief Mode flags shared by the atom and dimer predictors */
struct PredictionMode {
    bool use_ts = true;
    bool return_qats_vs_qa = false;
    bool change_signs = false;
    IntList considered_lambdas;

    /*! \brief false if an allow-list is given and lambda is not on it */
    bool considers(int lambda) const;
    double sign() const { return change_signs ? -1.0 : 1.0; }

    /*! \throws std::invalid_argument if return_qats_vs_qa is set without use_ts */
    void validate() const;
};

json toJson(const std::vector<ReferencePrediction>& predictions);

/*! \brief Energies of one reference state, supplied by the atom or dimer predictor */
struct ReferenceEnergies {
    /*! \brief Taylor series energy of the state at lambda, truncated after order */
    std::function<double(const QATSTable& rows, int lambda, int order)> taylor;

    /*! \brief Energy of the computed alchemical state, std::nullopt without a calculation */
    std::function<std::optional<double>(const std::string& reference, int charge, int multiplicity, int lambda)> alchemical;
};

/*! \brief Taylor orders available for every row of both endpoints */
int commonOrders(const QATSTable& initial, const QATSTable& final_state);

/*! \brief One ReferencePrediction per resolved reference whose lambda is considered
 *
 * use_ts fills one value per common Taylor order. Without use_ts, or with
 * return_qats_vs_qa, the alchemical calculations at the reference lambda are
 * looked up and references lacking them are skipped.
 * \throws ReferenceConsistencyError if a reference gives different lambdas for
 *         the two endpoints
 */
std::vector<ReferencePrediction> predictFromReferences(const ResolvedReferences<QATSRow>& references, const ReferenceRequest& request,
    const LambdaCalculator& lambda, const PredictionMode& mode, const ReferenceEnergies& energies);

} // namespace qalchemy
