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

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "src/core/alchemy_data.h"
#include "src/core/config_manager.h"

#include "bond_curve.h"
#include "prediction_services.h"
#include "reference_resolver.h"

namespace qalchemy {

enum class CurveMethod {
    QC, // the target's own calculations
    Alchemy // alchemical curves of the references
};

/*! \brief Bonding curves of one system, one curve per Taylor order or a single curve */
struct ReferenceCurves {
    std::string reference;
    int lambda = 0;
    std::vector<BondCurve> curves;

    json toJson() const;
};

struct ReferenceEquilibria {
    std::string reference;
    int lambda = 0;
    std::vector<Equilibrium> equilibria;

    json toJson() const;
};

/*! \brief Charge changes and bonding curves of diatomic molecules
 *
 * Every energy is the minimum of a polynomial fitted to a bonding curve.
 * Configuration modules "dimer_prediction" (primary) and "equilibrium".
 * Alchemical predictions need lambda_specific_atom or lambda_direction.
 * The tables are held by reference and must outlive the predictor.
 */
class DimerPredictor {
public:
    DimerPredictor(const QCTable& qc, const QATSTable& qats, const json& controller = json::object(),
        PredictionServices services = PredictionServices::defaults());
    DimerPredictor(QCTable&& qc, const QATSTable& qats, const json& controller = json::object(),
        PredictionServices services = PredictionServices::defaults())
        = delete;
    DimerPredictor(const QCTable& qc, QATSTable&& qats, const json& controller = json::object(),
        PredictionServices services = PredictionServices::defaults())
        = delete;
    DimerPredictor(QCTable&& qc, QATSTable&& qats, const json& controller = json::object(),
        PredictionServices services = PredictionServices::defaults())
        = delete;

    /*! \brief Difference of the equilibrium energies of the target's ground states
     * \return std::nullopt if either charge state is missing
     */
    std::optional<double> energyChangeChargeQC(const std::string& target, int delta_charge, int initial_charge = 0) const;

    /*! \brief Alchemical predictions of the same difference
     *
     * With use_ts every Taylor order gets its own bonding curves and minima.
     * \throws std::invalid_argument if no lambda distribution is configured
     */
    std::vector<ReferencePrediction> energyChangeChargeQA(const std::string& target, int delta_charge, int initial_charge = 0) const;

    /*! \brief Bonding curves of the excitation_level-th state at the given charge */
    std::vector<ReferenceCurves> bondingCurves(const std::string& target, int charge, CurveMethod method) const;

    /*! \brief Equilibrium bond length and energy of every curve of bondingCurves() */
    std::vector<ReferenceEquilibria> equilibria(const std::string& target, int charge, CurveMethod method) const;

    const ConfigManager& config() const { return m_config; }
    const EquilibriumSettings& equilibriumSettings() const { return m_settings; }

private:
    QCTable targetRows(const std::string& target, int charge) const;
    QCTable targetState(const QCTable& rows, int excitation_level) const;
    double equilibriumEnergy(const BondCurve& curve) const;
    void requirePolicy() const;

    /*! \brief Computed alchemical rows of a reference state at lambda */
    QCTable alchemicalRows(const std::string& system, int charge, int multiplicity, int lambda) const;

    const QCTable& m_qc;
    PredictionServices m_services;
    ReferenceResolver m_resolver;
    ConfigManager m_config;

    std::string m_basis_set;
    bool m_ignore_one_row = true;
    int m_excitation_level = 0;
    PredictionMode m_mode;
    LambdaPolicy m_policy;
    EquilibriumSettings m_settings;
};

} // namespace qalchemy
