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

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "src/core/alchemy_data.h"
#include "src/core/config_manager.h"

#include "prediction_services.h"
#include "reference_resolver.h"

namespace qalchemy {

/*! \brief Ionization energies, electron affinities and multiplicity gaps of atoms
 *
 * Configuration module "atom_prediction". Charge changes always connect ground
 * states, multiplicity gaps connect the ground state with excitation_level.
 *
 * The tables are held by reference and must outlive the predictor, temporaries
 * are rejected at compile time. Dimer targets throw std::invalid_argument.
 *
 * Example:
 * ```cpp
 * AtomPredictor predictor(qc, qats, { { "change_signs", true } });
 * auto ea = predictor.energyChangeChargeQA("c", -1);
 * ```
 */
class AtomPredictor {
public:
    AtomPredictor(const QCTable& qc, const QATSTable& qats, const json& controller = json::object(),
        PredictionServices services = PredictionServices::defaults());
    AtomPredictor(QCTable&& qc, const QATSTable& qats, const json& controller = json::object(),
        PredictionServices services = PredictionServices::defaults())
        = delete;
    AtomPredictor(const QCTable& qc, QATSTable&& qats, const json& controller = json::object(),
        PredictionServices services = PredictionServices::defaults())
        = delete;
    AtomPredictor(QCTable&& qc, QATSTable&& qats, const json& controller = json::object(),
        PredictionServices services = PredictionServices::defaults())
        = delete;

    /*! \brief E(final) - E(initial) of the target itself (lambda = 0)
     *
     * The final state is found by electron count, initial_electrons - delta_charge.
     * \return std::nullopt if either endpoint is not in the table
     * \throws std::invalid_argument for delta_charge == 0 or a dimer target
     */
    std::optional<double> energyChangeChargeQC(const std::string& target, int delta_charge, int initial_charge = 0) const;

    /*! \brief Alchemical predictions of the same difference from every usable reference
     * \return empty if the target is not in the table
     * \throws ReferenceConsistencyError if a reference gives different lambdas for
     *         the two endpoints
     */
    std::vector<ReferencePrediction> energyChangeChargeQA(const std::string& target, int delta_charge, int initial_charge = 0) const;

    /*! \brief E(excited) - E(ground) at fixed charge, std::nullopt with fewer than two states */
    std::optional<double> multiplicityGapQC(const std::string& target, int charge = 0) const;

    std::vector<ReferencePrediction> multiplicityGapQA(const std::string& target, int charge = 0) const;

    const ConfigManager& config() const { return m_config; }

private:
    QCTable targetRows(const std::string& target, int charge) const;
    std::optional<QCRow> groundState(const QCTable& rows) const;
    void checkDeltaCharge(int delta_charge) const;

    std::vector<ReferencePrediction> referencePredictions(const ReferenceRequest& request) const;
    std::optional<double> alchemicalEnergy(const std::string& system, int charge, int multiplicity, int lambda) const;

    const QCTable& m_qc;
    PredictionServices m_services;
    ReferenceResolver m_resolver;
    ConfigManager m_config;

    std::string m_basis_set;
    bool m_ignore_one_row = true;
    int m_excitation_level = 1;
    PredictionMode m_mode;
};

} // namespace qalchemy
