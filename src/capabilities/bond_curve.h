/*
 * <Bonding curves of dimers and their equilibrium>
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

#include "src/core/alchemy_data.h"
#include "src/core/config_manager.h"

#include "polynomial_fit.h"

namespace qalchemy {

/*! \brief Energies of one electronic state sorted by ascending bond length */
struct BondCurve {
    Vector bond_lengths;
    Vector energies;

    int size() const { return static_cast<int>(bond_lengths.size()); }
    bool empty() const { return bond_lengths.size() == 0; }
    json toJson() const;
};

struct EquilibriumSettings {
    int n_points = 2;
    int poly_order = 4;
    bool remove_outliers = false;
    double zscore_cutoff = 3.0;

    /*! \brief Settings from the "equilibrium" module of a configuration */
    static EquilibriumSettings fromConfig(const ConfigManager& config);
};

/*! \brief Bonding curve from computed energies
 *
 * Rows must belong to one system, charge and multiplicity of a dimer. With a
 * lambda only rows computed at that perturbation are used.
 * \throws std::invalid_argument for rows of several states or of an atom
 */
BondCurve dimerCurve(const QCTable& rows, std::optional<int> lambda = std::nullopt);

/*! \brief Bonding curve from the Taylor series of every bond length at one order */
BondCurve dimerCurve(const QATSTable& rows, int lambda, int order);

/*! \brief Drops energies whose population z score exceeds the cutoff
 *
 * A curve with constant energy is returned unchanged.
 */
BondCurve removeOutliers(const BondCurve& curve, double zscore_cutoff);

/*! \brief Equilibrium from a polynomial fitted around the lowest sample
 *
 * The fit window covers n_points samples on either side of the lowest energy,
 * clipped at the ends of the curve.
 * \throws FitError if the window holds fewer than poly_order + 1 samples
 */
Equilibrium dimerMinimum(const BondCurve& curve, const EquilibriumSettings& settings, const PolynomialFitter& fitter);

} // namespace qalchemy
