/*
 * <Computed alchemical energies of a reference system>
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

#include "state_selection.h"

namespace qalchemy {

struct AlchemicalScanSettings {
    int excitation_level = 0;
    std::string basis_set = "aug-cc-pV5Z";
    std::optional<double> bond_length; // required for dimers
    bool ignore_one_row = true;
};

/*! \brief QC energies of ref_label at every requested lambda
 *
 * The electronic state is chosen once for all lambdas. Slots without a
 * calculation are std::nullopt.
 * \throws std::invalid_argument for a dimer without bond_length
 * \throws ReferenceConsistencyError if a lambda has more than one calculation
 */
std::vector<std::optional<double>> alchemicalEnergies(const QCTable& qc, const StateSelector& selector,
    const std::string& ref_label, int ref_charge, const IntList& lambdas, const AlchemicalScanSettings& settings = AlchemicalScanSettings());

} // namespace qalchemy
