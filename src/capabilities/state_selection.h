/*
 * <Electronic state selection by spin multiplicity>
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

namespace qalchemy {

/*! \brief Picks the n-th electronic state of each system
 *
 * Rows of one (system, charge) group that differ only in multiplicity are
 * different electronic states. Implementations return, per group, all rows of
 * the selected state: a single row for atoms, every bond length sample for
 * dimers.
 */
class StateSelector {
public:
    virtual ~StateSelector() = default;

    /*! \brief Rows of the excitation_level-th state of every (system, charge) group
     * \throws StateSelectionError if a group has too few states and ignore_one_row is false;
     *         with ignore_one_row such groups are dropped
     */
    virtual QCTable select(const QCTable& rows, int excitation_level, bool ignore_one_row) const = 0;
    virtual QATSTable select(const QATSTable& rows, int excitation_level, bool ignore_one_row) const = 0;

    /*! \brief Multiplicity of the excitation_level-th state of a single (system, charge) group
     *
     * std::nullopt if the rows are empty or, with ignore_one_row, the state does not exist.
     */
    virtual std::optional<int> multiplicity(const QCTable& rows, int excitation_level, bool ignore_one_row) const = 0;
    virtual std::optional<int> multiplicity(const QATSTable& rows, int excitation_level, bool ignore_one_row) const = 0;
};

/*! \brief Ranks multiplicities by ascending energy
 *
 * The energy of a state is the lowest energy of its unperturbed rows
 * (lambda = 0 for QC rows, the zeroth Taylor coefficient for QATS rows). Groups
 * without unperturbed rows are ranked by all of their rows.
 */
class EnergyOrderedStateSelector : public StateSelector {
public:
    QCTable select(const QCTable& rows, int excitation_level, bool ignore_one_row) const override;
    QATSTable select(const QATSTable& rows, int excitation_level, bool ignore_one_row) const override;

    std::optional<int> multiplicity(const QCTable& rows, int excitation_level, bool ignore_one_row) const override;
    std::optional<int> multiplicity(const QATSTable& rows, int excitation_level, bool ignore_one_row) const override;
};

} // namespace qalchemy
