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

#include "state_selection.h"

#include <algorithm>
#include <limits>
#include <map>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace qalchemy {

namespace {

/*! \brief Multiplicities of one group ordered by their state energy */
template <typename Row>
std::vector<int> rankStates(const RowTable<Row>& group)
{
    const bool has_reference = std::any_of(group.begin(), group.end(),
        [](const Row& row) { return row.atReferencePoint(); });

    std::map<int, double> lowest;
    for (const auto& row : group) {
        if (has_reference && !row.atReferencePoint())
            continue;
        auto it = lowest.find(row.multiplicity);
        if (it == lowest.end())
            lowest[row.multiplicity] = row.stateEnergy();
        else
            it->second = std::min(it->second, row.stateEnergy());
    }

    std::vector<std::pair<double, int>> states;
    for (const auto& [multiplicity, energy] : lowest)
        states.emplace_back(energy, multiplicity);
    std::sort(states.begin(), states.end());

    std::vector<int> ranked;
    for (const auto& state : states)
        ranked.push_back(state.second);
    return ranked;
}

/*! \brief Multiplicity of the requested state or nullopt (ignore_one_row) */
template <typename Row>
std::optional<int> pickState(const RowTable<Row>& group, int excitation_level, bool ignore_one_row)
{
    if (excitation_level < 0)
        throw std::invalid_argument("Excitation level must not be negative");

    const std::vector<int> ranked = rankStates(group);
    if (excitation_level < static_cast<int>(ranked.size()))
        return ranked[excitation_level];

    const Row& first = group.front();
    if (!ignore_one_row) {
        throw StateSelectionError(fmt::format("{} with charge {} has {} electronic state(s), state {} was requested",
            first.system, first.charge, ranked.size(), excitation_level));
    }
    QalchemyLogger::verbose_fmt("Skipping {} with charge {}: only {} state(s) for excitation level {}",
        first.system, first.charge, ranked.size(), excitation_level);
    return std::nullopt;
}

template <typename Row>
RowTable<Row> selectStates(const RowTable<Row>& rows, int excitation_level, bool ignore_one_row)
{
    std::map<std::pair<std::string, int>, int> chosen;
    for (const auto& label : rows.systems()) {
        const RowTable<Row> system_rows = rows.forSystem(label);
        for (int charge : system_rows.charges()) {
            const RowTable<Row> group = system_rows.filter([charge](const Row& row) { return row.charge == charge; });
            std::optional<int> multiplicity = pickState(group, excitation_level, ignore_one_row);
            if (multiplicity)
                chosen[{ label, charge }] = *multiplicity;
        }
    }

    return rows.filter([&chosen](const Row& row) {
        auto it = chosen.find({ row.system, row.charge });
        return it != chosen.end() && it->second == row.multiplicity;
    });
}

template <typename Row>
std::optional<int> selectMultiplicity(const RowTable<Row>& rows, int excitation_level, bool ignore_one_row)
{
    if (rows.empty())
        return std::nullopt;
    if (rows.systems().size() != 1 || rows.charges().size() != 1) {
        throw std::invalid_argument(fmt::format("Multiplicity selection needs rows of exactly one system and charge, got {} systems and {} charges",
            rows.systems().size(), rows.charges().size()));
    }
    return pickState(rows, excitation_level, ignore_one_row);
}

}

QCTable EnergyOrderedStateSelector::select(const QCTable& rows, int excitation_level, bool ignore_one_row) const
{
    return selectStates(rows, excitation_level, ignore_one_row);
}

QATSTable EnergyOrderedStateSelector::select(const QATSTable& rows, int excitation_level, bool ignore_one_row) const
{
    return selectStates(rows, excitation_level, ignore_one_row);
}

std::optional<int> EnergyOrderedStateSelector::multiplicity(const QCTable& rows, int excitation_level, bool ignore_one_row) const
{
    return selectMultiplicity(rows, excitation_level, ignore_one_row);
}

std::optional<int> EnergyOrderedStateSelector::multiplicity(const QATSTable& rows, int excitation_level, bool ignore_one_row) const
{
    return selectMultiplicity(rows, excitation_level, ignore_one_row);
}

} // namespace qalchemy
