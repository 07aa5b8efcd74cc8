/*
 * <Nuclear charge perturbation between reference and target systems>
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

#include "src/core/global.h"

namespace qalchemy {

enum class LambdaDirection {
    None,
    Counter // one nuclear charge increases, the other decreases (CO -> BF)
};

/*! \brief How a perturbation is distributed over the atoms of a dimer
 *
 * Atoms need no policy. For dimers at least one of the two options must be set;
 * specific_atom wins if both are.
 */
struct LambdaPolicy {
    std::optional<int> specific_atom;
    LambdaDirection direction = LambdaDirection::None;

    bool isSet() const { return specific_atom.has_value() || direction != LambdaDirection::None; }

    /*! \brief Policy from configuration values, -1 and "" mean unset
     * \throws std::invalid_argument for an unknown direction
     */
    static LambdaPolicy fromConfig(int specific_atom, const std::string& direction);
};

class LambdaCalculator {
public:
    virtual ~LambdaCalculator() = default;

    /*! \brief Signed perturbation that turns the reference into the target
     * \throws LambdaError if the atomic numbers cannot be related under the policy
     */
    virtual int lambda(const IntList& reference, const IntList& target, const LambdaPolicy& policy) const = 0;

    /*! \brief Non-throwing check whether lambda() would succeed */
    virtual bool compatible(const IntList& reference, const IntList& target, const LambdaPolicy& policy) const = 0;
};

/*! \brief Lambda as difference of nuclear charges
 *
 * - atoms: Z_target - Z_reference
 * - specific_atom k: the change of atom k, all other atoms must be unchanged
 * - counter: both atoms change by opposite amounts; lambda is the change of the
 *   second atom if the reference is homonuclear, otherwise of the reference
 *   atom with the larger atomic number
 */
class NuclearChargeLambda : public LambdaCalculator {
public:
    int lambda(const IntList& reference, const IntList& target, const LambdaPolicy& policy) const override;
    bool compatible(const IntList& reference, const IntList& target, const LambdaPolicy& policy) const override;

private:
    static std::optional<int> compute(const IntList& reference, const IntList& target, const LambdaPolicy& policy, std::string& reason);
};

} // namespace qalchemy
