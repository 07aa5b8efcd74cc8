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

#include "lambda_calculator.h"

#include "src/core/qalchemy_errors.h"

#include <stdexcept>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace qalchemy {

LambdaPolicy LambdaPolicy::fromConfig(int specific_atom, const std::string& direction)
{
    LambdaPolicy policy;
    if (specific_atom >= 0)
        policy.specific_atom = specific_atom;

    if (direction == "counter")
        policy.direction = LambdaDirection::Counter;
    else if (!direction.empty() && direction != "none")
        throw std::invalid_argument("Unknown lambda direction '" + direction + "', expected 'counter'");
    return policy;
}

std::optional<int> NuclearChargeLambda::compute(const IntList& reference, const IntList& target, const LambdaPolicy& policy, std::string& reason)
{
    if (reference.size() != target.size() || reference.empty()) {
        reason = fmt::format("atomic numbers {} and {} differ in length", reference, target);
        return std::nullopt;
    }

    IntList delta(reference.size());
    for (size_t i = 0; i < reference.size(); ++i)
        delta[i] = target[i] - reference[i];

    if (reference.size() == 1)
        return delta[0];

    if (!policy.isSet()) {
        reason = fmt::format("perturbation {} -> {} is ambiguous without a specific atom or direction", reference, target);
        return std::nullopt;
    }

    if (policy.specific_atom) {
        const int atom = *policy.specific_atom;
        if (atom < 0 || atom >= static_cast<int>(delta.size())) {
            reason = fmt::format("specific atom {} does not exist in {}", atom, reference);
            return std::nullopt;
        }
        for (int i = 0; i < static_cast<int>(delta.size()); ++i) {
            if (i != atom && delta[i] != 0) {
                reason = fmt::format("{} -> {} changes more than atom {}", reference, target, atom);
                return std::nullopt;
            }
        }
        return delta[atom];
    }

    // LambdaDirection::Counter
    if (delta.size() != 2 || delta[0] != -delta[1]) {
        reason = fmt::format("{} -> {} is not a counter perturbation", reference, target);
        return std::nullopt;
    }
    if (reference[0] == reference[1])
        return delta[1];
    return reference[0] > reference[1] ? delta[0] : delta[1];
}

int NuclearChargeLambda::lambda(const IntList& reference, const IntList& target, const LambdaPolicy& policy) const
{
    std::string reason;
    std::optional<int> value = compute(reference, target, policy, reason);
    if (!value)
        throw LambdaError("Cannot compute lambda: " + reason);
    return *value;
}

bool NuclearChargeLambda::compatible(const IntList& reference, const IntList& target, const LambdaPolicy& policy) const
{
    std::string reason;
    return compute(reference, target, policy, reason).has_value();
}

} // namespace qalchemy
