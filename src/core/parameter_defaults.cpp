/*
 * <Default parameters of the prediction modules>
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

#include "parameter_registry.h"

namespace {

ParameterDefinition makeParam(const std::string& name, ParamType type, std::any value,
    const std::string& help, const std::string& category, std::vector<std::string> aliases = {})
{
    ParameterDefinition def;
    def.name = name;
    def.type = type;
    def.defaultValue = std::move(value);
    def.helpText = help;
    def.category = category;
    def.aliases = std::move(aliases);
    return def;
}

// Options shared by the atom and dimer energy-difference predictors
void addPredictionParameters(ParameterRegistry& registry, const std::string& module,
    const std::string& basis_set, int excitation_level)
{
    registry.addDefinition(module, makeParam("basis_set", ParamType::String, std::string(basis_set),
                                       "Basis set of the QC and QATS rows used for predictions", "Basic", { "basis" }));
    registry.addDefinition(module, makeParam("change_signs", ParamType::Bool, false,
                                       "Multiply all predictions by -1 (electron affinities)", "Basic", { "flip_sign" }));
    registry.addDefinition(module, makeParam("use_ts", ParamType::Bool, true,
                                       "Predict with the QATS Taylor series instead of computed alchemical points", "Basic", { "taylor" }));
    registry.addDefinition(module, makeParam("return_qats_vs_qa", ParamType::Bool, false,
                                       "Report QATS-n minus QA, the Taylor truncation error (requires use_ts)", "Advanced"));
    registry.addDefinition(module, makeParam("ignore_one_row", ParamType::Bool, true,
                                       "Drop systems with too few electronic states instead of failing", "Advanced"));
    registry.addDefinition(module, makeParam("excitation_level", ParamType::Int, excitation_level,
                                       "Electronic state with respect to the ground state (0 = ground)", "Basic", { "state" }));
    registry.addDefinition(module, makeParam("considered_lambdas", ParamType::IntList, std::vector<int>{},
                                       "Only report references with these lambda values (empty = all)", "Basic", { "lambdas" }));
}

} // namespace

void initialize_default_parameters(ParameterRegistry& registry)
{
    addPredictionParameters(registry, "atom_prediction", "aug-cc-pV5Z", 1);

    addPredictionParameters(registry, "dimer_prediction", "cc-pV5Z", 0);
    registry.addDefinition("dimer_prediction", makeParam("lambda_specific_atom", ParamType::Int, -1,
                                                   "Apply the whole perturbation to this atom of the dimer (-1 = unset)", "Lambda", { "specific_atom" }));
    registry.addDefinition("dimer_prediction", makeParam("lambda_direction", ParamType::String, std::string(""),
                                                   "Distribute the perturbation across both atoms, 'counter' (empty = unset)", "Lambda", { "direction" }));

    registry.addDefinition("equilibrium", makeParam("n_points", ParamType::Int, 2,
                                              "Samples on either side of the lowest energy used for the fit", "Fit"));
    registry.addDefinition("equilibrium", makeParam("poly_order", ParamType::Int, 4,
                                              "Maximum order of the fitted polynomial", "Fit", { "order" }));
    registry.addDefinition("equilibrium", makeParam("remove_outliers", ParamType::Bool, false,
                                              "Discard energies whose z score exceeds zscore_cutoff", "Outliers"));
    registry.addDefinition("equilibrium", makeParam("zscore_cutoff", ParamType::Double, 3.0,
                                              "Z score above which an energy is an outlier", "Outliers", { "zscore" }));
}
