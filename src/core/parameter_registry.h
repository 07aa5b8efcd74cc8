/*
 * <Parameter registry for the prediction modules>
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

#include <any>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

enum class ParamType { String,
    Int,
    Double,
    Bool,
    IntList };

struct ParameterDefinition {
    std::string name; // canonical name, e.g. "zscore_cutoff"
    std::string module; // owning module, e.g. "equilibrium"
    ParamType type;
    std::any defaultValue;
    std::string helpText;
    std::string category = "General";
    std::vector<std::string> aliases;
};

class ParameterRegistry {
public:
    /*! \brief Process-wide registry, populated with the built-in modules on first use */
    static ParameterRegistry& getInstance();

    void addDefinition(const std::string& module, ParameterDefinition&& def);
    const ParameterDefinition* findDefinition(const std::string& module, const std::string& alias) const;
    std::vector<ParameterDefinition> getForModule(const std::string& module) const;
    bool hasModule(const std::string& module) const { return registry.count(module) > 0; }

    void printHelp(const std::string& module) const;
    void printAllModules() const;

    nlohmann::json getDefaultJson(const std::string& module) const;

    /*! \brief Checks for duplicate names/aliases and inconsistent types of shared names */
    bool validateRegistry() const;

    std::string resolveAlias(const std::string& module, const std::string& alias) const;

private:
    ParameterRegistry() = default;
    std::map<std::string, std::vector<ParameterDefinition>> registry;
    std::map<std::string, std::map<std::string, std::string>> alias_to_name_map;
};

// Registers atom_prediction, dimer_prediction and equilibrium (parameter_defaults.cpp)
void initialize_default_parameters(ParameterRegistry& registry);
