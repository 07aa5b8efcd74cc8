/*
 * <Configuration Manager for Qalchemy predictors>
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

#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

/*! \brief Configuration manager for the prediction modules
 *
 * Loads the defaults of one or more modules from the ParameterRegistry and
 * merges the user controller on top of them.
 *
 * - Type-safe parameter access via get<T>()
 * - Case-insensitive parameter names and alias resolution
 * - Dot notation for submodules: "equilibrium.poly_order"
 *
 * Example:
 * ```cpp
 * ConfigManager config(std::vector<std::string>{ "dimer_prediction", "equilibrium" }, controller);
 * std::string basis = config.get<std::string>("basis_set");
 * int order = config.get<int>("equilibrium.poly_order");
 * int points = config.get<int>("n_points");   // found in the equilibrium module
 * ```
 */
class ConfigManager
{
public:
    /*! \brief Single-Module Constructor - loads defaults and merges with user input
     *
     * @param module Module name (e.g., "atom_prediction")
     * @param user_input User-provided configuration
     */
    ConfigManager(const std::string& module, const json& user_input);

    /*! \brief Multi-Module Constructor
     *
     * Flat user keys go to the first module that knows them (primary first),
     * nested objects named after a module go to that module.
     *
     * @param modules List of modules to load (first = primary module)
     * @param user_input User-provided configuration
     */
    ConfigManager(const std::vector<std::string>& modules, const json& user_input);

    /*! \brief Type-safe parameter access
     * @throws std::runtime_error if the parameter is unknown or has the wrong type
     */
    template <typename T>
    T get(const std::string& key) const;

    /*! \brief Type-safe parameter access with default value */
    template <typename T>
    T get(const std::string& key, T default_value) const;

    bool has(const std::string& key) const;

    /*! \brief Merged configuration of all modules, submodules nested by name */
    json exportConfig() const;

    std::string getModule() const { return m_module; }

    /*! \brief Complete merged configuration of one loaded module */
    json exportModule(const std::string& module) const;

private:
    std::string m_module;
    std::vector<std::string> m_modules;
    std::map<std::string, json> m_module_configs;

    void mergeInto(const std::string& module, json& config, const std::string& key, const json& value) const;
    bool knows(const std::string& module, const std::string& key) const;
    const json* findKey(const std::string& module, const std::string& key) const;
    std::pair<std::string, std::string> splitKey(const std::string& key) const;
};

template <typename T>
T ConfigManager::get(const std::string& key) const
{
    auto [module, param] = splitKey(key);

    std::vector<std::string> search;
    if (!module.empty())
        search.push_back(module);
    else
        search = m_modules;

    for (const auto& mod : search) {
        const json* value = findKey(mod, param);
        if (value == nullptr)
            continue;
        try {
            return value->get<T>();
        } catch (const json::exception& e) {
            throw std::runtime_error("ConfigManager: Parameter '" + key + "' in module '" + mod + "' has unexpected type: " + e.what());
        }
    }
    throw std::runtime_error("ConfigManager: Parameter '" + key + "' not found in module '" + m_module + "'");
}

template <typename T>
T ConfigManager::get(const std::string& key, T default_value) const
{
    if (!has(key))
        return default_value;
    return get<T>(key);
}
