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

#include "parameter_registry.h"
#include "qalchemy_logger.h"

#include <algorithm>
#include <cctype>
#include <iostream>

using json = nlohmann::json;

ParameterRegistry& ParameterRegistry::getInstance()
{
    static ParameterRegistry instance;
    static const bool initialized = [] {
        initialize_default_parameters(instance);
        return true;
    }();
    (void)initialized;
    return instance;
}

void ParameterRegistry::addDefinition(const std::string& module, ParameterDefinition&& def)
{
    std::string canonical_name = def.name;
    def.module = module;
    registry[module].push_back(std::move(def));

    alias_to_name_map[module][canonical_name] = canonical_name;
    const auto& added_def = registry[module].back();
    for (const auto& alias : added_def.aliases) {
        alias_to_name_map[module][alias] = canonical_name;
    }
}

const ParameterDefinition* ParameterRegistry::findDefinition(const std::string& module, const std::string& alias) const
{
    const std::string canonical_name = resolveAlias(module, alias);
    if (canonical_name.empty())
        return nullptr;

    auto registry_it = registry.find(module);
    if (registry_it != registry.end()) {
        for (const auto& def : registry_it->second) {
            if (def.name == canonical_name) {
                return &def;
            }
        }
    }
    return nullptr;
}

std::vector<ParameterDefinition> ParameterRegistry::getForModule(const std::string& module) const
{
    auto it = registry.find(module);
    if (it != registry.end()) {
        return it->second;
    }
    return {};
}

static std::string typeName(ParamType type)
{
    switch (type) {
    case ParamType::String:
        return "string";
    case ParamType::Int:
        return "int";
    case ParamType::Double:
        return "double";
    case ParamType::Bool:
        return "bool";
    case ParamType::IntList:
        return "int list";
    }
    return "unknown";
}

void ParameterRegistry::printHelp(const std::string& module) const
{
    auto it = registry.find(module);
    if (it == registry.end()) {
        std::cout << "No parameters registered for module: " << module << std::endl;
        return;
    }

    std::cout << "Parameters for module: " << module << std::endl;
    std::cout << std::string(60, '=') << std::endl;

    std::map<std::string, std::vector<const ParameterDefinition*>> by_category;
    for (const auto& param : it->second) {
        by_category[param.category].push_back(&param);
    }

    const json defaults = getDefaultJson(module);
    for (const auto& [category, params] : by_category) {
        std::cout << "\n[" << category << "]" << std::endl;

        for (const auto* param : params) {
            std::cout << "  -" << param->name << " <" << typeName(param->type) << ">"
                      << " (default: " << defaults.value(param->name, json()).dump() << ")" << std::endl;
            std::cout << "      " << param->helpText << std::endl;

            if (!param->aliases.empty()) {
                std::cout << "      Aliases: ";
                for (size_t i = 0; i < param->aliases.size(); ++i) {
                    if (i > 0)
                        std::cout << ", ";
                    std::cout << param->aliases[i];
                }
                std::cout << std::endl;
            }
        }
    }
    std::cout << std::endl;
}

void ParameterRegistry::printAllModules() const
{
    std::cout << "Available modules:" << std::endl;
    for (const auto& [module, params] : registry) {
        std::cout << "  " << module << " (" << params.size() << " parameters)" << std::endl;
    }
}

json ParameterRegistry::getDefaultJson(const std::string& module) const
{
    json result = json::object();

    auto it = registry.find(module);
    if (it == registry.end()) {
        return result;
    }

    for (const auto& param : it->second) {
        try {
            switch (param.type) {
            case ParamType::String:
                result[param.name] = std::any_cast<std::string>(param.defaultValue);
                break;
            case ParamType::Int:
                result[param.name] = std::any_cast<int>(param.defaultValue);
                break;
            case ParamType::Double:
                result[param.name] = std::any_cast<double>(param.defaultValue);
                break;
            case ParamType::Bool:
                result[param.name] = std::any_cast<bool>(param.defaultValue);
                break;
            case ParamType::IntList:
                result[param.name] = std::any_cast<std::vector<int>>(param.defaultValue);
                break;
            }
        } catch (const std::bad_any_cast&) {
            QalchemyLogger::warn_fmt("Failed to cast default value for parameter {} in module {}", param.name, module);
        }
    }

    return result;
}

bool ParameterRegistry::validateRegistry() const
{
    bool valid = true;

    for (const auto& [module, params] : registry) {
        std::map<std::string, int> name_counts;

        for (const auto& param : params) {
            if (++name_counts[param.name] > 1) {
                QalchemyLogger::error_fmt("Duplicate parameter '{}' in module '{}'", param.name, module);
                valid = false;
            }
            for (const auto& alias : param.aliases) {
                if (++name_counts[alias] > 1) {
                    QalchemyLogger::error_fmt("Alias '{}' conflicts with another name/alias in module '{}'", alias, module);
                    valid = false;
                }
            }
        }
    }

    // Same parameter name in different modules must share its type
    std::map<std::string, std::pair<std::string, ParamType>> first_occurrence;
    for (const auto& [module, params] : registry) {
        for (const auto& param : params) {
            auto it = first_occurrence.find(param.name);
            if (it == first_occurrence.end()) {
                first_occurrence[param.name] = { module, param.type };
            } else if (it->second.second != param.type) {
                QalchemyLogger::warn_fmt("Parameter '{}' has different types in modules '{}' and '{}'",
                    param.name, it->second.first, module);
                valid = false;
            }
        }
    }

    return valid;
}

std::string ParameterRegistry::resolveAlias(const std::string& module, const std::string& alias) const
{
    auto module_it = alias_to_name_map.find(module);
    if (module_it == alias_to_name_map.end()) {
        return "";
    }

    std::string alias_lower = alias;
    std::transform(alias_lower.begin(), alias_lower.end(), alias_lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& [known, canonical] : module_it->second) {
        std::string known_lower = known;
        std::transform(known_lower.begin(), known_lower.end(), known_lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (known_lower == alias_lower)
            return canonical;
    }
    return "";
}
