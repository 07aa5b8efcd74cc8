/*
 * <Configuration Manager Implementation>
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

#include "config_manager.h"
#include "parameter_registry.h"

#include <cctype>

namespace {

std::string toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

}

ConfigManager::ConfigManager(const std::string& module, const json& user_input)
    : ConfigManager(std::vector<std::string>{ module }, user_input)
{
}

ConfigManager::ConfigManager(const std::vector<std::string>& modules, const json& user_input)
    : m_module(modules.empty() ? "" : modules[0])
    , m_modules(modules)
{
    if (modules.empty()) {
        throw std::runtime_error("ConfigManager: at least one module is required");
    }

    auto& registry = ParameterRegistry::getInstance();
    for (const auto& module : m_modules) {
        if (!registry.hasModule(module))
            throw std::runtime_error("ConfigManager: unknown module '" + module + "'");
        m_module_configs[module] = registry.getDefaultJson(module);
    }

    if (user_input.is_null())
        return;
    if (!user_input.is_object())
        throw std::runtime_error("ConfigManager: controller for '" + m_module + "' must be a JSON object");

    for (const auto& item : user_input.items()) {
        const std::string& key = item.key();

        // Nested module configuration: controller["equilibrium"] = {...}
        auto nested = std::find(m_modules.begin(), m_modules.end(), key);
        if (nested != m_modules.end() && item.value().is_object()) {
            for (const auto& sub : item.value().items())
                mergeInto(*nested, m_module_configs[*nested], sub.key(), sub.value());
            continue;
        }

        std::string target = m_module;
        for (const auto& module : m_modules) {
            if (knows(module, key)) {
                target = module;
                break;
            }
        }
        mergeInto(target, m_module_configs[target], key, item.value());
    }
}

void ConfigManager::mergeInto(const std::string& module, json& config, const std::string& key, const json& value) const
{
    std::string resolved = ParameterRegistry::getInstance().resolveAlias(module, key);
    if (!resolved.empty()) {
        config[resolved] = value;
        return;
    }
    // Unknown keys are kept verbatim so callers can pass through extra options
    config[key] = value;
}

bool ConfigManager::knows(const std::string& module, const std::string& key) const
{
    return !ParameterRegistry::getInstance().resolveAlias(module, key).empty();
}

const json* ConfigManager::findKey(const std::string& module, const std::string& key) const
{
    auto it = m_module_configs.find(module);
    if (it == m_module_configs.end())
        return nullptr;

    const json& config = it->second;
    std::string resolved = ParameterRegistry::getInstance().resolveAlias(module, key);
    if (!resolved.empty() && config.contains(resolved))
        return &config.at(resolved);

    const std::string key_lower = toLower(key);
    for (const auto& item : config.items()) {
        if (toLower(item.key()) == key_lower)
            return &item.value();
    }
    return nullptr;
}

std::pair<std::string, std::string> ConfigManager::splitKey(const std::string& key) const
{
    size_t dot_pos = key.find('.');
    if (dot_pos != std::string::npos) {
        std::string module = key.substr(0, dot_pos);
        if (std::find(m_modules.begin(), m_modules.end(), module) != m_modules.end())
            return { module, key.substr(dot_pos + 1) };
    }
    return { "", key };
}

bool ConfigManager::has(const std::string& key) const
{
    auto [module, param] = splitKey(key);
    if (!module.empty())
        return findKey(module, param) != nullptr;

    for (const auto& mod : m_modules) {
        if (findKey(mod, param) != nullptr)
            return true;
    }
    return false;
}

json ConfigManager::exportConfig() const
{
    json result = m_module_configs.at(m_module);
    for (size_t i = 1; i < m_modules.size(); ++i)
        result[m_modules[i]] = m_module_configs.at(m_modules[i]);
    return result;
}

json ConfigManager::exportModule(const std::string& module) const
{
    auto it = m_module_configs.find(module);
    if (it == m_module_configs.end())
        throw std::runtime_error("ConfigManager: Module '" + module + "' not loaded");
    return it->second;
}
