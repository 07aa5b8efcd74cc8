/*
 * <Tests of the parameter registry and configuration manager>
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

#include "src/core/config_manager.h"
#include "src/core/parameter_registry.h"
#include "src/core/qalchemy_logger.h"

#include "core/test_runner.h"

#include <stdexcept>
#include <string>
#include <vector>

using namespace TestSupport;

namespace {

void test_registry_is_consistent()
{
    const ParameterRegistry& registry = ParameterRegistry::getInstance();
    require(registry.validateRegistry(), "no duplicate names or aliases");
    for (const std::string module : { "atom_prediction", "dimer_prediction", "equilibrium" })
        require(registry.hasModule(module), module + " registered");
    require(registry.resolveAlias("equilibrium", "ORDER") == "poly_order", "case-insensitive alias");
    require(registry.resolveAlias("equilibrium", "basis").empty(), "aliases are per module");

    const ParameterDefinition* cutoff = registry.findDefinition("equilibrium", "zscore");
    require(cutoff != nullptr && cutoff->name == "zscore_cutoff" && cutoff->type == ParamType::Double, "definition by alias");
    require(registry.getForModule("dimer_prediction").size() == registry.getForModule("atom_prediction").size() + 2, "lambda options");

    registry.printAllModules();
    registry.printHelp("equilibrium");
}

void test_defaults()
{
    const ConfigManager atom("atom_prediction", json::object());
    require(atom.get<std::string>("basis_set") == "aug-cc-pV5Z", "atom basis");
    require(atom.get<int>("excitation_level") == 1, "gap to the first excited state");
    require(atom.get<bool>("use_ts"), "Taylor series by default");
    require(!atom.get<bool>("change_signs"), "no sign change");
    require(atom.get<std::vector<int>>("considered_lambdas").empty(), "all lambdas");

    const ConfigManager dimer("dimer_prediction", nullptr);
    require(dimer.get<std::string>("basis_set") == "cc-pV5Z", "dimer basis");
    require(dimer.get<int>("lambda_specific_atom") == -1, "no specific atom");
}

void test_user_values_and_aliases()
{
    const ConfigManager config("atom_prediction", { { "flip_sign", true }, { "State", 2 }, { "LAMBDAS", { -1, 1 } } });
    require(config.get<bool>("change_signs"), "alias flip_sign");
    require(config.get<int>("excitation_level") == 2, "alias state, any case");
    require(config.get<std::vector<int>>("considered_lambdas") == std::vector<int>{ -1, 1 }, "alias lambdas");
    require(config.get<int>("EXCITATION_LEVEL") == 2, "lookup ignores case");
}

void test_multiple_modules()
{
    const ConfigManager config(std::vector<std::string>{ "dimer_prediction", "equilibrium" },
        { { "order", 6 }, { "equilibrium", { { "n_points", 4 } } }, { "use_ts", false } });

    require(config.get<int>("equilibrium.poly_order") == 6, "flat alias routed to the submodule");
    require(config.get<int>("n_points") == 4, "nested module");
    require(!config.get<bool>("use_ts"), "primary module");
    requireClose(3.0, config.get<double>("equilibrium.zscore_cutoff"), "submodule default");

    const json exported = config.exportConfig();
    require(exported["equilibrium"]["poly_order"] == 6, "submodule nested in the export");
    require(exported["basis_set"] == "cc-pV5Z", "primary module at the top level");
    require(config.exportModule("equilibrium")["n_points"] == 4, "single module export");
}

void test_errors()
{
    const ConfigManager config("equilibrium", json::object());
    requireThrows<std::runtime_error>([&] { config.get<int>("no_such_parameter"); }, "unknown key");
    requireThrows<std::runtime_error>([&] { config.get<std::string>("poly_order"); }, "wrong type");
    require(config.get<int>("no_such_parameter", 7) == 7, "default for an unknown key");
    require(!config.has("no_such_parameter"), "has()");

    requireThrows<std::runtime_error>([] { ConfigManager("no_such_module", json::object()); }, "unknown module");
    requireThrows<std::runtime_error>([] { ConfigManager("equilibrium", json::array({ 1, 2 })); }, "controller must be an object");
    requireThrows<std::runtime_error>([&] { config.exportModule("atom_prediction"); }, "module not loaded");
}

void test_non_ascii_keys()
{
    const ParameterRegistry& registry = ParameterRegistry::getInstance();
    require(registry.resolveAlias("equilibrium", "ORDER\xC3\xA9").empty(), "UTF-8 alias");
    require(registry.resolveAlias("equilibrium", "\xFF").empty(), "single high byte");

    const ConfigManager config("equilibrium", { { "poly_\xC3\xA9", 5 } });
    require(config.get<int>("poly_\xC3\xA9") == 5, "UTF-8 key kept verbatim");
    require(config.get<int>("POLY_\xC3\xA9") == 5, "ASCII part ignores case");
    require(!config.has("poly_order\xC3\xA9"), "UTF-8 lookup");
    require(config.get<int>("n_\xFF", 7) == 7, "default for a high-byte key");
    require(config.get<int>("POLY_ORDER") == 4, "ASCII keys unaffected");
}

}

int main()
{
    QalchemyLogger::set_verbosity(0);
    TestRunner runner;

    runner.run_test("Registry is consistent", test_registry_is_consistent);
    runner.run_test("Defaults", test_defaults);
    runner.run_test("User values and aliases", test_user_values_and_aliases);
    runner.run_test("Multiple modules", test_multiple_modules);
    runner.run_test("Errors", test_errors);
    runner.run_test("Non-ASCII keys", test_non_ascii_keys);

    runner.summary();
    return runner.get_exit_code();
}
