/*
 * <Tests of the reference system resolution>
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

#include "src/capabilities/reference_resolver.h"

#include "core/synthetic_tables.h"
#include "core/test_runner.h"

#include <memory>

using namespace TestSupport;
using namespace qalchemy;

namespace {

ReferenceResolver makeResolver(const QCTable& qc, const QATSTable& qats)
{
    return ReferenceResolver(qc, qats, std::make_shared<EnergyOrderedStateSelector>(), std::make_shared<NuclearChargeLambda>());
}

ReferenceRequest carbonIonization()
{
    ReferenceRequest request;
    request.target_label = "c";
    request.target_atomic_numbers = { 6 };
    request.initial_electrons = 6;
    request.final_electrons = 5;
    request.basis_set = SyntheticTables::atom_basis;
    return request;
}

void test_candidates_exclude_target()
{
    const QCTable qc = SyntheticTables::atomQC();
    const QCTable candidates = ReferenceResolver::candidates(qc, "c", 6, SyntheticTables::atom_basis);
    require(candidates.systems() == std::set<std::string>{ "b", "n" }, "other six electron systems");
    for (const auto& row : candidates)
        require(row.lambda_value == 0, "unperturbed rows only");
    require(ReferenceResolver::candidates(qc, "c", 6, "cc-pV5Z").empty(), "basis set filter");
}

void test_resolution_for_charge_change()
{
    const QCTable qc = SyntheticTables::atomQC();
    const QATSTable qats = SyntheticTables::atomQATS();
    const ResolvedReferences<QATSRow> references = makeResolver(qc, qats).resolveQATS(carbonIonization());

    require(references.systems() == std::vector<std::string>{ "b", "n" }, "b and n usable for both endpoints");
    require(references.initial.size() == 2 && references.final_state.size() == 2, "one row per system and side");
    for (const auto& row : references.initial)
        require(row.n_electrons == 6, "initial rows have six electrons");
    for (const auto& row : references.final_state)
        require(row.n_electrons == 5, "final rows have five electrons");
    require(references.initial.forSystem("n").front().multiplicity == 3, "nitrogen cation ground state");
}

void test_systems_missing_one_endpoint_are_dropped()
{
    const QCTable qc = SyntheticTables::atomQC();
    std::vector<QATSRow> rows = SyntheticTables::atomQATSRows();
    rows.pop_back(); // neutral boron, the five electron endpoint of b
    const QATSTable qats(rows);

    const ResolvedReferences<QATSRow> references = makeResolver(qc, qats).resolveQATS(carbonIonization());
    require(references.systems() == std::vector<std::string>{ "n" }, "only n left");
}

void test_multiplicity_gap_references()
{
    const QCTable qc = SyntheticTables::atomQC();
    const QATSTable qats = SyntheticTables::atomQATS();

    ReferenceRequest request = carbonIonization();
    request.final_electrons = 6;
    request.final_excitation = 1;

    const ResolvedReferences<QATSRow> references = makeResolver(qc, qats).resolveQATS(request);
    require(references.systems() == std::vector<std::string>{ "n" }, "b has a single state and is dropped");
    require(references.final_state.front().multiplicity == 1, "excited nitrogen cation");

    request.ignore_one_row = false;
    requireThrows<StateSelectionError>([&] { makeResolver(qc, qats).resolveQATS(request); }, "strict selection");
}

void test_row_count_mismatch()
{
    const QCTable qc = SyntheticTables::atomQC();
    std::vector<QATSRow> rows = SyntheticTables::atomQATSRows();
    rows.push_back(SyntheticTables::qatsRow("n", { 7 }, 2, 2, { -52.90, 10.4, -0.45 }));
    const QATSTable qats(rows);

    requireThrows<ReferenceConsistencyError>([&] { makeResolver(qc, qats).resolveQATS(carbonIonization()); },
        "two final rows against one initial row");
}

void test_dimer_policy_filters_references()
{
    const QCTable qc = SyntheticTables::dimerQC();
    const QATSTable qats = SyntheticTables::dimerQATS();

    ReferenceRequest request;
    request.target_label = "c.o";
    request.target_atomic_numbers = { 6, 8 };
    request.initial_electrons = 14;
    request.final_electrons = 13;
    request.basis_set = SyntheticTables::dimer_basis;
    request.policy.direction = LambdaDirection::Counter;

    const ResolvedReferences<QATSRow> references = makeResolver(qc, qats).resolveQATS(request);
    require(references.systems() == std::vector<std::string>{ "n.n" }, "b.f has no cation");
    require(references.initial.size() == SyntheticTables::bondLengths().size(), "all bond lengths kept");

    request.policy = LambdaPolicy();
    request.policy.specific_atom = 0;
    require(makeResolver(qc, qats).resolveQATS(request).empty(), "n.n -> c.o changes both atoms");

    request.policy.direction = LambdaDirection::Counter;
    request.policy.specific_atom.reset();
    const ResolvedReferences<QCRow> from_qc = makeResolver(qc, qats).resolveQC(request);
    require(from_qc.systems() == std::vector<std::string>{ "n.n" }, "QC selection source");
    for (const auto& row : from_qc.initial)
        require(row.lambda_value == 0, "unperturbed QC rows");
}

}

int main()
{
    QalchemyLogger::set_verbosity(0);
    TestRunner runner;

    runner.run_test("Candidates exclude the target", test_candidates_exclude_target);
    runner.run_test("References for a charge change", test_resolution_for_charge_change);
    runner.run_test("Systems missing one endpoint are dropped", test_systems_missing_one_endpoint_are_dropped);
    runner.run_test("References for a multiplicity gap", test_multiplicity_gap_references);
    runner.run_test("Row count mismatch is fatal", test_row_count_mismatch);
    runner.run_test("Dimer lambda policy filters references", test_dimer_policy_filters_references);

    runner.summary();
    return runner.get_exit_code();
}
