/*
 * <Tests of the QC and QATS table model>
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

#include "src/core/alchemy_data.h"
#include "src/core/elements.h"

#include "core/synthetic_tables.h"
#include "core/test_runner.h"

using namespace TestSupport;
using namespace qalchemy;

namespace {

void test_labels_to_atomic_numbers()
{
    require(Elements::SystemLabel2Elements("c") == IntList{ 6 }, "c");
    require(Elements::SystemLabel2Elements("f.h") == IntList{ 9, 1 }, "f.h");
    require(Elements::SystemLabel2Elements("Si") == IntList{ 14 }, "case-insensitive");
    require(Elements::SystemLabel2Elements("c.xx").empty(), "unknown symbol");
    require(Elements::SystemLabel2Elements("c.\xC3\xA9").empty(), "UTF-8 symbol");
    require(Elements::String2Element("\xFF") == 0, "byte above 0x7F");
}

void test_qc_row_from_json()
{
    const json input = {
        { "system", "f.h" },
        { "charge", 1 },
        { "multiplicity", 2 },
        { "basis_set", "cc-pV5Z" },
        { "lambda_value", -1 },
        { "bond_length", 0.92 },
        { "electronic_energy", -99.8 }
    };
    const QCRow row = QCRow::fromJson(input);
    require(row.atomic_numbers == IntList{ 9, 1 }, "atomic numbers from the label");
    require(row.n_electrons == 9, "n_electrons derived");
    require(row.isDimer(), "dimer");
    require(row.bond_length && *row.bond_length == 0.92, "bond length");
    require(row.lambda_value == -1, "lambda");

    const QCRow again = QCRow::fromJson(row.toJson());
    require(again.system == row.system && again.n_electrons == row.n_electrons && again.electronic_energy == row.electronic_energy,
        "toJson keeps every column");
}

void test_null_bond_length_is_atom()
{
    const json input = {
        { "system", "c" }, { "charge", 0 }, { "multiplicity", 3 }, { "basis_set", "aug-cc-pV5Z" },
        { "bond_length", nullptr }, { "poly_coeffs", { -37.8, 5.0 } }
    };
    const QATSRow row = QATSRow::fromJson(input);
    require(!row.bond_length, "no bond length");
    require(!row.isDimer(), "atom");
    requireClose(-37.8, row.stateEnergy(), "state energy is the zeroth coefficient");
}

void test_inconsistent_electron_count_rejected()
{
    const json input = {
        { "system", "c" }, { "charge", 1 }, { "multiplicity", 2 }, { "basis_set", "aug-cc-pV5Z" },
        { "n_electrons", 6 }, { "electronic_energy", -37.4 }
    };
    requireThrows<DataError>([&] { QCRow::fromJson(input); }, "n_electrons mismatch");

    QCRow row = SyntheticTables::qcRow("c", { 6 }, 1, 2, 0, -37.4);
    row.n_electrons = 6;
    requireThrows<DataError>([&] { QCTable(std::vector<QCRow>{ row }); }, "table validation");
}

void test_missing_column_rejected()
{
    const json input = { { "system", "c" }, { "charge", 0 }, { "basis_set", "aug-cc-pV5Z" }, { "electronic_energy", -37.8 } };
    requireThrows<DataError>([&] { QCRow::fromJson(input); }, "multiplicity missing");
    requireThrows<DataError>([&] { QCTable::fromJson(json::object()); }, "table must be an array");
}

void test_filters_do_not_modify_the_source()
{
    const QCTable qc = SyntheticTables::atomQC();
    const size_t size = qc.size();

    const QCTable carbon = qc.forSystem("c");
    require(carbon.size() == 4, "four carbon rows");
    require(carbon.charges() == std::set<int>{ 0, 1 }, "charges");
    require(carbon.multiplicities() == std::set<int>{ 1, 2, 3, 4 }, "multiplicities");
    require(qc.withElectrons(6).systems() == std::set<std::string>{ "b", "c", "n" }, "six electron systems");
    require(qc.inBasis("cc-pV5Z").empty(), "other basis");
    require(qc.size() == size, "source unchanged");
}

void test_table_from_json_array()
{
    const QATSTable qats = SyntheticTables::atomQATS();
    const QATSTable parsed = QATSTable::fromJson(qats.toJson());
    require(parsed.size() == qats.size(), "same number of rows");
    require(parsed[2].poly_coeffs == qats[2].poly_coeffs, "coefficients");
}

void test_taylor_anchors()
{
    const QCTable qc = SyntheticTables::atomQC();
    require(checkTaylorAnchors(qc, SyntheticTables::atomQATS()).empty(), "synthetic series are anchored");

    std::vector<QATSRow> rows = SyntheticTables::atomQATSRows();
    rows[0].poly_coeffs[0] += 0.01;
    const std::vector<QATSRow> mismatched = checkTaylorAnchors(qc, QATSTable(rows));
    require(mismatched.size() == 1 && mismatched.front().system == "n", "shifted series reported");
}

}

int main()
{
    QalchemyLogger::set_verbosity(0);
    TestRunner runner;

    runner.run_test("System labels to atomic numbers", test_labels_to_atomic_numbers);
    runner.run_test("QC row from JSON", test_qc_row_from_json);
    runner.run_test("Null bond length is an atom", test_null_bond_length_is_atom);
    runner.run_test("Inconsistent electron count", test_inconsistent_electron_count_rejected);
    runner.run_test("Missing columns", test_missing_column_rejected);
    runner.run_test("Filters return new tables", test_filters_do_not_modify_the_source);
    runner.run_test("Table from JSON array", test_table_from_json_array);
    runner.run_test("Taylor series anchors", test_taylor_anchors);

    runner.summary();
    return runner.get_exit_code();
}
