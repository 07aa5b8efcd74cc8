/*
 * <Unit conversions for Qalchemy>
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

// Energies in the QC and QATS tables are Hartree, bond lengths Angstrom.
// Reference: CODATA-2018 internationally recommended values

namespace Energy {
    constexpr double HARTREE_TO_KJMOL = 2625.4996394798;
    constexpr double HARTREE_TO_KCALMOL = 627.5094740631;
    constexpr double HARTREE_TO_EV = 27.211386245988;
    constexpr double EV_TO_HARTREE = 1.0 / HARTREE_TO_EV;

    inline constexpr double hartree_to_kjmol(double eh) { return eh * HARTREE_TO_KJMOL; }
    inline constexpr double hartree_to_kcalmol(double eh) { return eh * HARTREE_TO_KCALMOL; }
    inline constexpr double hartree_to_ev(double eh) { return eh * HARTREE_TO_EV; }

    inline constexpr double kjmol_to_hartree(double kjmol) { return kjmol / HARTREE_TO_KJMOL; }
    inline constexpr double kcalmol_to_hartree(double kcalmol) { return kcalmol / HARTREE_TO_KCALMOL; }
    inline constexpr double ev_to_hartree(double ev) { return ev * EV_TO_HARTREE; }
}

namespace Length {
    constexpr double BOHR_TO_ANGSTROM = 0.529177210903;
    constexpr double ANGSTROM_TO_BOHR = 1.0 / BOHR_TO_ANGSTROM;

    inline constexpr double bohr_to_angstrom(double bohr) { return bohr * BOHR_TO_ANGSTROM; }
    inline constexpr double angstrom_to_bohr(double ang) { return ang * ANGSTROM_TO_BOHR; }
}
