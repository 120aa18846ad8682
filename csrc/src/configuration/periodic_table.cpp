// Copyright 2026 The qcloud Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file periodic_table.cpp
 * @brief Symbol lookup by atomic number.
 */

#include <qcloud/configuration/periodic_table.hpp>

#include <array>

namespace qcloud {

namespace {

constexpr std::array<std::string_view, MAX_ATOMIC_NUMBER> kSymbols = {
    "H",  "He", "Li", "Be", "B",  "C",  "N",  "O",  "F",  "Ne",
    "Na", "Mg", "Al", "Si", "P",  "S",  "Cl", "Ar", "K",  "Ca",
    "Sc", "Ti", "V",  "Cr", "Mn", "Fe", "Co", "Ni", "Cu", "Zn",
    "Ga", "Ge", "As", "Se", "Br", "Kr", "Rb", "Sr", "Y",  "Zr",
    "Nb", "Mo", "Tc", "Ru", "Rh", "Pd", "Ag", "Cd", "In", "Sn",
    "Sb", "Te", "I",  "Xe", "Cs", "Ba", "La", "Ce", "Pr", "Nd",
    "Pm", "Sm", "Eu", "Gd", "Tb", "Dy", "Ho", "Er", "Tm", "Yb",
    "Lu", "Hf", "Ta", "W",  "Re", "Os", "Ir", "Pt", "Au", "Hg",
    "Tl", "Pb", "Bi", "Po", "At", "Rn", "Fr", "Ra", "Ac", "Th",
    "Pa", "U",  "Np", "Pu", "Am", "Cm", "Bk", "Cf", "Es", "Fm",
    "Md", "No", "Lr", "Rf", "Db", "Sg", "Bh", "Hs", "Mt", "Ds",
    "Rg", "Cn", "Nh", "Fl", "Mc", "Lv", "Ts", "Og",
};

} // anonymous namespace

std::string_view element_symbol(int Z) noexcept {
    if (Z < 1 || Z > MAX_ATOMIC_NUMBER) return "?";
    return kSymbols[static_cast<size_t>(Z - 1)];
}

int atomic_number(std::string_view symbol) noexcept {
    for (size_t i = 0; i < kSymbols.size(); ++i) {
        if (kSymbols[i] == symbol) return static_cast<int>(i) + 1;
    }
    return 0;
}

} // namespace qcloud
