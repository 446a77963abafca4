// -*-c++-*-
#ifndef MDSCAN_PERIODIC_TABLE_H
#define MDSCAN_PERIODIC_TABLE_H

#include "copyright.h"

namespace mdscan {
namespace chemistry {

/// \brief The number of elements covered by the tables below, including the virtual site at Z = 0
constexpr int element_maximum_count = 55;

/// \brief Element symbols, indexed by atomic number
const char* const elemental_symbols[element_maximum_count] = {
  "VS", "H",  "He", "Li", "Be", "B",  "C",  "N",  "O",  "F",  "Ne", "Na", "Mg", "Al", "Si",
  "P",  "S",  "Cl", "Ar", "K",  "Ca", "Sc", "Ti", "V",  "Cr", "Mn", "Fe", "Co", "Ni", "Cu",
  "Zn", "Ga", "Ge", "As", "Se", "Br", "Kr", "Rb", "Sr", "Y",  "Zr", "Nb", "Mo", "Tc", "Ru",
  "Rh", "Pd", "Ag", "Cd", "In", "Sn", "Sb", "Te", "I",  "Xe"
};

/// \brief Masses of the elements in Daltons, weighted by natural isotopic abundance
constexpr double elemental_masses[element_maximum_count] = {
    0.0000,   1.0080,   4.0026,   6.9400,   9.0122,  10.8100,  12.0110,  14.0070,  15.9990,
   18.9980,  20.1800,  22.9900,  24.3050,  26.9820,  28.0850,  30.9740,  32.0600,  35.4500,
   39.9480,  39.0980,  40.0780,  44.9560,  47.8670,  50.9420,  51.9960,  54.9380,  55.8450,
   58.9330,  58.6930,  63.5460,  65.3800,  69.7230,  72.6300,  74.9220,  78.9710,  79.9040,
   83.7980,  85.4680,  87.6200,  88.9060,  91.2240,  92.9060,  95.9500,  98.0000, 101.0700,
  102.9100, 106.4200, 107.8700, 112.4100, 114.8200, 118.7100, 121.7600, 127.6000, 126.9000,
  131.2900
};

} // namespace chemistry
} // namespace mdscan

#endif
