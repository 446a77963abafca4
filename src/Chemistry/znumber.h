// -*-c++-*-
#ifndef MDSCAN_ZNUMBER_H
#define MDSCAN_ZNUMBER_H

#include <string>
#include <vector>
#include "copyright.h"

namespace mdscan {
namespace chemistry {

/// \brief Convert an atomic number to its element symbol from the periodic table.  Invalid
///        numbers produce a warning and the symbol "XX".
///
/// \param atomic_number  Z-number of the atom in question (can include 0, for a virtual site)
std::string zNumberToSymbol(int atomic_number);

/// \brief Convert an element symbol to its Z-number.  The comparison is not case-sensitive, so
///        that "CL" from a column-formatted file matches chlorine.  Unknown symbols produce a
///        warning and Z-number 0.
///
/// \param symbol  Periodic table symbol of the element, leading and trailing blanks permitted
int symbolToZNumber(const std::string &symbol);

/// \brief Get the natural-abundance mass of an element from its symbol.
///
/// \param symbol  Periodic table symbol of the element
double symbolToMass(const std::string &symbol);

/// \brief Infer an element from a PDB atom name, which by convention places a one-letter element
///        symbol in the second column of the four-character name field.  Names beginning with a
///        digit, i.e. "1HB ", are hydrogens.
///
/// \param atom_name  The atom name, as it appears in columns 13-16 of the PDB record
std::string inferElementFromAtomName(const std::string &atom_name);

} // namespace chemistry
} // namespace mdscan

#endif
