#include "copyright.h"
#include "Parsing/parse.h"
#include "Reporting/error_format.h"
#include "periodic_table.h"
#include "znumber.h"

namespace mdscan {
namespace chemistry {

using constants::CaseSensitivity;
using parse::removeTailingWhiteSpace;
using parse::strcmpCased;

//-------------------------------------------------------------------------------------------------
std::string zNumberToSymbol(const int atomic_number) {
  if (atomic_number < 0 || atomic_number >= element_maximum_count) {
    rtWarn("Atomic number " + std::to_string(atomic_number) + " is beyond the scope of "
           "elements covered by mdscan and will be indicated by symbol XX.", "zNumberToSymbol");
    return std::string("XX");
  }
  return std::string(elemental_symbols[atomic_number]);
}

//-------------------------------------------------------------------------------------------------
int symbolToZNumber(const std::string &symbol) {
  const std::string tsym = removeTailingWhiteSpace(symbol);
  for (int i = 1; i < element_maximum_count; i++) {
    if (strcmpCased(tsym, elemental_symbols[i], CaseSensitivity::NO)) {
      return i;
    }
  }
  rtWarn("No atomic symbol \"" + tsym + "\" is known.  It will be represented as a virtual site "
         "(symbol VS) with atomic number 0 and no mass.", "symbolToZNumber");
  return 0;
}

//-------------------------------------------------------------------------------------------------
double symbolToMass(const std::string &symbol) {
  return elemental_masses[symbolToZNumber(symbol)];
}

//-------------------------------------------------------------------------------------------------
std::string inferElementFromAtomName(const std::string &atom_name) {
  if (atom_name.size() == 0) {
    return std::string("");
  }

  // Four-character names and names with a leading digit are hydrogens in the usual conventions
  if ((atom_name[0] >= '0' && atom_name[0] <= '9') || (atom_name.size() == 4 &&
                                                      atom_name[0] == 'H')) {
    return std::string("H");
  }

  // A blank first column means a single-letter element in the second
  if (atom_name[0] == ' ' && atom_name.size() > 1) {
    return std::string(1, atom_name[1]);
  }

  // Otherwise take the first letter.  Two-letter elements must be given explicitly.
  const std::string trimmed = removeTailingWhiteSpace(atom_name);
  return (trimmed.size() > 0) ? std::string(1, trimmed[0]) : std::string("");
}

} // namespace chemistry
} // namespace mdscan
