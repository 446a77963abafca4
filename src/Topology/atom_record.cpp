#include "copyright.h"
#include "Chemistry/znumber.h"
#include "Parsing/parse.h"
#include "atom_record.h"

namespace mdscan {
namespace topology {

using chemistry::symbolToMass;
using parse::removeTailingWhiteSpace;

//-------------------------------------------------------------------------------------------------
AtomRecord::AtomRecord() :
    serial{0}, atom_name{}, residue_name{}, residue_number{0}, chain{}, element{"VS"},
    mass{0.0}, position{0.0, 0.0, 0.0}
{}

//-------------------------------------------------------------------------------------------------
AtomRecord::AtomRecord(const int serial_in, const std::string &atom_name_in,
                       const std::string &residue_name_in, const int residue_number_in,
                       const std::string &chain_in, const std::string &element_in,
                       const double mass_in, const double x_in, const double y_in,
                       const double z_in) :
    serial{serial_in}, atom_name{removeTailingWhiteSpace(atom_name_in)},
    residue_name{removeTailingWhiteSpace(residue_name_in)}, residue_number{residue_number_in},
    chain{removeTailingWhiteSpace(chain_in)}, element{removeTailingWhiteSpace(element_in)},
    mass{(mass_in < 0.0) ? symbolToMass(element_in) : mass_in}, position{x_in, y_in, z_in}
{}

//-------------------------------------------------------------------------------------------------
int AtomRecord::getSerialNumber() const {
  return serial;
}

//-------------------------------------------------------------------------------------------------
const std::string& AtomRecord::getAtomName() const {
  return atom_name;
}

//-------------------------------------------------------------------------------------------------
const std::string& AtomRecord::getResidueName() const {
  return residue_name;
}

//-------------------------------------------------------------------------------------------------
int AtomRecord::getResidueNumber() const {
  return residue_number;
}

//-------------------------------------------------------------------------------------------------
const std::string& AtomRecord::getChain() const {
  return chain;
}

//-------------------------------------------------------------------------------------------------
const std::string& AtomRecord::getElement() const {
  return element;
}

//-------------------------------------------------------------------------------------------------
double AtomRecord::getMass() const {
  return mass;
}

//-------------------------------------------------------------------------------------------------
double3 AtomRecord::getPosition() const {
  return position;
}

//-------------------------------------------------------------------------------------------------
void AtomRecord::setPosition(const double x_in, const double y_in, const double z_in) {
  position = { x_in, y_in, z_in };
}

//-------------------------------------------------------------------------------------------------
std::vector<int> findAtomsByName(const std::vector<AtomRecord> &atoms,
                                 const std::string &atom_name) {
  std::vector<int> result;
  const std::string query = removeTailingWhiteSpace(atom_name);
  const int natom = atoms.size();
  for (int i = 0; i < natom; i++) {
    if (atoms[i].getAtomName() == query) {
      result.push_back(i);
    }
  }
  return result;
}

} // namespace topology
} // namespace mdscan
