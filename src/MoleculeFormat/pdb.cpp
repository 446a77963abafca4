#include <cstring>
#include "copyright.h"
#include "Chemistry/znumber.h"
#include "Parsing/parse.h"
#include "Reporting/error_format.h"
#include "pdb.h"

namespace mdscan {
namespace structure {

using chemistry::inferElementFromAtomName;
using chemistry::symbolToMass;
using parse::readIntegerValue;
using parse::readRealValue;
using parse::removeTailingWhiteSpace;
using parse::TextFileReader;
using parse::TextOrigin;

//-------------------------------------------------------------------------------------------------
std::vector<AtomRecord> readPdbAtoms(const std::string &file_name) {
  const TextFile tf(file_name, TextOrigin::DISK, std::string(""), "readPdbAtoms");
  return readPdbAtoms(tf);
}

//-------------------------------------------------------------------------------------------------
std::vector<AtomRecord> readPdbAtoms(const TextFile &tf) {
  const TextFileReader tfr = tf.data();
  std::vector<AtomRecord> result;
  for (int i = 0; i < tfr.line_count; i++) {
    const int lz = tfr.line_limits[i];
    const int line_length = tfr.line_limits[i + 1] - lz;
    const char* line_ptr = &tfr.text[lz];

    // Only the first model is read
    if (line_length >= 6 && strncmp(line_ptr, "ENDMDL", 6) == 0) {
      break;
    }
    const bool is_atom = (line_length >= 4 && strncmp(line_ptr, "ATOM", 4) == 0);
    const bool is_hetatm = (line_length >= 6 && strncmp(line_ptr, "HETATM", 6) == 0);
    if ((is_atom || is_hetatm) == false) {
      continue;
    }
    if (line_length < 54) {
      rtErr("Line " + std::to_string(i + 1) + " of PDB file " + tf.getFileName() + " is too "
            "short (" + std::to_string(line_length) + " characters) to hold an atom record.",
            "readPdbAtoms");
    }
    const char alt_loc_id = line_ptr[16];
    if (alt_loc_id != ' ' && alt_loc_id != 'A') {
      continue;
    }

    // Check that the coordinates are properly formatted.
    if (line_ptr[34] != '.' || line_ptr[42] != '.' || line_ptr[50] != '.') {
      rtErr("The file " + tf.getFileName() + " was submitted for coordinate extraction in PDB "
            "format, but does not appear to conform to the format on line " +
            std::to_string(i + 1) + ".", "readPdbAtoms");
    }
    const std::string raw_atom_name(&line_ptr[12], 4);
    const int serial = readIntegerValue(line_ptr, 6, 5);
    const int residue_number = readIntegerValue(line_ptr, 22, 4);
    const std::string residue_name(&line_ptr[17], 3);
    const std::string chain(&line_ptr[21], 1);
    const double x = readRealValue(line_ptr, 30, 8);
    const double y = readRealValue(line_ptr, 38, 8);
    const double z = readRealValue(line_ptr, 46, 8);
    std::string element;
    if (line_length >= 78) {
      element = removeTailingWhiteSpace(std::string(&line_ptr[76], 2));
    }
    if (element.size() == 0) {
      element = inferElementFromAtomName(raw_atom_name);
    }
    result.emplace_back(serial, raw_atom_name, residue_name, residue_number, chain, element,
                        symbolToMass(element), x, y, z);
  }
  return result;
}

} // namespace structure
} // namespace mdscan
