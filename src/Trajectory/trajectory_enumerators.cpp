#include <cmath>
#include <fstream>
#include <vector>
#include "copyright.h"
#include "Constants/scaling.h"
#include "Parsing/parse.h"
#include "Reporting/error_format.h"
#include "trajectory_enumerators.h"

namespace mdscan {
namespace trajectory {

using constants::CaseSensitivity;
using errors::ErrorKind;
using parse::strcmpCased;

//-------------------------------------------------------------------------------------------------
std::string getEnumerationName(const CoordinateFileKind input) {
  switch (input) {
  case CoordinateFileKind::AMBER_CRD:
    return std::string("AMBER_CRD");
  case CoordinateFileKind::AMBER_NETCDF:
    return std::string("AMBER_NETCDF");
  case CoordinateFileKind::UNKNOWN:
    return std::string("UNKNOWN");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
std::string getEnumerationName(const UnitCellType input) {
  switch (input) {
  case UnitCellType::NONE:
    return std::string("NONE");
  case UnitCellType::ORTHORHOMBIC:
    return std::string("ORTHORHOMBIC");
  case UnitCellType::TRICLINIC:
    return std::string("TRICLINIC");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
std::string getAncdfVariableName(const AncdfVariable key) {
  switch (key) {
  case AncdfVariable::NCFRAME:
    return std::string("frame");
  case AncdfVariable::NCSPATIAL:
    return std::string("spatial");
  case AncdfVariable::NCATOM:
    return std::string("atom");
  case AncdfVariable::NCCELL_SPATIAL:
    return std::string("cell_spatial");
  case AncdfVariable::NCCELL_LENGTHS:
    return std::string("cell_lengths");
  case AncdfVariable::NCCELL_ANGULAR:
    return std::string("cell_angular");
  case AncdfVariable::NCCELL_ANGLES:
    return std::string("cell_angles");
  case AncdfVariable::NCCOORDS:
    return std::string("coordinates");
  case AncdfVariable::NCTIME:
    return std::string("time");
  case AncdfVariable::NCLABEL:
    return std::string("label");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
DataFormat getTrajectoryFormat(const CoordinateFileKind cfkind) {
  switch (cfkind) {
  case CoordinateFileKind::AMBER_CRD:
    return DataFormat::ASCII;
  case CoordinateFileKind::AMBER_NETCDF:
    return DataFormat::BINARY;
  case CoordinateFileKind::UNKNOWN:
    rtWarn("Unable to determine the nature of an UNKNOWN kind trajectory file.  Reporting BINARY.",
           "getTrajectoryFormat");
    return DataFormat::BINARY;
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
CoordinateFileKind translateCoordinateFileKind(const std::string &name_in) {
  if (strcmpCased(name_in, "AMBER_CRD", CaseSensitivity::NO) ||
      strcmpCased(name_in, "CRD", CaseSensitivity::NO) ||
      strcmpCased(name_in, "MDCRD", CaseSensitivity::NO)) {
    return CoordinateFileKind::AMBER_CRD;
  }
  else if (strcmpCased(name_in, "AMBER_NETCDF", CaseSensitivity::NO) ||
           strcmpCased(name_in, "NETCDF", CaseSensitivity::NO) ||
           strcmpCased(name_in, "NC", CaseSensitivity::NO)) {
    return CoordinateFileKind::AMBER_NETCDF;
  }
  else if (strcmpCased(name_in, "AUTO", CaseSensitivity::NO) ||
           strcmpCased(name_in, "UNKNOWN", CaseSensitivity::NO)) {
    return CoordinateFileKind::UNKNOWN;
  }
  else {
    rtErr("Invalid coordinate file kind \"" + name_in + "\".", "translateCoordinateFileKind");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
CoordinateFileKind detectCoordinateFileKind(const std::string &file_name,
                                            const std::string &caller) {
  std::ifstream finp;
  finp.open(file_name.c_str(), std::ifstream::in | std::ifstream::binary);
  if (finp.is_open() == false) {
    if (caller.size() == 0) {
      rtErr(ErrorKind::OPEN_ERROR, file_name + " was not found.", "detectCoordinateFileKind");
    }
    else {
      rtErr(ErrorKind::OPEN_ERROR, file_name + " was not found when called from " + caller + ".",
            "detectCoordinateFileKind");
    }
  }

  // Read the first 2kB of the file, if that much exists.  Look for the NetCDF magic numbers,
  // then for characters that might indicate that it is some other binary file.
  const int maxchar = 2048;
  std::vector<char> buffer(maxchar);
  int pos = 0;
  char c;
  while (pos < maxchar && finp.get(c)) {
    buffer[pos] = c;
    pos++;
  }
  finp.close();
  if (pos >= 4 && buffer[0] == 'C' && buffer[1] == 'D' && buffer[2] == 'F' &&
      (buffer[3] == '\001' || buffer[3] == '\002' || buffer[3] == '\005')) {
    return CoordinateFileKind::AMBER_NETCDF;
  }
  if (pos >= 4 && static_cast<unsigned char>(buffer[0]) == 0x89 && buffer[1] == 'H' &&
      buffer[2] == 'D' && buffer[3] == 'F') {
    return CoordinateFileKind::AMBER_NETCDF;
  }
  if (pos == 0) {
    return CoordinateFileKind::UNKNOWN;
  }
  for (int i = 0; i < pos; i++) {
    const unsigned char uc = static_cast<unsigned char>(buffer[i]);
    if (uc >= 128 || (uc < 32 && uc != '\n' && uc != '\r' && uc != '\t')) {
      return CoordinateFileKind::UNKNOWN;
    }
  }
  return CoordinateFileKind::AMBER_CRD;
}

//-------------------------------------------------------------------------------------------------
UnitCellType determineUnitCellTypeByShape(const double* invu) {
  if (fabs(invu[0] - 1.0) < constants::tiny && fabs(invu[4] - 1.0) < constants::tiny &&
      fabs(invu[8] - 1.0) < constants::tiny && fabs(invu[3]) < constants::tiny &&
      fabs(invu[6]) < constants::tiny && fabs(invu[7]) < constants::tiny) {

    // The identity matrix indicates that there is no unit cell
    return UnitCellType::NONE;
  }
  if (fabs(invu[3]) < constants::small && fabs(invu[6]) < constants::small &&
      fabs(invu[7]) < constants::small) {
    return UnitCellType::ORTHORHOMBIC;
  }
  return UnitCellType::TRICLINIC;
}

} // namespace trajectory
} // namespace mdscan
