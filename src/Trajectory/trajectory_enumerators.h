// -*-c++-*-
#ifndef MDSCAN_TRAJECTORY_ENUMERATORS_H
#define MDSCAN_TRAJECTORY_ENUMERATORS_H

#include <string>
#include "copyright.h"
#include "FileManagement/file_util.h"

namespace mdscan {
namespace trajectory {

using diskutil::DataFormat;

/// \brief The trajectory file formats that can be read and written
enum class CoordinateFileKind {
  AMBER_CRD,     ///< The awful .crd format trajectory file, 10 x %8.3f per line, with or
                 ///<   without box coordinates
  AMBER_NETCDF,  ///< The binary Amber NetCDF trajectory format
  UNKNOWN        ///< The coordinate file kind is not (yet) understood
};

/// \brief Enumerate the shapes of simulation cells that a trajectory frame may carry
enum class UnitCellType {
  NONE,          ///< No periodic boundary conditions, or no box information in the file
  ORTHORHOMBIC,  ///< All box angles are 90 degrees
  TRICLINIC      ///< General box angles
};

/// \brief An enumerator to track different Amber NetCDF variable identifiers.  The associated
///        translation function produces the strings of interest.
enum class AncdfVariable {
  NCFRAME,         ///< The (unlimited) frame dimension
  NCSPATIAL,       ///< The spatial dimension, and the variable holding its labels "xyz"
  NCATOM,          ///< The atom dimension
  NCCELL_SPATIAL,  ///< The cell spatial dimension, and the variable holding its labels "abc"
  NCCELL_LENGTHS,  ///< Box lengths of each frame
  NCCELL_ANGULAR,  ///< The cell angular dimension, and the variable holding the angle names
  NCCELL_ANGLES,   ///< Box angles of each frame, in degrees
  NCCOORDS,        ///< Coordinates of each frame
  NCTIME,          ///< Time of each frame, in picoseconds
  NCLABEL          ///< The label dimension, for the names of the box angles
};

/// \brief Produce a human-readable name for an enumeration.
///
/// \param input  The enumerator instance of interest
/// \{
std::string getEnumerationName(CoordinateFileKind input);
std::string getEnumerationName(UnitCellType input);
/// \}

/// \brief Translate the AncdfVariable enumeration.  This provides keywords to serve as landmarks
///        in an Amber binary trajectory.
///
/// \param key  The enumerator instance of interest
std::string getAncdfVariableName(AncdfVariable key);

/// \brief Get the nature of a trajectory file based on the stated format (this will return
///        binary or ASCII based on the stated trajectory file kind)
///
/// \param cfkind  The trajectory file kind
DataFormat getTrajectoryFormat(CoordinateFileKind cfkind);

/// \brief Translate a string into one of the CoordinateFileKind enumerations.  "AUTO" and
///        "UNKNOWN" both indicate that the format should be detected from the file itself.
///
/// \param name_in  The string to translate
CoordinateFileKind translateCoordinateFileKind(const std::string &name_in);

/// \brief Detect the kind of a trajectory file.  NetCDF files are recognized by the magic
///        numbers at the head of the file (classic, 64-bit offset, and HDF5-based formats).  Other
///        files are taken to be Amber .crd trajectories if their head contains only text.  An
///        OpenError is raised if the file cannot be read.
///
/// \param file_name  Name of the file to test
/// \param caller     Name of the calling function (optional)
CoordinateFileKind detectCoordinateFileKind(const std::string &file_name,
                                            const std::string &caller = std::string(""));

/// \brief Determine the shape of a unit cell from the matrix of its box vectors.
///
/// \param invu  Transformation from fractional into Cartesian space, columns are box vectors
UnitCellType determineUnitCellTypeByShape(const double* invu);

} // namespace trajectory
} // namespace mdscan

#endif
