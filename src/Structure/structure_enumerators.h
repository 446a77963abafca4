// -*-c++-*-
#ifndef MDSCAN_STRUCTURE_ENUMERATORS_H
#define MDSCAN_STRUCTURE_ENUMERATORS_H

#include <string>
#include "copyright.h"

namespace mdscan {
namespace structure {

/// \brief Positional RMSD between two structures may be computed with or without first
///        superimposing one structure on the other.
enum class RmsdAlignment {
  ALIGN,    ///< Superimpose each structure on the reference before computing RMSD
  NO_ALIGN  ///< Compute RMSD from the coordinates as they are
};

/// \brief There are two orders of RMSD calculation: all to one (reference structure), or all to
///        all (matrix).
enum class RMSDTask {
  REFERENCE,  ///< Compute the RMSD of all selected frames to a reference frame
  MATRIX      ///< Compute the RMSD of every selected frame to every other selected frame
};

/// \brief Produce strings detailing each of the enumerations above.
///
/// \param input  The enumeration to describe
/// \{
std::string getEnumerationName(RmsdAlignment input);
std::string getEnumerationName(RMSDTask input);
/// \}

/// \brief Translate user input into an RMSD alignment directive.  Boolean words such as "yes"
///        and "false" are accepted along with the enumeration names.
///
/// \param input  The user input to translate
RmsdAlignment translateRmsdAlignment(const std::string &input);

/// \brief Translate user input into an RMSD task.
///
/// \param input  The user input to translate
RMSDTask translateRMSDTask(const std::string &input);

} // namespace structure
} // namespace mdscan

#endif
