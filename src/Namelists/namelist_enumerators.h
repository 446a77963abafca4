// -*-c++-*-
#ifndef MDSCAN_NAMELIST_ENUMERATORS_H
#define MDSCAN_NAMELIST_ENUMERATORS_H

#include <string>
#include "copyright.h"

namespace mdscan {
namespace namelist {

/// \brief Enumerator to describe all types of namelist variables
enum class NamelistType {
  BOOLEAN,  ///< A switch, set to true by naming the keyword alone or assigning a true value
  INTEGER,  ///< An integer value
  REAL,     ///< A real number value
  STRING    ///< A string value, which may be quoted to include spaces or delimiters
};

/// \brief Enumerate choices on whether to accept multiple values (this exists to make the code
///        more legible and is otherwise translated into a boolean variable)
enum class InputRepeats {
  NO, YES
};

/// \brief Enumerate the possible ways that input could have come in (or failed to be obtained)
enum class InputStatus {
  USER_SPECIFIED, DEFAULT, MISSING
};

/// \brief Return a string corresponding to the namelist data type enumerations.
///
/// \param input  The enumeration of interest
/// \{
std::string getEnumerationName(NamelistType input);
std::string getEnumerationName(InputRepeats input);
std::string getEnumerationName(InputStatus input);
/// \}

} // namespace namelist
} // namespace mdscan

#endif
