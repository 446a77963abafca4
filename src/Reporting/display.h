// -*-c++-*-
#ifndef MDSCAN_DISPLAY_H
#define MDSCAN_DISPLAY_H

#include <fstream>
#include <iostream>
#include <string>
#include "copyright.h"

namespace mdscan {
namespace display {
  
/// \brief Print a horizontal bar of --- across the screen, using a corner of the developer's
///        choice (default '+')
///
/// \param left_corner   Character (or string) to place at the left end of the rule
/// \param right_corner  Character (or string) to place at the right end of the rule
/// \param width         Total width of the rule (0 detects the console width)
/// \param foutp         Stream to write to
void terminalHorizontalRule(const std::string &left_corner = std::string("+"),
                            const std::string &right_corner = std::string("+"),
                            int width = 0, std::ostream *foutp = &std::cout);

/// \brief Print the banner that opens the output of an mdscan program.
///
/// \param program_name  Name of the program issuing the banner
/// \param foutp         Stream to write to
void mdscanSplash(const std::string &program_name, std::ostream *foutp = &std::cout);

} // namespace display
} // namespace mdscan

#endif
