// -*-c++-*-
#ifndef MDSCAN_INPUT_H
#define MDSCAN_INPUT_H

#include <string>
#include "copyright.h"
#include "Parsing/textfile.h"
#include "namelist_emulator.h"

namespace mdscan {
namespace namelist {

using parse::TextFile;
using parse::WrapTextSearch;

/// \brief Remove a comment, begun by '!' or '#' outside of quotations, from one line of input.
///
/// \param line  The line of input
std::string stripComment(const std::string &line);

/// \brief Search a text file for a namelist and read its keywords and values into a namelist
///        emulator.  The namelist begins with its title (i.e. &rmsd) and ends with "&end" or "/".
///        Keywords take values as "keyword = value", and a keyword that accepts repeated values
///        may be given several times or followed by several values.  A BOOLEAN keyword given
///        without a value is switched on.  Returns the line after the end of the namelist, or the
///        starting line if no namelist was found.
///
/// \param tf          The input file, read into RAM
/// \param nml         The namelist to fill
/// \param start_line  Line at which to begin the search
/// \param wrap        Whether to continue the search from the top of the file if the namelist
///                    is not found between the starting line and the end line
/// \param end_line    Line at which to stop the search (-1 searches to the end of the file)
/// \param found       Set to true if the namelist was found, false otherwise (optional)
int readNamelist(const TextFile &tf, NamelistEmulator *nml, int start_line = 0,
                 WrapTextSearch wrap = WrapTextSearch::NO, int end_line = -1,
                 bool *found = nullptr);

} // namespace namelist
} // namespace mdscan

#endif
