// -*-c++-*-
#ifndef MDSCAN_FILE_UTIL_H
#define MDSCAN_FILE_UTIL_H

#include <fstream>
#include <string>
#include "copyright.h"
#include "Constants/behavior.h"

namespace mdscan {
namespace diskutil {

using constants::ExceptionResponse;

/// \brief Enumerate the situations that might be encountered when writing a file
enum class PrintSituation {
  OPEN_NEW,   ///< Expect to open a new file, and fail if the file already exists
  APPEND,     ///< Append to an existing file, or open a new one if none exists
  OVERWRITE,  ///< Always open a fresh file, overwriting anything that is there
  UNKNOWN     ///< Treated as OPEN_NEW
};

/// \brief Enumerate the kinds of data a file may hold
enum class DataFormat {
  ASCII,  ///< Human-readable text
  BINARY  ///< Binary data, opened with the appropriate stream flags
};

/// \brief Get a human-readable name for one of the print situations.
///
/// \param expectation  The print situation of interest
std::string getEnumerationName(PrintSituation expectation);

/// \brief Translate a user-supplied string into a print situation.
///
/// \param expectation  The string to translate
PrintSituation translatePrintSituation(const std::string &expectation);

/// \brief Check that a file may be written under the stated conditions.  This encapsulates error
///        messages in the event that the file is already present, or a directory stands in the
///        way.  Files written through third-party libraries are vetted by this function before
///        the library opens them.
///
/// \param filename     Name of the file to write
/// \param expectation  Conditions to look for in order to successfully open the file for writing
/// \param description  Description of the file, to help identify problems if it cannot be written
void checkOutputFileAvailability(const std::string &filename, PrintSituation expectation,
                                 const std::string &description = std::string(""));

/// \brief Open a file for output writing.  This encapsulates error messages in the event that
///        the file cannot be opened as expected.
///
/// \param filename     Name of the file to write
/// \param expectation  Conditions to look for in order to successfully open the file for writing
/// \param description  Description of the file, to help identify problems if it cannot be written
/// \param style        The kind of file to write, ascii or binary
std::ofstream openOutputFile(const std::string &filename,
                             PrintSituation expectation = PrintSituation::OPEN_NEW,
                             const std::string &description = std::string(""),
                             DataFormat style = DataFormat::ASCII);

/// \brief Remove a file.  This encapsulates error messages in the event that the file cannot be
///        removed as requested.
///
/// \param filename  Name of the file to remove
/// \param policy    Indicates what to do if the file cannot be removed for some reason
int removeFile(const std::string &filename, ExceptionResponse policy = ExceptionResponse::WARN);

} // namespace diskutil
} // namespace mdscan

#endif
