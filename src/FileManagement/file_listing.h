// -*-c++-*-
#ifndef MDSCAN_FILE_LISTING_H
#define MDSCAN_FILE_LISTING_H

#include <string>
#include "copyright.h"

namespace mdscan {
namespace diskutil {

/// \brief Enumerate whether a path can be determined to be a file, directory, or, barring any
///        other explanation, a regular expression (a path that does not yet exist).
enum class DrivePathType {
  FILE, DIRECTORY, REGEXP
};

/// \brief An enumerator to make note of the operating systems
enum class OperatingSystem {
  LINUX, UNIX, MAC_OS
};

/// Pre-processor directives determine the separators to use in path and file concatenation
/// \{
#if defined(__linux__)
constexpr OperatingSystem detected_os = OperatingSystem::LINUX;
#elif defined(__APPLE__) || defined(__MACH__)
constexpr OperatingSystem detected_os = OperatingSystem::MAC_OS;
#else
constexpr OperatingSystem detected_os = OperatingSystem::UNIX;
#endif
/// \}

/// \brief Produce the correct file path separator.
char osSeparator();

/// \brief Test whether a path is a file, directory, or must instead be a regular expression.
///
/// \param path  The path of interest
DrivePathType getDrivePathType(const std::string &path);

/// \brief Normalize a path by removing any trailing separators.
///
/// \param path  The path to normalize
std::string getNormPath(const std::string &path);

/// \brief Get the base name of a path, everything after the final separator.
///
/// \param path  The path of interest
std::string getBaseName(const std::string &path);

} // namespace diskutil
} // namespace mdscan

#endif
