#include <sys/stat.h>
#include "copyright.h"
#include "Reporting/error_format.h"
#include "file_listing.h"

namespace mdscan {
namespace diskutil {

//-------------------------------------------------------------------------------------------------
char osSeparator() {
  switch (detected_os) {
  case OperatingSystem::LINUX:
  case OperatingSystem::UNIX:
  case OperatingSystem::MAC_OS:
    return '/';
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
DrivePathType getDrivePathType(const std::string &path) {

  // Try getting the status.  If this fails, the path is probably a regular expression.
  struct stat path_stat;
  if (stat(path.c_str(), &path_stat) == 0) {
    if (S_ISREG(path_stat.st_mode)) {
      return DrivePathType::FILE;
    }
    else if (S_ISDIR(path_stat.st_mode)) {
      return DrivePathType::DIRECTORY;
    }
  }
  return DrivePathType::REGEXP;
}

//-------------------------------------------------------------------------------------------------
std::string getNormPath(const std::string &path) {
  const char sep_char = osSeparator();
  int i = static_cast<int>(path.size()) - 1;
  while (i > 0 && path[i] == sep_char) {
    i--;
  }
  return path.substr(0, i + 1);
}

//-------------------------------------------------------------------------------------------------
std::string getBaseName(const std::string &path) {
  const char sep_char = osSeparator();
  const int plength = path.size();
  int last_separator = 0;
  for (int i = 0; i < plength; i++) {
    if (path[i] == sep_char) {
      last_separator = i + 1;
    }
  }
  return path.substr(last_separator, plength - last_separator);
}

} // namespace diskutil
} // namespace mdscan
