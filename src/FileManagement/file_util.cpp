#include <cstdio>
#include "copyright.h"
#include "Parsing/parse.h"
#include "Reporting/error_format.h"
#include "file_listing.h"
#include "file_util.h"

namespace mdscan {
namespace diskutil {

using constants::CaseSensitivity;
using errors::ErrorKind;
using parse::strcmpCased;

//-------------------------------------------------------------------------------------------------
std::string getEnumerationName(const PrintSituation expectation) {
  switch (expectation) {
  case PrintSituation::OPEN_NEW:
    return std::string("OPEN_NEW");
  case PrintSituation::APPEND:
    return std::string("APPEND");
  case PrintSituation::OVERWRITE:
    return std::string("OVERWRITE");
  case PrintSituation::UNKNOWN:
    return std::string("UNKNOWN");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
PrintSituation translatePrintSituation(const std::string &expectation) {
  if (strcmpCased(expectation, "open_new", CaseSensitivity::NO) ||
      strcmpCased(expectation, "new", CaseSensitivity::NO)) {
    return PrintSituation::OPEN_NEW;
  }
  else if (strcmpCased(expectation, "append", CaseSensitivity::NO)) {
    return PrintSituation::APPEND;
  }
  else if (strcmpCased(expectation, "overwrite", CaseSensitivity::NO)) {
    return PrintSituation::OVERWRITE;
  }
  else {
    rtErr("Invalid print situation \"" + expectation + "\".", "translatePrintSituation");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
void checkOutputFileAvailability(const std::string &filename, const PrintSituation expectation,
                                 const std::string &description) {
  switch (getDrivePathType(filename)) {
  case DrivePathType::FILE:
    switch (expectation) {
    case PrintSituation::UNKNOWN:
    case PrintSituation::OPEN_NEW:
      rtErr(ErrorKind::OPEN_ERROR, "Unable to open a new file " + filename + " because it "
            "already exists.  Activity: " + description + ".", "checkOutputFileAvailability");
      break;
    case PrintSituation::APPEND:
    case PrintSituation::OVERWRITE:
      break;
    }
    break;
  case DrivePathType::DIRECTORY:
    rtErr(ErrorKind::OPEN_ERROR, "Unable to open a new file " + filename + " because a "
          "directory of the same name exists.  Activity: " + description + ".",
          "checkOutputFileAvailability");
    break;
  case DrivePathType::REGEXP:
    break;
  }
}

//-------------------------------------------------------------------------------------------------
std::ofstream openOutputFile(const std::string &filename, const PrintSituation expectation,
                             const std::string &description, const DataFormat style) {

  // Check the file conditions: look before you leap
  checkOutputFileAvailability(filename, expectation, description);
  std::ofstream foutp;
  std::ios_base::openmode mode = std::ofstream::out;
  switch (expectation) {
  case PrintSituation::UNKNOWN:
  case PrintSituation::OPEN_NEW:
  case PrintSituation::OVERWRITE:
    mode |= std::ofstream::trunc;
    break;
  case PrintSituation::APPEND:
    mode |= std::ofstream::app;
    break;
  }
  switch (style) {
  case DataFormat::ASCII:
    break;
  case DataFormat::BINARY:
    mode |= std::ofstream::binary;
    break;
  }
  foutp.open(filename, mode);

  // Check that the file has been opened
  if (foutp.is_open() == false) {
    rtErr(ErrorKind::OPEN_ERROR, "Attempt to open file " + filename + " failed.  Bad writing "
          "permissions or insufficient disk space may be the problem.  Activity: " + description +
          ".", "openOutputFile");
  }
  return foutp;
}

//-------------------------------------------------------------------------------------------------
int removeFile(const std::string &filename, const ExceptionResponse policy) {
  std::string problem;
  switch (getDrivePathType(filename)) {
  case DrivePathType::FILE:
    break;
  case DrivePathType::DIRECTORY:
    problem = filename + " is a directory.";
    break;
  case DrivePathType::REGEXP:
    problem = filename + " does not exist and therefore cannot be removed.";
    break;
  }
  const int result = (problem.size() == 0) ? remove(filename.c_str()) : 1;
  if (result != 0 && problem.size() == 0) {
    problem = filename + " could not be removed as requested.";
  }
  if (result != 0) {
    switch (policy) {
    case ExceptionResponse::DIE:
      rtErr(problem, "removeFile");
      break;
    case ExceptionResponse::WARN:
      rtWarn(problem, "removeFile");
      break;
    case ExceptionResponse::SILENT:
      break;
    }
  }
  return result;
}

} // namespace diskutil
} // namespace mdscan
