#include "copyright.h"
#include "Parsing/parse.h"
#include "Reporting/error_format.h"
#include "behavior.h"

namespace mdscan {
namespace constants {

using parse::strcmpCased;

//-------------------------------------------------------------------------------------------------
ExceptionResponse translateExceptionResponse(const std::string &policy) {
  if (strcmpCased(policy, std::string("die"), CaseSensitivity::NO) ||
      strcmpCased(policy, std::string("error"), CaseSensitivity::NO)) {
    return ExceptionResponse::DIE;
  }
  else if (strcmpCased(policy, std::string("warn"), CaseSensitivity::NO) ||
           strcmpCased(policy, std::string("warning"), CaseSensitivity::NO)) {
    return ExceptionResponse::WARN;
  }
  else if (strcmpCased(policy, std::string("silent"), CaseSensitivity::NO)) {
    return ExceptionResponse::SILENT;
  }
  else {
    rtErr("Invalid exception response policy " + policy + ".", "translateExceptionResponse");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
std::string getEnumerationName(const ExceptionResponse policy) {
  switch (policy) {
  case ExceptionResponse::DIE:
    return std::string("DIE");
  case ExceptionResponse::WARN:
    return std::string("WARN");
  case ExceptionResponse::SILENT:
    return std::string("SILENT");
  }
  __builtin_unreachable();
}

} // namespace constants
} // namespace mdscan
