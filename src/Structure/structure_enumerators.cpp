#include "copyright.h"
#include "Constants/behavior.h"
#include "Parsing/parse.h"
#include "Reporting/error_format.h"
#include "structure_enumerators.h"

namespace mdscan {
namespace structure {

using constants::CaseSensitivity;
using parse::strcmpCased;

//-------------------------------------------------------------------------------------------------
std::string getEnumerationName(const RmsdAlignment input) {
  switch (input) {
  case RmsdAlignment::ALIGN:
    return std::string("ALIGN");
  case RmsdAlignment::NO_ALIGN:
    return std::string("NO_ALIGN");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
std::string getEnumerationName(const RMSDTask input) {
  switch (input) {
  case RMSDTask::REFERENCE:
    return std::string("REFERENCE");
  case RMSDTask::MATRIX:
    return std::string("MATRIX");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
RmsdAlignment translateRmsdAlignment(const std::string &input) {
  if (strcmpCased(input, std::string("align"), CaseSensitivity::NO) ||
      strcmpCased(input, std::string("yes"), CaseSensitivity::NO) ||
      strcmpCased(input, std::string("true"), CaseSensitivity::NO) ||
      strcmpCased(input, std::string("on"), CaseSensitivity::NO)) {
    return RmsdAlignment::ALIGN;
  }
  else if (strcmpCased(input, std::string("no_align"), CaseSensitivity::NO) ||
           strcmpCased(input, std::string("no"), CaseSensitivity::NO) ||
           strcmpCased(input, std::string("false"), CaseSensitivity::NO) ||
           strcmpCased(input, std::string("off"), CaseSensitivity::NO)) {
    return RmsdAlignment::NO_ALIGN;
  }
  else {
    rtErr("\"" + input + "\" is not a valid RMSD alignment directive.", "translateRmsdAlignment");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
RMSDTask translateRMSDTask(const std::string &input) {
  if (strcmpCased(input, std::string("reference"), CaseSensitivity::NO)) {
    return RMSDTask::REFERENCE;
  }
  else if (strcmpCased(input, std::string("matrix"), CaseSensitivity::NO)) {
    return RMSDTask::MATRIX;
  }
  else {
    rtErr("\"" + input + "\" is not a valid RMSD task.", "translateRMSDTask");
  }
  __builtin_unreachable();
}

} // namespace structure
} // namespace mdscan
