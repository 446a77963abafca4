#include "copyright.h"
#include "namelist_enumerators.h"

namespace mdscan {
namespace namelist {

//-------------------------------------------------------------------------------------------------
std::string getEnumerationName(const NamelistType input) {
  switch (input) {
  case NamelistType::BOOLEAN:
    return std::string("BOOLEAN");
  case NamelistType::INTEGER:
    return std::string("INTEGER");
  case NamelistType::REAL:
    return std::string("REAL");
  case NamelistType::STRING:
    return std::string("STRING");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
std::string getEnumerationName(const InputRepeats input) {
  switch (input) {
  case InputRepeats::NO:
    return std::string("NO");
  case InputRepeats::YES:
    return std::string("YES");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
std::string getEnumerationName(const InputStatus input) {
  switch (input) {
  case InputStatus::USER_SPECIFIED:
    return std::string("USER_SPECIFIED");
  case InputStatus::DEFAULT:
    return std::string("DEFAULT");
  case InputStatus::MISSING:
    return std::string("MISSING");
  }
  __builtin_unreachable();
}

} // namespace namelist
} // namespace mdscan
