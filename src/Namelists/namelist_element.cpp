#include "copyright.h"
#include "Constants/behavior.h"
#include "Parsing/parse.h"
#include "Reporting/error_format.h"
#include "namelist_element.h"

namespace mdscan {
namespace namelist {

using constants::CaseSensitivity;
using errors::ErrorKind;
using parse::NumberFormat;
using parse::strcmpCased;
using parse::verifyNumberFormat;

//-------------------------------------------------------------------------------------------------
NamelistElement::NamelistElement(const std::string &keyword_in, const NamelistType kind_in,
                                 const std::string &default_in, const InputRepeats repeats_in,
                                 const std::string &help_in) :
    label{keyword_in}, kind{kind_in}, repeats{repeats_in}, status{InputStatus::MISSING},
    help_message{help_in}, int_values{}, real_values{}, string_values{}, bool_value{false}
{
  if (kind == NamelistType::BOOLEAN) {
    status = InputStatus::DEFAULT;
  }
  if (default_in.size() > 0 && storeValue(default_in, InputStatus::DEFAULT) == false) {
    rtErr("Default value \"" + default_in + "\" is not a valid " + getEnumerationName(kind) +
          " for keyword " + label + ".", "NamelistElement");
  }
}

//-------------------------------------------------------------------------------------------------
const std::string& NamelistElement::getLabel() const {
  return label;
}

//-------------------------------------------------------------------------------------------------
NamelistType NamelistElement::getKind() const {
  return kind;
}

//-------------------------------------------------------------------------------------------------
InputRepeats NamelistElement::getRepeatsPolicy() const {
  return repeats;
}

//-------------------------------------------------------------------------------------------------
int NamelistElement::getEntryCount() const {
  switch (kind) {
  case NamelistType::BOOLEAN:
    return 1;
  case NamelistType::INTEGER:
    return int_values.size();
  case NamelistType::REAL:
    return real_values.size();
  case NamelistType::STRING:
    return string_values.size();
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
InputStatus NamelistElement::getStatus() const {
  return status;
}

//-------------------------------------------------------------------------------------------------
void NamelistElement::checkRequest(const NamelistType query_kind, const int index,
                                   const char* caller) const {
  if (query_kind != kind) {
    rtErr("Keyword " + label + " holds " + getEnumerationName(kind) + " values, not " +
          getEnumerationName(query_kind) + ".", "NamelistElement", caller);
  }
  if (status == InputStatus::MISSING) {
    rtErr("Keyword " + label + " has no value.", "NamelistElement", caller);
  }
  if (index < 0 || index >= getEntryCount()) {
    rtErr(ErrorKind::OUT_OF_RANGE, "Index " + std::to_string(index) + " is invalid for keyword " +
          label + " with " + std::to_string(getEntryCount()) + " values.", "NamelistElement",
          caller);
  }
}

//-------------------------------------------------------------------------------------------------
int NamelistElement::getIntValue(const int index) const {
  checkRequest(NamelistType::INTEGER, index, "getIntValue");
  return int_values[index];
}

//-------------------------------------------------------------------------------------------------
double NamelistElement::getRealValue(const int index) const {
  checkRequest(NamelistType::REAL, index, "getRealValue");
  return real_values[index];
}

//-------------------------------------------------------------------------------------------------
const std::string& NamelistElement::getStringValue(const int index) const {
  checkRequest(NamelistType::STRING, index, "getStringValue");
  return string_values[index];
}

//-------------------------------------------------------------------------------------------------
bool NamelistElement::getBoolValue() const {
  checkRequest(NamelistType::BOOLEAN, 0, "getBoolValue");
  return bool_value;
}

//-------------------------------------------------------------------------------------------------
const std::string& NamelistElement::getHelp() const {
  return help_message;
}

//-------------------------------------------------------------------------------------------------
void NamelistElement::setHelp(const std::string &help_in) {
  help_message = help_in;
}

//-------------------------------------------------------------------------------------------------
bool NamelistElement::setValue(const std::string &value) {
  return storeValue(value, InputStatus::USER_SPECIFIED);
}

//-------------------------------------------------------------------------------------------------
void NamelistElement::activateBool() {
  if (kind != NamelistType::BOOLEAN) {
    rtErr("Keyword " + label + " holds " + getEnumerationName(kind) + " values and cannot be "
          "activated as a switch.", "NamelistElement", "activateBool");
  }
  bool_value = true;
  status = InputStatus::USER_SPECIFIED;
}

//-------------------------------------------------------------------------------------------------
bool NamelistElement::storeValue(const std::string &value, const InputStatus new_status) {

  // Validate the text before touching any stored values
  switch (kind) {
  case NamelistType::BOOLEAN:
    if (strcmpCased(value, "true", CaseSensitivity::NO) ||
        strcmpCased(value, "yes", CaseSensitivity::NO) ||
        strcmpCased(value, "on", CaseSensitivity::NO) || value == "1") {
      bool_value = true;
    }
    else if (strcmpCased(value, "false", CaseSensitivity::NO) ||
             strcmpCased(value, "no", CaseSensitivity::NO) ||
             strcmpCased(value, "off", CaseSensitivity::NO) || value == "0") {
      bool_value = false;
    }
    else {
      return false;
    }
    status = new_status;
    return true;
  case NamelistType::INTEGER:
    if (verifyNumberFormat(value.c_str(), NumberFormat::INTEGER) == false) {
      return false;
    }
    break;
  case NamelistType::REAL:
    if (verifyNumberFormat(value.c_str(), NumberFormat::STANDARD_REAL) == false &&
        verifyNumberFormat(value.c_str(), NumberFormat::SCIENTIFIC) == false) {
      return false;
    }
    break;
  case NamelistType::STRING:
    break;
  }

  // A keyword that does not repeat holds only its latest value.  A repeating keyword drops its
  // defaults when the first user value arrives.
  const bool replace = (repeats == InputRepeats::NO ||
                        (new_status == InputStatus::USER_SPECIFIED &&
                         status != InputStatus::USER_SPECIFIED));
  if (replace) {
    int_values.resize(0);
    real_values.resize(0);
    string_values.resize(0);
  }
  switch (kind) {
  case NamelistType::BOOLEAN:
    break;
  case NamelistType::INTEGER:
    int_values.push_back(std::stoi(value));
    break;
  case NamelistType::REAL:
    real_values.push_back(std::stod(value));
    break;
  case NamelistType::STRING:
    string_values.push_back(value);
    break;
  }
  status = new_status;
  return true;
}

} // namespace namelist
} // namespace mdscan
