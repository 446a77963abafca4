#include "copyright.h"
#include "Parsing/parse.h"
#include "Reporting/error_format.h"
#include "namelist_emulator.h"

namespace mdscan {
namespace namelist {

using errors::ErrorKind;
using parse::strcmpCased;

//-------------------------------------------------------------------------------------------------
NamelistEmulator::NamelistEmulator(const std::string &title_in, const CaseSensitivity casing_in,
                                   const ExceptionResponse unknown_keyword_policy,
                                   const std::string &help_in) :
    title{title_in}, keywords{}, casing{casing_in}, policy{unknown_keyword_policy},
    help_message{help_in}
{}

//-------------------------------------------------------------------------------------------------
const std::string& NamelistEmulator::getTitle() const {
  return title;
}

//-------------------------------------------------------------------------------------------------
int NamelistEmulator::getKeywordCount() const {
  return keywords.size();
}

//-------------------------------------------------------------------------------------------------
CaseSensitivity NamelistEmulator::getCaseSensitivity() const {
  return casing;
}

//-------------------------------------------------------------------------------------------------
ExceptionResponse NamelistEmulator::getPolicy() const {
  return policy;
}

//-------------------------------------------------------------------------------------------------
const std::string& NamelistEmulator::getKeyword(const int index) const {
  if (index < 0 || index >= static_cast<int>(keywords.size())) {
    rtErr(ErrorKind::OUT_OF_RANGE, "Index " + std::to_string(index) + " is invalid for a "
          "namelist with " + std::to_string(keywords.size()) + " keywords.", "NamelistEmulator",
          "getKeyword");
  }
  return keywords[index].getLabel();
}

//-------------------------------------------------------------------------------------------------
int NamelistEmulator::findIndexByKeyword(const std::string &query) const {
  const int nkw = keywords.size();
  for (int i = 0; i < nkw; i++) {
    if (strcmpCased(keywords[i].getLabel(), query, casing)) {
      return i;
    }
  }
  return nkw;
}

//-------------------------------------------------------------------------------------------------
const NamelistElement& NamelistEmulator::getElement(const std::string &query,
                                                    const char* caller) const {
  const int idx = findIndexByKeyword(query);
  if (idx == static_cast<int>(keywords.size())) {
    rtErr("Namelist &" + title + " has no keyword " + query + ".", "NamelistEmulator", caller);
  }
  return keywords[idx];
}

//-------------------------------------------------------------------------------------------------
NamelistType NamelistEmulator::getKeywordKind(const std::string &keyword_query) const {
  return getElement(keyword_query, "getKeywordKind").getKind();
}

//-------------------------------------------------------------------------------------------------
int NamelistEmulator::getKeywordEntries(const std::string &keyword_query) const {
  const NamelistElement &nmle = getElement(keyword_query, "getKeywordEntries");
  return (nmle.getStatus() == InputStatus::MISSING) ? 0 : nmle.getEntryCount();
}

//-------------------------------------------------------------------------------------------------
InputStatus NamelistEmulator::getKeywordStatus(const std::string &keyword_query) const {
  return getElement(keyword_query, "getKeywordStatus").getStatus();
}

//-------------------------------------------------------------------------------------------------
int NamelistEmulator::getIntValue(const std::string &keyword_query, const int index) const {
  return getElement(keyword_query, "getIntValue").getIntValue(index);
}

//-------------------------------------------------------------------------------------------------
double NamelistEmulator::getRealValue(const std::string &keyword_query, const int index) const {
  return getElement(keyword_query, "getRealValue").getRealValue(index);
}

//-------------------------------------------------------------------------------------------------
std::string NamelistEmulator::getStringValue(const std::string &keyword_query,
                                             const int index) const {
  return getElement(keyword_query, "getStringValue").getStringValue(index);
}

//-------------------------------------------------------------------------------------------------
bool NamelistEmulator::getBoolValue(const std::string &keyword_query) const {
  return getElement(keyword_query, "getBoolValue").getBoolValue();
}

//-------------------------------------------------------------------------------------------------
std::vector<std::string>
NamelistEmulator::getAllStringValues(const std::string &keyword_query) const {
  const NamelistElement &nmle = getElement(keyword_query, "getAllStringValues");
  std::vector<std::string> result;
  if (nmle.getStatus() == InputStatus::MISSING) {
    return result;
  }
  const int nval = nmle.getEntryCount();
  for (int i = 0; i < nval; i++) {
    result.push_back(nmle.getStringValue(i));
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
std::string NamelistEmulator::getHelp() const {
  std::string result = "&" + title + ": " + help_message + "\n";
  for (size_t i = 0; i < keywords.size(); i++) {
    result += "  " + keywords[i].getLabel() + " [" + getEnumerationName(keywords[i].getKind()) +
              "]: " + keywords[i].getHelp() + "\n";
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
std::string NamelistEmulator::getHelp(const std::string &keyword_query) const {
  return getElement(keyword_query, "getHelp").getHelp();
}

//-------------------------------------------------------------------------------------------------
void NamelistEmulator::addKeyword(const NamelistElement &new_key) {
  if (findIndexByKeyword(new_key.getLabel()) < static_cast<int>(keywords.size())) {
    rtErr("Namelist &" + title + " already has a keyword " + new_key.getLabel() + ".",
          "NamelistEmulator", "addKeyword");
  }
  keywords.push_back(new_key);
}

//-------------------------------------------------------------------------------------------------
void NamelistEmulator::addKeywords(const std::vector<NamelistElement> &new_keys) {
  for (size_t i = 0; i < new_keys.size(); i++) {
    addKeyword(new_keys[i]);
  }
}

//-------------------------------------------------------------------------------------------------
void NamelistEmulator::addHelp(const std::string &keyword_query, const std::string &help_in) {
  const int idx = findIndexByKeyword(keyword_query);
  if (idx == static_cast<int>(keywords.size())) {
    rtErr("Namelist &" + title + " has no keyword " + keyword_query + ".", "NamelistEmulator",
          "addHelp");
  }
  keywords[idx].setHelp(help_in);
}

//-------------------------------------------------------------------------------------------------
bool NamelistEmulator::hasKeyword(const std::string &keyword_query) const {
  return (findIndexByKeyword(keyword_query) < static_cast<int>(keywords.size()));
}

//-------------------------------------------------------------------------------------------------
void NamelistEmulator::badInputResponse(const std::string &message, const char* caller) const {
  switch (policy) {
  case ExceptionResponse::DIE:
    rtErr(message, "NamelistEmulator", caller);
    break;
  case ExceptionResponse::WARN:
    rtWarn(message, "NamelistEmulator", caller);
    break;
  case ExceptionResponse::SILENT:
    break;
  }
}

//-------------------------------------------------------------------------------------------------
int NamelistEmulator::assignElement(const std::string &key, const std::string &value) {
  const int idx = findIndexByKeyword(key);
  if (idx == static_cast<int>(keywords.size())) {
    badInputResponse("Namelist &" + title + " has no keyword " + key + ".  The value \"" + value +
                     "\" is ignored.", "assignElement");
    return 0;
  }
  if (keywords[idx].setValue(value) == false) {
    badInputResponse("\"" + value + "\" is not a valid " +
                     getEnumerationName(keywords[idx].getKind()) + " value for keyword " + key +
                     " in namelist &" + title + ".", "assignElement");
    return 0;
  }
  return 1;
}

//-------------------------------------------------------------------------------------------------
int NamelistEmulator::activateBool(const std::string &key) {
  const int idx = findIndexByKeyword(key);
  if (idx == static_cast<int>(keywords.size())) {
    badInputResponse("Namelist &" + title + " has no keyword " + key + ".", "activateBool");
    return 0;
  }
  if (keywords[idx].getKind() != NamelistType::BOOLEAN) {
    badInputResponse("Keyword " + key + " in namelist &" + title + " requires a value.",
                     "activateBool");
    return 0;
  }
  keywords[idx].activateBool();
  return 1;
}

} // namespace namelist
} // namespace mdscan
