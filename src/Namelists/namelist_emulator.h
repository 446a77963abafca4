// -*-c++-*-
#ifndef MDSCAN_NAMELIST_EMULATOR_H
#define MDSCAN_NAMELIST_EMULATOR_H

#include <string>
#include <vector>
#include "copyright.h"
#include "Constants/behavior.h"
#include "namelist_element.h"

namespace mdscan {
namespace namelist {

using constants::CaseSensitivity;
using constants::ExceptionResponse;

/// \brief Collection of variables to transcribe information contained within a namelist
class NamelistEmulator {
public:

  /// \brief Construct an object to emulate Fortran namelist functionality.
  ///
  /// \param title_in                The title of the namelist
  /// \param casing_in               Case sensitivity to abide in matching keywords (values are
  ///                                always case sensitive)
  /// \param unknown_keyword_policy  Response to keywords the namelist does not recognize, or to
  ///                                values that cannot be read
  /// \param help_in                 Description of the namelist as a whole
  NamelistEmulator(const std::string &title_in,
                   CaseSensitivity casing_in = CaseSensitivity::NO,
                   ExceptionResponse unknown_keyword_policy = ExceptionResponse::WARN,
                   const std::string &help_in = std::string("No description provided"));

  /// \brief Obtain the title of this namelist (i.e. &trajectory or &rmsd)
  const std::string& getTitle() const;

  /// \brief Obtain the number of parameters catalogged within this namelist emulator.
  int getKeywordCount() const;

  /// \brief Obtain the case sensitivity setting for this namelist.
  CaseSensitivity getCaseSensitivity() const;

  /// \brief Relay the exception handling policy for this namelist.
  ExceptionResponse getPolicy() const;

  /// \brief Get a keyword from this namelist based on an index, as when stepping through the
  ///        keywords in the order they were added.
  ///
  /// \param index  Index of the keyword in the list held by this namelist
  const std::string& getKeyword(int index) const;

  /// \brief Get the type of a specific keyword within this namelist.
  ///
  /// \param keyword_query  The keyword of interest
  NamelistType getKeywordKind(const std::string &keyword_query) const;

  /// \brief Get the number of entries associated with a specific keyword.
  ///
  /// \param keyword_query  The keyword of interest
  int getKeywordEntries(const std::string &keyword_query) const;

  /// \brief Test whether a keyword has been set, be that by default or user input.
  ///
  /// \param keyword_query  The keyword of interest
  InputStatus getKeywordStatus(const std::string &keyword_query) const;

  /// \brief Get a labeled value from within the namelist.
  ///
  /// \param keyword_query  Identifier of the keyword of interest
  /// \param index          For keywords that store multiple values, retrieve this value
  /// \{
  int getIntValue(const std::string &keyword_query, int index = 0) const;
  double getRealValue(const std::string &keyword_query, int index = 0) const;
  std::string getStringValue(const std::string &keyword_query, int index = 0) const;
  bool getBoolValue(const std::string &keyword_query) const;
  /// \}

  /// \brief Get all string values assigned to a particular keyword.
  ///
  /// \param keyword_query  Identifier of the keyword of interest
  std::vector<std::string> getAllStringValues(const std::string &keyword_query) const;

  /// \brief Report the help message for the namelist, or for one of its keywords.
  ///
  /// \param keyword_query  Identifier of the keyword of interest
  /// \{
  std::string getHelp() const;
  std::string getHelp(const std::string &keyword_query) const;
  /// \}

  /// \brief Add keywords to the namelist.  Adding a keyword that is already present is an error.
  ///
  /// \param new_key   The keyword to add
  /// \param new_keys  The keywords to add
  /// \{
  void addKeyword(const NamelistElement &new_key);
  void addKeywords(const std::vector<NamelistElement> &new_keys);
  /// \}

  /// \brief Attach a help message to a keyword.
  ///
  /// \param keyword_query  Identifier of the keyword of interest
  /// \param help_in        The help message
  void addHelp(const std::string &keyword_query, const std::string &help_in);

  /// \brief Assign a value to a keyword.  Returns 1 if the value was assigned or 0 if not, after
  ///        responding to any problem according to the namelist's policy.
  ///
  /// \param key    The keyword
  /// \param value  Text of the value
  int assignElement(const std::string &key, const std::string &value);

  /// \brief Activate a BOOLEAN keyword that appears without a value.  Returns 1 if the keyword
  ///        was activated or 0 if not.
  ///
  /// \param key  The keyword
  int activateBool(const std::string &key);

  /// \brief Indicate whether the namelist has a particular keyword.
  ///
  /// \param keyword_query  The keyword of interest
  bool hasKeyword(const std::string &keyword_query) const;

private:
  std::string title;                      ///< Title of the namelist, without the ampersand
  std::vector<NamelistElement> keywords;  ///< All keywords in the namelist
  CaseSensitivity casing;                 ///< Case sensitivity of keywords
  ExceptionResponse policy;               ///< Response to unknown keywords or bad values
  std::string help_message;               ///< Description of the namelist

  /// \brief Find the index of a keyword, returning the number of keywords if it is not found.
  ///
  /// \param query  The keyword of interest
  int findIndexByKeyword(const std::string &query) const;

  /// \brief Find a keyword that must be present, raising an error if it is not.
  ///
  /// \param query   The keyword of interest
  /// \param caller  Name of the calling function
  const NamelistElement& getElement(const std::string &query, const char* caller) const;

  /// \brief Respond to a problem with user input according to the namelist's policy.
  ///
  /// \param message  Description of the problem
  /// \param caller   Name of the calling function
  void badInputResponse(const std::string &message, const char* caller) const;
};

} // namespace namelist
} // namespace mdscan

#endif
