// -*-c++-*-
#ifndef MDSCAN_NAMELIST_ELEMENT_H
#define MDSCAN_NAMELIST_ELEMENT_H

#include <string>
#include <vector>
#include "copyright.h"
#include "namelist_enumerators.h"

namespace mdscan {
namespace namelist {

/// \brief One keyword of a namelist, with its type, default value, help message, and whatever
///        values the user has supplied.  Keywords that accept repeated values collect every user
///        entry, and the first user entry displaces any default.
class NamelistElement {
public:

  /// \brief The constructor sets the keyword's type and default.  A blank default leaves the
  ///        keyword missing until the user supplies a value, except for BOOLEAN keywords, which
  ///        are false by default.
  ///
  /// \param keyword_in  The keyword
  /// \param kind_in     Type of value the keyword takes
  /// \param default_in  Default value, as text
  /// \param repeats_in  Whether the keyword may be given more than once
  /// \param help_in     Description of the keyword
  NamelistElement(const std::string &keyword_in, NamelistType kind_in,
                  const std::string &default_in = std::string(""),
                  InputRepeats repeats_in = InputRepeats::NO,
                  const std::string &help_in = std::string("No description provided"));

  /// \brief Get the keyword.
  const std::string& getLabel() const;

  /// \brief Get the type of value the keyword takes.
  NamelistType getKind() const;

  /// \brief Indicate whether the keyword accepts repeated values.
  InputRepeats getRepeatsPolicy() const;

  /// \brief Get the number of values held by the keyword.
  int getEntryCount() const;

  /// \brief Get the origin of the keyword's values.
  InputStatus getStatus() const;

  /// \brief Get a value of the keyword.  The keyword must be of the matching type.
  ///
  /// \param index  Index of the value, for keywords holding several
  /// \{
  int getIntValue(int index = 0) const;
  double getRealValue(int index = 0) const;
  const std::string& getStringValue(int index = 0) const;
  bool getBoolValue() const;
  /// \}

  /// \brief Get the description of the keyword.
  const std::string& getHelp() const;

  /// \brief Set the description of the keyword.
  ///
  /// \param help_in  The new description
  void setHelp(const std::string &help_in);

  /// \brief Assign a value to the keyword from user input.  Returns false, leaving the keyword
  ///        unchanged, if the text cannot be read as a value of the keyword's type.
  ///
  /// \param value  Text of the value
  bool setValue(const std::string &value);

  /// \brief Set a BOOLEAN keyword to true, as when the keyword appears without a value.
  void activateBool();

private:
  std::string label;                       ///< The keyword
  NamelistType kind;                       ///< Type of value the keyword takes
  InputRepeats repeats;                    ///< Whether the keyword may be given more than once
  InputStatus status;                      ///< Origin of the current values
  std::string help_message;                ///< Description of the keyword
  std::vector<int> int_values;             ///< Values of an INTEGER keyword
  std::vector<double> real_values;         ///< Values of a REAL keyword
  std::vector<std::string> string_values;  ///< Values of a STRING keyword
  bool bool_value;                         ///< Value of a BOOLEAN keyword

  /// \brief Check that a value of a particular type and index can be taken from the keyword.
  ///
  /// \param query_kind  Type of value requested
  /// \param index       Index of the value requested
  /// \param caller      Name of the calling function
  void checkRequest(NamelistType query_kind, int index, const char* caller) const;

  /// \brief Store a value, appending it or replacing what is there.  Returns false if the text
  ///        is not a valid value.
  ///
  /// \param value       Text of the value
  /// \param new_status  Origin of the value
  bool storeValue(const std::string &value, InputStatus new_status);
};

} // namespace namelist
} // namespace mdscan

#endif
