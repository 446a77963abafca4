// -*-c++-*-
#ifndef MDSCAN_PARSE_H
#define MDSCAN_PARSE_H

#include <string>
#include <vector>
#include "copyright.h"
#include "Constants/behavior.h"
#include "textfile.h"

namespace mdscan {
namespace parse {

using constants::CaseSensitivity;

/// \brief Enumerate the formats in which a number may be read or printed
enum class NumberFormat {
  SCIENTIFIC,        ///< Real number in exponential notation, i.e. 1.0e-4
  STANDARD_REAL,     ///< Real number with a decimal point and no exponent, i.e. 0.0001
  INTEGER,           ///< Signed integer
  LONG_LONG_INTEGER  ///< Signed 64-bit integer
};

/// \brief Specify the way in which to print a standard real number or integer (with or without
///        leading zeros)
enum class NumberPrintStyle {
  STANDARD,      ///< Print without leading zeros
  LEADING_ZEROS  ///< Print with leading zeros
};

/// \brief Constant to define the default formatting for integer and real number representations.
///        If these values are seen then the program knows to do free formatting.
constexpr int free_number_format = -32788;

/// \brief Determine whether a character string can qualify as an integer or a real number.
///        Leading and trailing white space is permitted, white space within the number is not.
///
/// \param a           The character string
/// \param cform       The expected format of the number
/// \param read_begin  Point in the string at which to being reading the number (defaults to the
///                    start of the string)
/// \param len         Expected length of the number (default 0, continues until the end of the
///                    string)
bool verifyNumberFormat(const char* a, NumberFormat cform, int read_begin = 0, int len = 0);

/// \brief Convert characters to uppercase or lowercase.
///
/// Overloaded:
///   - Convert a single character
///   - Convert a whole string, returning a new string
///
/// \param tc  The character to convert
/// \param ts  The string to convert
/// \{
char uppercase(char tc);
std::string uppercase(const std::string &ts);
char lowercase(char tc);
std::string lowercase(const std::string &ts);
/// \}

/// \brief Compare two strings, with or without case sensitivity.
///
/// \param sa    The first string
/// \param sb    The second string
/// \param csen  Case sensitivity setting
/// \{
bool strcmpCased(const char* sa, const char* sb, CaseSensitivity csen = CaseSensitivity::YES);
bool strcmpCased(const std::string &sa, const char* sb,
                 CaseSensitivity csen = CaseSensitivity::YES);
bool strcmpCased(const std::string &sa, const std::string &sb,
                 CaseSensitivity csen = CaseSensitivity::YES);
/// \}

/// \brief Remove leading and trailing white space from a string.
///
/// \param ts  The string to trim
std::string removeTailingWhiteSpace(const std::string &ts);

/// \brief Separate a stretch of text into words.  White space always separates words, as do any
///        of the additional delimiters.  Text enclosed in single or double quotes is kept as one
///        word, with the quotation marks removed.  An unterminated quotation raises an error.
///
/// \param text        The text to separate
/// \param delimiters  Additional delimiters, i.e. "," or "=", each of which is also returned as
///                    its own word if it is in the keep list
/// \param keep        Delimiters which should be returned as words of their own
std::vector<std::string> separateText(const std::string &text,
                                      const std::vector<char> &delimiters = {},
                                      const std::vector<char> &keep = {});

/// \brief Convert a real number to a formatted string.
///
/// \param value     The number to convert
/// \param format_a  The total width of the number (free_number_format for no fixed width)
/// \param format_b  The number of decimal places (free_number_format for automatic)
/// \param method    Either SCIENTIFIC or STANDARD_REAL
/// \param style     Whether to pad with leading zeros
std::string realToString(double value, int format_a = free_number_format,
                         int format_b = free_number_format,
                         NumberFormat method = NumberFormat::STANDARD_REAL,
                         NumberPrintStyle style = NumberPrintStyle::STANDARD);

/// \brief Read an integer from a fixed stretch of characters, as found in column-formatted files.
///        Raises a runtime error if the characters do not form an integer.
///
/// \param number_text   The text containing the number
/// \param start_index   Position of the first character of the number
/// \param number_length Number of characters in the field
int readIntegerValue(const char* number_text, int start_index, int number_length);

/// \brief Read a real number from a fixed stretch of characters.  Raises a runtime error if the
///        characters do not form a number.
///
/// \param number_text   The text containing the number
/// \param start_index   Position of the first character of the number
/// \param number_length Number of characters in the field
double readRealValue(const char* number_text, int start_index, int number_length);

/// \brief Parse a list of non-negative integers and inclusive ranges, i.e. "0-9, 15, 21-23".
///        The result is sorted in ascending order with duplicates removed.
///
/// \param list         The text of the list
/// \param upper_limit  All indices must be less than this number (-1 imposes no limit)
std::vector<int> parseIndexList(const std::string &list, int upper_limit = -1);

} // namespace parse
} // namespace mdscan

#endif
