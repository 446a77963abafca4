#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include "copyright.h"
#include "Reporting/error_format.h"
#include "parse.h"

namespace mdscan {
namespace parse {

//-------------------------------------------------------------------------------------------------
bool verifyNumberFormat(const char* a, const NumberFormat cform, const int read_begin,
                        const int len) {
  const int width = (len > 0) ? len : static_cast<int>(strlen(a)) - read_begin;
  if (width <= 0) {
    return false;
  }

  // Fill a buffer with data from the input character array, marking any interior white space
  std::vector<char> buffer(width, ' ');
  bool problem = false;
  bool number_begins = false;
  bool number_ends = false;
  for (int i = 0; i < width; i++) {
    buffer[i] = a[read_begin + i];
    if (buffer[i] == '\0') {
      buffer[i] = ' ';
    }
    number_begins = (number_begins || buffer[i] != ' ');
    number_ends = (number_ends || (number_begins && buffer[i] == ' '));
    problem = (problem || (buffer[i] != ' ' && number_ends));
  }

  // Check each character
  bool e_found = false;
  bool dot_found = false;
  bool digit_found = false;
  int signs_found = 0;
  for (int i = 0; i < width; i++) {
    if (buffer[i] == 'E' || buffer[i] == 'e') {
      problem = (problem || e_found || digit_found == false);
      e_found = true;
    }
    else if (buffer[i] == '.') {
      problem = (problem || dot_found || e_found);
      dot_found = true;
    }
    else if (buffer[i] == '+' || buffer[i] == '-') {
      problem = (problem || (i > 0 && buffer[i - 1] != ' ' && buffer[i - 1] != 'e' &&
                             buffer[i - 1] != 'E'));
      signs_found++;
    }
    else if (buffer[i] >= '0' && buffer[i] <= '9') {
      digit_found = true;
    }
    else {
      problem = (problem || buffer[i] != ' ');
    }
  }
  problem = (problem || number_begins == false || digit_found == false);

  // Note any malformed numbers
  switch (cform) {
  case NumberFormat::SCIENTIFIC:
    problem = (problem || e_found == false || signs_found > 2);
    break;
  case NumberFormat::STANDARD_REAL:
    problem = (problem || signs_found > 1 || e_found);
    break;
  case NumberFormat::INTEGER:
  case NumberFormat::LONG_LONG_INTEGER:
    problem = (problem || signs_found > 1 || dot_found || e_found);
    break;
  }
  return (problem == false);
}

//-------------------------------------------------------------------------------------------------
char uppercase(const char tc) {
  return tc - (tc >= 97 && tc <= 122) * 32;
}

//-------------------------------------------------------------------------------------------------
std::string uppercase(const std::string &ts) {
  std::string result = ts;
  const size_t n_char = ts.size();
  for (size_t i = 0; i < n_char; i++) {
    result[i] = uppercase(ts[i]);
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
char lowercase(const char tc) {
  return tc + (tc >= 65 && tc <= 90) * 32;
}

//-------------------------------------------------------------------------------------------------
std::string lowercase(const std::string &ts) {
  std::string result = ts;
  const size_t n_char = ts.size();
  for (size_t i = 0; i < n_char; i++) {
    result[i] = lowercase(ts[i]);
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
bool strcmpCased(const char* sa, const char* sb, const CaseSensitivity csen) {
  int i = 0;
  switch (csen) {
  case CaseSensitivity::YES:
    while (sa[i] == sb[i]) {
      if (sa[i] == '\0') {
        return true;
      }
      i++;
    }
    return false;
  case CaseSensitivity::NO:
    while (uppercase(sa[i]) == uppercase(sb[i])) {
      if (sa[i] == '\0') {
        return true;
      }
      i++;
    }
    return false;
  case CaseSensitivity::AUTOMATIC:
    rtErr("No AUTOMATIC behavior is defined for case-based string comparison.  AUTOMATIC "
          "settings for case sensitivity are defined at higher levels for specific situations, "
          "not the low-level implementation.", "strcmpCased");
    break;
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
bool strcmpCased(const std::string &sa, const char* sb, const CaseSensitivity csen) {
  return strcmpCased(sa.c_str(), sb, csen);
}

//-------------------------------------------------------------------------------------------------
bool strcmpCased(const std::string &sa, const std::string &sb, const CaseSensitivity csen) {
  return strcmpCased(sa.c_str(), sb.c_str(), csen);
}

//-------------------------------------------------------------------------------------------------
std::string removeTailingWhiteSpace(const std::string &ts) {
  const size_t first = ts.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return std::string("");
  }
  const size_t last = ts.find_last_not_of(" \t");
  return ts.substr(first, last - first + 1);
}

//-------------------------------------------------------------------------------------------------
std::vector<std::string> separateText(const std::string &text, const std::vector<char> &delimiters,
                                      const std::vector<char> &keep) {
  std::vector<std::string> result;
  std::string word;
  bool word_open = false;
  const int n_char = text.size();
  int i = 0;
  while (i < n_char) {
    const char tc = text[i];
    if (tc == '\'' || tc == '"') {

      // Quoted text becomes a word of its own, even if it is empty or contains delimiters
      int j = i + 1;
      while (j < n_char && text[j] != tc) {
        j++;
      }
      if (j == n_char) {
        rtErr("Unterminated quotation in text \"" + text + "\".", "separateText");
      }
      if (word_open) {
        result.push_back(word);
        word.clear();
      }
      result.push_back(text.substr(i + 1, j - i - 1));
      word_open = false;
      i = j + 1;
      continue;
    }
    const bool is_space = (tc == ' ' || tc == '\t');
    const bool is_delimiter = (std::find(delimiters.begin(), delimiters.end(), tc) !=
                               delimiters.end());
    if (is_space || is_delimiter) {
      if (word_open) {
        result.push_back(word);
        word.clear();
        word_open = false;
      }
      if (is_delimiter && std::find(keep.begin(), keep.end(), tc) != keep.end()) {
        result.push_back(std::string(1, tc));
      }
    }
    else {
      word += tc;
      word_open = true;
    }
    i++;
  }
  if (word_open) {
    result.push_back(word);
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
std::string realToString(const double value, const int format_a, const int format_b,
                         const NumberFormat method, const NumberPrintStyle style) {

  // Check the overall format
  switch (method) {
  case NumberFormat::SCIENTIFIC:
    if (format_a != free_number_format && format_b != free_number_format &&
        format_b > format_a - 7) {
      rtErr("A real number of format %" + std::to_string(format_a) + "." +
            std::to_string(format_b) + "e has too many decimal places for its overall length.",
            "realToString");
    }
    break;
  case NumberFormat::STANDARD_REAL:
    if (format_a != free_number_format && format_b != free_number_format &&
        format_b > format_a - 2) {
      rtErr("A real number of format %" + std::to_string(format_a) + "." +
            std::to_string(format_b) + "f has too many decimal places for its overall length.",
            "realToString");
    }
    break;
  case NumberFormat::INTEGER:
  case NumberFormat::LONG_LONG_INTEGER:
    rtErr("The printing method for a real number must be either SCIENTIFIC or STANDARD_REAL.",
          "realToString");
  }
  if (format_b < 0 && format_b != free_number_format) {
    rtErr("A nonsensical number of decimal places (" + std::to_string(format_b) +
          ") was specified.", "realToString");
  }
  if (abs(format_a) >= 62 && format_a != free_number_format) {
    rtErr("The requested number exceeds format limits (maximum 64 characters, %" +
          std::to_string(format_a) + "." + std::to_string(format_b) + "f requested).",
          "realToString");
  }

  // Assemble the format string, then print the number
  const char conv = (method == NumberFormat::SCIENTIFIC) ? 'e' : 'f';
  const int decimals = (format_b == free_number_format) ? 6 : format_b;
  char buffer[64];
  if (format_a != free_number_format) {
    switch (style) {
    case NumberPrintStyle::STANDARD:
      snprintf(buffer, 64, (conv == 'e') ? "%*.*e" : "%*.*f", format_a, decimals, value);
      break;
    case NumberPrintStyle::LEADING_ZEROS:
      snprintf(buffer, 64, (conv == 'e') ? "%0*.*e" : "%0*.*f", format_a, decimals, value);
      break;
    }
  }
  else {
    snprintf(buffer, 64, (conv == 'e') ? "%.*e" : "%.*f", decimals, value);
  }
  return std::string(buffer);
}

//-------------------------------------------------------------------------------------------------
int readIntegerValue(const char* number_text, const int start_index, const int number_length) {
  if (verifyNumberFormat(number_text, NumberFormat::INTEGER, start_index,
                         number_length) == false) {
    rtErr("The text \"" + std::string(&number_text[start_index], number_length) + "\" does not "
          "form an integer.", "readIntegerValue");
  }
  const std::string buffer(&number_text[start_index], number_length);
  return strtol(buffer.c_str(), nullptr, 10);
}

//-------------------------------------------------------------------------------------------------
double readRealValue(const char* number_text, const int start_index, const int number_length) {
  if (verifyNumberFormat(number_text, NumberFormat::STANDARD_REAL, start_index,
                         number_length) == false &&
      verifyNumberFormat(number_text, NumberFormat::SCIENTIFIC, start_index,
                         number_length) == false) {
    rtErr("The text \"" + std::string(&number_text[start_index], number_length) + "\" does not "
          "form a real number.", "readRealValue");
  }
  const std::string buffer(&number_text[start_index], number_length);
  return strtod(buffer.c_str(), nullptr);
}

//-------------------------------------------------------------------------------------------------
std::vector<int> parseIndexList(const std::string &list, const int upper_limit) {
  std::vector<int> result;
  const std::vector<std::string> words = separateText(list, { ',' });
  for (size_t i = 0; i < words.size(); i++) {
    const std::string &wrd = words[i];
    const size_t dash_pos = wrd.find('-', 1);
    int llim, hlim;
    if (dash_pos == std::string::npos) {
      if (verifyNumberFormat(wrd.c_str(), NumberFormat::INTEGER) == false) {
        rtErr("Invalid index \"" + wrd + "\" in list \"" + list + "\".", "parseIndexList");
      }
      llim = strtol(wrd.c_str(), nullptr, 10);
      hlim = llim;
    }
    else {
      const std::string low_str = wrd.substr(0, dash_pos);
      const std::string high_str = wrd.substr(dash_pos + 1);
      if (verifyNumberFormat(low_str.c_str(), NumberFormat::INTEGER) == false ||
          verifyNumberFormat(high_str.c_str(), NumberFormat::INTEGER) == false) {
        rtErr("Invalid index range \"" + wrd + "\" in list \"" + list + "\".", "parseIndexList");
      }
      llim = strtol(low_str.c_str(), nullptr, 10);
      hlim = strtol(high_str.c_str(), nullptr, 10);
      if (hlim < llim) {
        rtErr("The index range \"" + wrd + "\" runs backwards.", "parseIndexList");
      }
    }
    if (llim < 0 || (upper_limit >= 0 && hlim >= upper_limit)) {
      rtErr(errors::ErrorKind::OUT_OF_RANGE, "Index range " + std::to_string(llim) + " - " +
            std::to_string(hlim) + " is outside the admissible range [0, " +
            std::to_string(upper_limit) + ").", "parseIndexList");
    }
    for (int j = llim; j <= hlim; j++) {
      result.push_back(j);
    }
  }
  std::sort(result.begin(), result.end());
  result.erase(std::unique(result.begin(), result.end()), result.end());
  return result;
}

} // namespace parse
} // namespace mdscan
