#include <vector>
#include "copyright.h"
#include "Parsing/parse.h"
#include "Reporting/error_format.h"
#include "input.h"

namespace mdscan {
namespace namelist {

using parse::separateText;
using parse::strcmpCased;

//-------------------------------------------------------------------------------------------------
std::string stripComment(const std::string &line) {
  char quote = '\0';
  const size_t n_char = line.size();
  for (size_t i = 0; i < n_char; i++) {
    const char tc = line[i];
    if (quote != '\0') {
      if (tc == quote) {
        quote = '\0';
      }
    }
    else if (tc == '\'' || tc == '"') {
      quote = tc;
    }
    else if (tc == '!' || tc == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

//-------------------------------------------------------------------------------------------------
int readNamelist(const TextFile &tf, NamelistEmulator *nml, const int start_line,
                 const WrapTextSearch wrap, const int end_line, bool *found) {
  const int nline = tf.getLineCount();
  const int search_end = (end_line < 0 || end_line > nline) ? nline : end_line;
  const std::string opening = "&" + nml->getTitle();

  // Find the line on which the namelist opens
  const auto opensNamelist = [&tf, &opening](const int line_idx) {
    const std::vector<std::string> words = separateText(stripComment(tf.getLineAsString(line_idx)),
                                                        { ',' });
    return (words.size() > 0 && strcmpCased(words[0], opening, CaseSensitivity::NO));
  };
  int open_line = -1;
  for (int i = start_line; i < search_end; i++) {
    if (opensNamelist(i)) {
      open_line = i;
      break;
    }
  }
  if (open_line < 0 && wrap == WrapTextSearch::YES) {
    for (int i = 0; i < start_line && i < nline; i++) {
      if (opensNamelist(i)) {
        open_line = i;
        break;
      }
    }
  }
  if (found != nullptr) {
    *found = (open_line >= 0);
  }
  if (open_line < 0) {
    return start_line;
  }

  // Gather words until the namelist closes
  std::vector<std::string> words;
  int close_line = -1;
  for (int i = open_line; i < nline; i++) {
    std::vector<std::string> line_words = separateText(stripComment(tf.getLineAsString(i)),
                                                       { ',', '=' }, { '=' });
    const size_t first_word = (i == open_line) ? 1 : 0;
    for (size_t j = first_word; j < line_words.size(); j++) {
      if (strcmpCased(line_words[j], "&end", CaseSensitivity::NO) || line_words[j] == "/") {
        close_line = i;
        break;
      }
      words.push_back(line_words[j]);
    }
    if (close_line >= 0) {
      break;
    }
  }
  if (close_line < 0) {
    rtErr("Namelist " + opening + " beginning on line " + std::to_string(open_line + 1) +
          " of " + tf.getFileName() + " is not terminated by &end or /.", "readNamelist");
  }

  // Assign values.  Each keyword takes all values up to the next keyword, which is any word
  // followed by an equal sign or the name of a boolean switch.
  const int nword = words.size();
  const auto startsKeyword = [&words, nword, nml](const int word_idx) {
    if (word_idx + 1 < nword && words[word_idx + 1] == "=") {
      return true;
    }
    return (nml->hasKeyword(words[word_idx]) &&
            nml->getKeywordKind(words[word_idx]) == NamelistType::BOOLEAN);
  };
  int i = 0;
  while (i < nword) {
    const std::string &key = words[i];
    if (i + 1 < nword && words[i + 1] == "=") {
      int j = i + 2;
      int nval = 0;
      while (j < nword && startsKeyword(j) == false) {
        nml->assignElement(key, words[j]);
        nval++;
        j++;
      }
      if (nval == 0) {
        if (nml->hasKeyword(key) && nml->getKeywordKind(key) == NamelistType::BOOLEAN) {
          nml->activateBool(key);
        }
        else {
          nml->assignElement(key, std::string(""));
        }
      }
      i = j;
    }
    else {
      nml->activateBool(key);
      i++;
    }
  }
  return close_line + 1;
}

} // namespace namelist
} // namespace mdscan
