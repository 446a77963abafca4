#include <fstream>
#include "copyright.h"
#include "Reporting/error_format.h"
#include "textfile.h"

namespace mdscan {
namespace parse {

using errors::ErrorKind;

//-------------------------------------------------------------------------------------------------
TextFileReader::TextFileReader(const int line_count_in, const int* line_limits_in,
                               const char* text_in, const std::string &file_name_in) :
  line_count{line_count_in}, line_limits{line_limits_in}, text{text_in}, file_name{file_name_in}
{}

//-------------------------------------------------------------------------------------------------
TextFile::TextFile() :
    orig_file{std::string("")},
    line_count{0},
    line_limits{std::vector<int>(1, 0)},
    text{std::vector<char>()}
{}

//-------------------------------------------------------------------------------------------------
TextFile::TextFile(const std::string &file_name, const TextOrigin source,
                   const std::string &content, const std::string &caller) :
  orig_file{setFileName(file_name, source, content)},
  line_count{0},
  line_limits{std::vector<int>(1, 0)},
  text{}
{
  switch (source) {
  case TextOrigin::DISK:
    {
      std::ifstream finp;
      finp.open(file_name.c_str());
      if (finp.is_open() == false) {
        if (caller.size() == 0) {
          rtErr(ErrorKind::OPEN_ERROR, file_name + " was not found.", "TextFile");
        }
        else {
          rtErr(ErrorKind::OPEN_ERROR, file_name + " was not found when called from " + caller +
                ".", "TextFile");
        }
      }
      std::string line;
      int total_chars = 0;
      while (std::getline(finp, line)) {

        // Files written on other systems may carry a carriage return before each line feed
        int line_length = line.size();
        if (line_length > 0 && line[line_length - 1] == '\r') {
          line_length--;
        }
        text.insert(text.end(), line.begin(), line.begin() + line_length);
        total_chars += line_length;
        line_limits.push_back(total_chars);
        line_count++;
      }
      finp.close();
    }
    break;
  case TextOrigin::RAM:
    if (content.size() > 0) {
      linesFromString(content);
    }
    else {
      linesFromString(file_name);
    }
    break;
  }
}

//-------------------------------------------------------------------------------------------------
std::string TextFile::getFileName() const {
  return orig_file;
}

//-------------------------------------------------------------------------------------------------
int TextFile::getLineCount() const {
  return line_count;
}

//-------------------------------------------------------------------------------------------------
int TextFile::getLineLength(const int line_number) const {
  if (line_number < 0 || line_number >= line_count) {
    rtErr(ErrorKind::OUT_OF_RANGE, "Line " + std::to_string(line_number) + " is not valid in a "
          "text file of " + std::to_string(line_count) + " lines.", "TextFile", "getLineLength");
  }
  return line_limits[line_number + 1] - line_limits[line_number];
}

//-------------------------------------------------------------------------------------------------
const TextFileReader TextFile::data() const {
  return TextFileReader(line_count, line_limits.data(), text.data(), orig_file);
}

//-------------------------------------------------------------------------------------------------
std::string TextFile::extractString(const int line_number, const int start_pos,
                                    const int string_length) const {
  const int actual_length = checkAvailableLength(line_number, start_pos, string_length);
  if (actual_length == 0) {
    return std::string("");
  }
  const char* text_ptr = &text[line_limits[line_number] + start_pos];
  return std::string(text_ptr, actual_length);
}

//-------------------------------------------------------------------------------------------------
std::string TextFile::getLineAsString(const int line_number) const {
  return extractString(line_number, 0, -1);
}

//-------------------------------------------------------------------------------------------------
std::string TextFile::setFileName(const std::string &file_name, const TextOrigin source,
                                  const std::string &content) {
  switch (source) {
  case TextOrigin::DISK:
    return file_name;
  case TextOrigin::RAM:
    return (content.size() > 0) ? file_name : std::string("");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
void TextFile::linesFromString(const std::string &text_in) {
  const int n_char = text_in.size();
  if (n_char == 0) {
    line_count = 0;
    line_limits.resize(1, 0);
    text.resize(0);
    return;
  }
  int n_br = 0;
  for (int i = 0; i < n_char; i++) {
    n_br += (text_in[i] == '\n');
  }
  line_count = n_br + (text_in[n_char - 1] != '\n');
  line_limits.resize(line_count + 1);
  line_limits[0] = 0;
  text.resize(n_char - n_br);
  int n_tx = 0;
  n_br = 0;
  for (int i = 0; i < n_char; i++) {
    if (text_in[i] == '\n') {
      n_br++;
      line_limits[n_br] = n_tx;
    }
    else {
      text[n_tx] = text_in[i];
      n_tx++;
    }
  }

  // Ensure that the final line limit is catalogged
  line_limits[line_count] = n_tx;
}

//-------------------------------------------------------------------------------------------------
int TextFile::checkAvailableLength(const int line_number, const int start_pos,
                                   const int string_length) const {
  if (line_number >= line_count || line_number < 0) {
    rtErr(ErrorKind::OUT_OF_RANGE, "The text file originating in " + orig_file + " has " +
          std::to_string(line_count) + " lines and cannot return text from line " +
          std::to_string(line_number) + ".", "TextFile", "checkAvailableLength");
  }
  const int available_chars = line_limits[line_number + 1] - line_limits[line_number];
  if (start_pos < 0 || start_pos > available_chars ||
      (string_length >= 0 && start_pos + string_length > available_chars)) {
    rtErr(ErrorKind::OUT_OF_RANGE, "Line " + std::to_string(line_number) + " of text file " +
          orig_file + " has " + std::to_string(available_chars) + " characters (requested "
          "starting position " + std::to_string(start_pos) + ", length " +
          std::to_string(string_length) + ").", "TextFile", "checkAvailableLength");
  }
  return ((string_length < 0) ? available_chars - start_pos : string_length);
}

} // namespace parse
} // namespace mdscan
