// -*-c++-*-
#ifndef MDSCAN_TEXTFILE_H
#define MDSCAN_TEXTFILE_H

#include <string>
#include <vector>
#include "copyright.h"

namespace mdscan {
namespace parse {

/// \brief Many searches in TextFile objects will begin at a particular line.  If the query is not
///        found, it may be necessary to wrap the search back to the beginning and continue until
///        the original starting line.  This will indicate whether to do that.
enum class WrapTextSearch {
  NO, YES
};

/// \brief Differentiate between text data originating on a disk and in RAM
enum class TextOrigin {
  DISK, RAM
};

/// \brief Abstract for read-only access to a TextFile.  Structure files, namelist input decks,
///        and ASCII trajectories are all scanned through this view.
struct TextFileReader {

  /// \brief The constructor takes the TextFile's member variables verbatim.
  TextFileReader(int line_count_in, const int* line_limits_in, const char* text_in,
                 const std::string &file_name_in);

  const int line_count;         ///< Number of lines in the file
  const int* line_limits;       ///< Limits of each line's text within the character array
  const char* text;             ///< The text, sans carriage returns
  const std::string file_name;  ///< Name of the file that was read (blank if from RAM)
};

/// \brief Structure for translating a text file into a compact, rapidly parsable vector of
///        characters in CPU RAM.
class TextFile {
public:

  /// \brief Constructor for taking an ascii file or a very long, formatted string and transforming
  ///        it into a std::vector of characters with line limits recorded.
  ///
  /// Overloaded:
  ///   - Construct an empty object after taking no arguments
  ///   - Construct a complete object from a named file (throws an OpenError if the file does not
  ///     exist)
  ///   - Construct a complete object from a string in memory
  ///
  /// \param file_name   Name of the input file
  /// \param source      Origin of the text--disk or RAM
  /// \param content     Content for the TextFile, when the origin is RAM
  /// \param caller      (Optional) name of the calling function
  /// \{
  TextFile();
  TextFile(const std::string &file_name, TextOrigin source = TextOrigin::DISK,
           const std::string &content = std::string(""),
           const std::string &caller = std::string(""));
  /// \}

  /// \brief Get the name of the original file.
  std::string getFileName() const;

  /// \brief Get the line count of a text file after converting it to a character vector in memory.
  int getLineCount() const;

  /// \brief Get the length of one line, in characters.
  ///
  /// \param line_number  Index of the line of interest
  int getLineLength(int line_number) const;

  /// \brief Get an abstract of a text file's CPU-RAM representation, for ease of use.
  const TextFileReader data() const;

  /// \brief Extract a string based on a line number, starting position, and length.
  ///
  /// \param line_number    The line containing the text of interest
  /// \param start_pos      Starting position on the line (default 0)
  /// \param string_length  Length of the string to extract (-1 continues to the end of the line)
  std::string extractString(int line_number, int start_pos = 0, int string_length = -1) const;

  /// \brief Extract a whole line as a string.
  ///
  /// \param line_number  The line of interest
  std::string getLineAsString(int line_number) const;

private:

  /// Name of the file that was read
  std::string orig_file;

  /// The number of lines detected in the file
  int line_count;

  /// Limits for each line's text in the concatenated character array
  std::vector<int> line_limits;

  /// The text, sans carriage returns (see line limits to determine their locations)
  std::vector<char> text;

  /// \brief Set the name of the corresponding file based on the characteristics of several
  ///        constructor input variables.
  ///
  /// \param file_name   Name of the input file (if the source is DISK--otherwise if the source
  ///                    is RAM and the content is blank, then this is assumed to be content and
  ///                    a blank corresponding file name is returned)
  /// \param source      Origin of the text--disk or RAM
  /// \param content     Content for the TextFile, when the origin is RAM
  std::string setFileName(const std::string &file_name, TextOrigin source,
                          const std::string &content);

  /// \brief Break a large, formatted string into separate lines based on carriage returns.
  ///
  /// \param text_in  The text to parse
  void linesFromString(const std::string &text_in);

  /// \brief Check that a requested stretch of text lies within a given line, and return the
  ///        number of characters that may be extracted.
  ///
  /// \param line_number    The line containing the text of interest
  /// \param start_pos      Starting position on the line
  /// \param string_length  Length of the requested string (-1 to take the rest of the line)
  int checkAvailableLength(int line_number, int start_pos, int string_length) const;
};

} // namespace parse
} // namespace mdscan

#endif
