// -*-c++-*-
#ifndef MDSCAN_ERROR_FORMAT_H
#define MDSCAN_ERROR_FORMAT_H

#include <stdexcept>
#include <string>
#include "copyright.h"

namespace mdscan {
namespace errors {

/// \brief The default width of formatted messages when the console width cannot be determined
constexpr int default_terminal_width = 98;

/// \brief Enumerate the different kinds of runtime messages, to determine their headers and
///        indentation.
enum class RTMessageKind {
  ERROR,   ///< The message describes a fatal condition and will be thrown as an exception
  WARNING, ///< The message describes a recoverable condition and will be printed to stderr
  ALERT,   ///< The message is informational and will be printed to stdout
  TABULAR  ///< The message is part of a table or help listing and gets no header
};

/// \brief Classify the errors that trajectory iteration and structural superposition can raise.
///        Each kind other than GENERAL is thrown as its own exception class so that callers may
///        catch, for example, the end of a frame selection without catching everything else.
enum class ErrorKind {
  GENERAL,            ///< Any error not listed below, thrown as a plain std::runtime_error
  OPEN_ERROR,         ///< A trajectory or structure file could not be opened or reopened
  END_OF_DATA,        ///< A trajectory backend was asked to read past its last frame
  END_OF_SELECTION,   ///< A frame iterator was advanced past the final frame of its selection
  NO_FRAME_READ,      ///< The current frame was requested before any frame had been read
  OUT_OF_RANGE,       ///< A frame or atom index lies outside of the admissible range
  DIMENSION_MISMATCH  ///< Point sets, weights, or topologies differ in length or dimensionality
};

/// \brief Exception classes thrown by rtErr() for each ErrorKind.  All derive from
///        std::runtime_error, so a single catch of the base type remains possible.
/// \{
class OpenError : public std::runtime_error {
public:
  explicit OpenError(const std::string &message);
};

class EndOfData : public std::runtime_error {
public:
  explicit EndOfData(const std::string &message);
};

class EndOfSelection : public std::runtime_error {
public:
  explicit EndOfSelection(const std::string &message);
};

class NoFrameRead : public std::runtime_error {
public:
  explicit NoFrameRead(const std::string &message);
};

class OutOfRange : public std::runtime_error {
public:
  explicit OutOfRange(const std::string &message);
};

class DimensionMismatch : public std::runtime_error {
public:
  explicit DimensionMismatch(const std::string &message);
};
/// \}

/// \brief Get a human-readable name for an error kind.
///
/// \param kind  The error kind of interest
std::string getEnumerationName(ErrorKind kind);

/// \brief Format a message for display on the terminal or in a file, wrapping words at the
///        requested width and prepending the calling class and method, if given.
///
/// \param message          The message to format
/// \param class_caller     Name of the calling class (may be nullptr or blank)
/// \param method_caller    Name of the calling function or member function (may be nullptr)
/// \param implicit_indent  Number of characters already printed on the first line by the caller
/// \param first_indent     Indentation of the first line
/// \param ext_indent       Indentation of all subsequent lines
/// \param width            Total width of the formatted text (0 detects the terminal width)
/// \param style            The kind of message, which determines its header
std::string terminalFormat(const std::string &message, const char* class_caller = nullptr,
                           const char* method_caller = nullptr, int implicit_indent = 0,
                           int first_indent = 0, int ext_indent = 0, int width = 0,
                           RTMessageKind style = RTMessageKind::ERROR);

/// \brief Throw a runtime error with a formatted message.
///
/// Overloaded:
///   - Throw a plain std::runtime_error
///   - Throw the exception class corresponding to a particular kind of error
///
/// \param message        The error message
/// \param kind           Kind of the error, determining the exception class
/// \param class_caller   Name of the calling class (optional)
/// \param method_caller  Name of the calling function or member function (optional)
/// \{
void rtErr(const std::string &message, const char* class_caller = nullptr,
           const char* method_caller = nullptr);

void rtErr(ErrorKind kind, const std::string &message, const char* class_caller = nullptr,
           const char* method_caller = nullptr);
/// \}

/// \brief Print a warning to stderr with a formatted message.  Execution continues.
///
/// \param message        The warning message
/// \param class_caller   Name of the calling class (optional)
/// \param method_caller  Name of the calling function or member function (optional)
void rtWarn(const std::string &message, const char* class_caller = nullptr,
            const char* method_caller = nullptr);

/// \brief Print an alert to stdout with a formatted message.  Execution continues.
///
/// \param message        The alert message
/// \param class_caller   Name of the calling class (optional)
/// \param method_caller  Name of the calling function or member function (optional)
void rtAlert(const std::string &message, const char* class_caller = nullptr,
             const char* method_caller = nullptr);

} // namespace errors
} // namespace mdscan

namespace mdscan {
using errors::rtAlert;
using errors::rtErr;
using errors::rtWarn;
} // namespace mdscan

#endif
