#include <cstdio>
#include <iostream>
#include <sys/ioctl.h>
#include <unistd.h>
#include "copyright.h"
#include "error_format.h"

namespace mdscan {
namespace errors {

//-------------------------------------------------------------------------------------------------
OpenError::OpenError(const std::string &message) : std::runtime_error(message) {}

//-------------------------------------------------------------------------------------------------
EndOfData::EndOfData(const std::string &message) : std::runtime_error(message) {}

//-------------------------------------------------------------------------------------------------
EndOfSelection::EndOfSelection(const std::string &message) : std::runtime_error(message) {}

//-------------------------------------------------------------------------------------------------
NoFrameRead::NoFrameRead(const std::string &message) : std::runtime_error(message) {}

//-------------------------------------------------------------------------------------------------
OutOfRange::OutOfRange(const std::string &message) : std::runtime_error(message) {}

//-------------------------------------------------------------------------------------------------
DimensionMismatch::DimensionMismatch(const std::string &message) : std::runtime_error(message) {}

//-------------------------------------------------------------------------------------------------
std::string getEnumerationName(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::GENERAL:
    return std::string("GENERAL");
  case ErrorKind::OPEN_ERROR:
    return std::string("OPEN_ERROR");
  case ErrorKind::END_OF_DATA:
    return std::string("END_OF_DATA");
  case ErrorKind::END_OF_SELECTION:
    return std::string("END_OF_SELECTION");
  case ErrorKind::NO_FRAME_READ:
    return std::string("NO_FRAME_READ");
  case ErrorKind::OUT_OF_RANGE:
    return std::string("OUT_OF_RANGE");
  case ErrorKind::DIMENSION_MISMATCH:
    return std::string("DIMENSION_MISMATCH");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
std::string terminalFormat(const std::string &message, const char* class_caller,
                           const char* method_caller, const int implicit_indent,
                           const int first_indent, const int ext_indent, const int width,
                           const RTMessageKind style) {

  // Obtain the console size, if no width was specified
  int msg_width = width;
  if (msg_width <= 0) {
    struct winsize console_dims;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &console_dims) == 0 && console_dims.ws_col > 2) {
      msg_width = console_dims.ws_col - 1;
    }
    else {
      msg_width = default_terminal_width;
    }
  }

  // Compose the header
  std::string header;
  switch (style) {
  case RTMessageKind::ERROR:
    header = "Error: ";
    break;
  case RTMessageKind::WARNING:
    header = "Warning: ";
    break;
  case RTMessageKind::ALERT:
  case RTMessageKind::TABULAR:
    break;
  }
  const bool has_class = (class_caller != nullptr && class_caller[0] != '\0');
  const bool has_method = (method_caller != nullptr && method_caller[0] != '\0');
  if (has_class && has_method) {
    header += std::string(class_caller) + "::" + std::string(method_caller) + "(): ";
  }
  else if (has_class) {
    header += std::string(class_caller) + ": ";
  }
  else if (has_method) {
    header += std::string(method_caller) + "(): ";
  }

  // Wrap words at the line width.  Explicit carriage returns in the message are honored.
  const std::string full_msg = header + message;
  std::string result(first_indent, ' ');
  int line_pos = implicit_indent + first_indent;
  size_t i = 0;
  const size_t nchar = full_msg.size();
  while (i < nchar) {
    if (full_msg[i] == '\n') {
      result += "\n" + std::string(ext_indent, ' ');
      line_pos = ext_indent;
      i++;
      continue;
    }
    size_t j = i;
    while (j < nchar && full_msg[j] != ' ' && full_msg[j] != '\n') {
      j++;
    }
    const int word_length = static_cast<int>(j - i);
    if (line_pos + word_length > msg_width && line_pos > ext_indent) {
      result += "\n" + std::string(ext_indent, ' ');
      line_pos = ext_indent;
    }
    result += full_msg.substr(i, word_length);
    line_pos += word_length;
    while (j < nchar && full_msg[j] == ' ') {
      if (line_pos < msg_width) {
        result += ' ';
        line_pos++;
      }
      j++;
    }
    i = j;
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
void rtErr(const std::string &message, const char* class_caller, const char* method_caller) {
  rtErr(ErrorKind::GENERAL, message, class_caller, method_caller);
}

//-------------------------------------------------------------------------------------------------
void rtErr(const ErrorKind kind, const std::string &message, const char* class_caller,
           const char* method_caller) {
  const std::string formatted = terminalFormat(message, class_caller, method_caller, 0, 0, 7, 0,
                                               RTMessageKind::ERROR);
  switch (kind) {
  case ErrorKind::GENERAL:
    throw std::runtime_error(formatted);
  case ErrorKind::OPEN_ERROR:
    throw OpenError(formatted);
  case ErrorKind::END_OF_DATA:
    throw EndOfData(formatted);
  case ErrorKind::END_OF_SELECTION:
    throw EndOfSelection(formatted);
  case ErrorKind::NO_FRAME_READ:
    throw NoFrameRead(formatted);
  case ErrorKind::OUT_OF_RANGE:
    throw OutOfRange(formatted);
  case ErrorKind::DIMENSION_MISMATCH:
    throw DimensionMismatch(formatted);
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
void rtWarn(const std::string &message, const char* class_caller, const char* method_caller) {
  const std::string formatted = terminalFormat(message, class_caller, method_caller, 0, 0, 9, 0,
                                               RTMessageKind::WARNING);
  std::cerr << formatted << std::endl;
}

//-------------------------------------------------------------------------------------------------
void rtAlert(const std::string &message, const char* class_caller, const char* method_caller) {
  const std::string formatted = terminalFormat(message, class_caller, method_caller, 0, 0, 0, 0,
                                               RTMessageKind::ALERT);
  printf("%s\n", formatted.c_str());
}

} // namespace errors
} // namespace mdscan
