#include <sys/ioctl.h>
#include <unistd.h>
#include "copyright.h"
#include "display.h"
#include "error_format.h"

namespace mdscan {
namespace display {

using errors::default_terminal_width;
using errors::RTMessageKind;
using errors::terminalFormat;

//-------------------------------------------------------------------------------------------------
void terminalHorizontalRule(const std::string &left_corner, const std::string &right_corner,
                            const int width, std::ostream *foutp) {

  // Obtain the console size
  int n_dash = width;
  if (n_dash == 0) {
    struct winsize console_dims;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &console_dims) == 0 && console_dims.ws_col > 2) {
      n_dash = console_dims.ws_col - 1;
    }
    else {
      n_dash = default_terminal_width;
    }
  }
  n_dash -= left_corner.size() + right_corner.size();
  std::string hrule((n_dash > 0) ? n_dash : 0, '-');
  hrule = left_corner + hrule + right_corner + "\n";
  foutp->write(hrule.c_str(), hrule.size());
}

//-------------------------------------------------------------------------------------------------
void mdscanSplash(const std::string &program_name, std::ostream *foutp) {
  terminalHorizontalRule("+", "+", default_terminal_width, foutp);
  std::string buffer = program_name + ": trajectory iteration, optimal superposition, and "
                       "positional RMSD analysis for molecular dynamics.  Distributed under the "
                       "MIT license.";
  buffer = terminalFormat(buffer, nullptr, nullptr, 0, 0, 0, default_terminal_width,
                          RTMessageKind::TABULAR);
  buffer += "\n";
  foutp->write(buffer.c_str(), buffer.size());
  terminalHorizontalRule("+", "+", default_terminal_width, foutp);
}

} // namespace display
} // namespace mdscan
