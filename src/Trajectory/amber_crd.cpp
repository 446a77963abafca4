#include <algorithm>
#include <cstdio>
#include "copyright.h"
#include "Constants/scaling.h"
#include "Constants/symbol_values.h"
#include "Parsing/parse.h"
#include "Reporting/error_format.h"
#include "amber_crd.h"

namespace mdscan {
namespace trajectory {

using constants::crd_field_width;
using constants::crd_values_per_line;
using diskutil::openOutputFile;
using errors::ErrorKind;
using parse::readRealValue;
using symbols::half_pi;

//-------------------------------------------------------------------------------------------------
AmberCrdTrajectory::AmberCrdTrajectory(const std::string &file_name_in,
                                       const int atom_count_in) :
    TrajectoryBackend(file_name_in, CoordinateFileKind::AMBER_CRD),
    finp{}, title{}, lines_per_frame{0}, line_counter{0}
{
  if (atom_count_in <= 0) {
    rtErr(ErrorKind::OPEN_ERROR, "A positive number of atoms (" + std::to_string(atom_count_in) +
          " given) must be known in order to read .crd trajectory " + file_name + ".",
          "AmberCrdTrajectory");
  }
  atom_count = atom_count_in;
  lines_per_frame = ((3 * atom_count) + crd_values_per_line - 1) / crd_values_per_line;
  scanFile();
  openFile();
}

//-------------------------------------------------------------------------------------------------
AmberCrdTrajectory::~AmberCrdTrajectory() {
  close();
}

//-------------------------------------------------------------------------------------------------
const std::string& AmberCrdTrajectory::getTitle() const {
  return title;
}

//-------------------------------------------------------------------------------------------------
bool AmberCrdTrajectory::isOpen() const {
  return finp.is_open();
}

//-------------------------------------------------------------------------------------------------
void AmberCrdTrajectory::close() {
  if (finp.is_open()) {
    finp.close();
  }
  frames_read = 0;
}

//-------------------------------------------------------------------------------------------------
void AmberCrdTrajectory::reopen() {
  close();
  openFile();
}

//-------------------------------------------------------------------------------------------------
void AmberCrdTrajectory::openFile() {
  finp.clear();
  finp.open(file_name.c_str());
  if (finp.is_open() == false) {
    rtErr(ErrorKind::OPEN_ERROR, "Trajectory file " + file_name + " could not be opened.",
          "AmberCrdTrajectory", "openFile");
  }
  std::getline(finp, title);
  line_counter = 1;
  frames_read = 0;
}

//-------------------------------------------------------------------------------------------------
void AmberCrdTrajectory::scanFile() {
  std::ifstream fscan;
  fscan.open(file_name.c_str());
  if (fscan.is_open() == false) {
    rtErr(ErrorKind::OPEN_ERROR, "Trajectory file " + file_name + " could not be opened.",
          "AmberCrdTrajectory", "scanFile");
  }

  // Count the lines with data, ignoring blank lines at the end of the file.  Note the length of
  // the first line after the first frame's coordinates.
  std::string line;
  std::getline(fscan, title);
  int data_lines = 0;
  int trailing_blanks = 0;
  int box_line_length = -1;
  while (std::getline(fscan, line)) {
    const size_t content = line.find_last_not_of(" \r");
    if (content == std::string::npos) {
      trailing_blanks++;
      continue;
    }
    data_lines += trailing_blanks + 1;
    trailing_blanks = 0;
    if (data_lines == lines_per_frame + 1) {
      box_line_length = static_cast<int>(content) + 1;
    }
  }
  fscan.close();

  // A box line holds at most three fields.  A file with a box has a line count divisible by
  // one more than the number of coordinate lines per frame.  When each frame fits on a single
  // line of three values (one atom), the two layouts cannot be told apart and the file is taken
  // to have no box.
  const int box_field_limit = 3 * crd_field_width;
  const bool ambiguous = (3 * atom_count <= 3);
  if (ambiguous == false && box_line_length > 0 && box_line_length <= box_field_limit &&
      data_lines % (lines_per_frame + 1) == 0) {
    unit_cell = UnitCellType::ORTHORHOMBIC;
    frame_count = data_lines / (lines_per_frame + 1);
  }
  else if (data_lines % lines_per_frame == 0) {
    unit_cell = UnitCellType::NONE;
    frame_count = data_lines / lines_per_frame;
  }
  else {
    rtErr(ErrorKind::OPEN_ERROR, "Trajectory file " + file_name + " has " +
          std::to_string(data_lines) + " lines of data, which is not consistent with frames of " +
          std::to_string(atom_count) + " atoms (" + std::to_string(lines_per_frame) + " lines "
          "per frame, with or without a box).", "AmberCrdTrajectory", "scanFile");
  }
}

//-------------------------------------------------------------------------------------------------
void AmberCrdTrajectory::readFrameData(CoordinateFrameWriter *cfw) {
  const int nval = 3 * atom_count;
  int ival = 0;
  std::string line;
  for (int i = 0; i < lines_per_frame; i++) {
    if (std::getline(finp, line).fail()) {
      rtErr(ErrorKind::END_OF_DATA, "Trajectory file " + file_name + " ended unexpectedly at "
            "line " + std::to_string(line_counter + 1) + ".", "AmberCrdTrajectory",
            "readFrameData");
    }
    line_counter++;
    const int nfield = std::min(crd_values_per_line, nval - ival);
    if (static_cast<int>(line.size()) < nfield * crd_field_width) {
      rtErr("Line " + std::to_string(line_counter) + " of trajectory file " + file_name +
            " is too short to hold " + std::to_string(nfield) + " coordinates.",
            "AmberCrdTrajectory", "readFrameData");
    }
    for (int j = 0; j < nfield; j++) {
      const double value = readRealValue(line.c_str(), j * crd_field_width, crd_field_width);
      const int atom_idx = ival / 3;
      switch (ival - (3 * atom_idx)) {
      case 0:
        cfw->xcrd[atom_idx] = value;
        break;
      case 1:
        cfw->ycrd[atom_idx] = value;
        break;
      case 2:
        cfw->zcrd[atom_idx] = value;
        break;
      }
      ival++;
    }
  }
  switch (unit_cell) {
  case UnitCellType::NONE:
    setFrameBox(cfw);
    break;
  case UnitCellType::ORTHORHOMBIC:
  case UnitCellType::TRICLINIC:
    if (std::getline(finp, line).fail() ||
        static_cast<int>(line.size()) < 3 * crd_field_width) {
      rtErr("Box dimensions are missing after frame " + std::to_string(frames_read + 1) +
            " of trajectory file " + file_name + ".", "AmberCrdTrajectory", "readFrameData");
    }
    line_counter++;
    setFrameBox(cfw, readRealValue(line.c_str(), 0, crd_field_width),
                readRealValue(line.c_str(), crd_field_width, crd_field_width),
                readRealValue(line.c_str(), 2 * crd_field_width, crd_field_width), half_pi,
                half_pi, half_pi);
    break;
  }
}

//-------------------------------------------------------------------------------------------------
void writeAmberCrdTrajectory(const std::string &file_name,
                             const std::vector<CoordinateFrame> &frames, const std::string &title,
                             const PrintSituation expectation) {
  std::ofstream foutp = openOutputFile(file_name, expectation, "write an Amber .crd trajectory",
                                       getTrajectoryFormat(CoordinateFileKind::AMBER_CRD));
  foutp << title << "\n";
  const int nframe = frames.size();
  const int natom = (nframe > 0) ? frames[0].getAtomCount() : 0;
  char buffer[16];
  for (int i = 0; i < nframe; i++) {
    const CoordinateFrameReader cfr = frames[i].data();
    if (cfr.natom != natom) {
      rtErr(ErrorKind::DIMENSION_MISMATCH, "Frame " + std::to_string(i + 1) + " has " +
            std::to_string(cfr.natom) + " atoms, but the trajectory has " +
            std::to_string(natom) + ".", "writeAmberCrdTrajectory");
    }
    const int nval = 3 * natom;
    for (int j = 0; j < nval; j++) {
      const int atom_idx = j / 3;
      const int dim = j - (3 * atom_idx);
      const double value = (dim == 0) ? cfr.xcrd[atom_idx] :
                           (dim == 1) ? cfr.ycrd[atom_idx] : cfr.zcrd[atom_idx];
      snprintf(buffer, 16, "%8.3f", value);
      foutp << buffer;
      if ((j + 1) % crd_values_per_line == 0 || j == nval - 1) {
        foutp << "\n";
      }
    }
    if (cfr.unit_cell != UnitCellType::NONE) {
      for (int j = 0; j < 3; j++) {
        snprintf(buffer, 16, "%8.3f", cfr.boxdim[j]);
        foutp << buffer;
      }
      foutp << "\n";
    }
  }
  foutp.close();
}

} // namespace trajectory
} // namespace mdscan
