// -*-c++-*-
#ifndef MDSCAN_AMBER_CRD_H
#define MDSCAN_AMBER_CRD_H

#include <fstream>
#include <string>
#include <vector>
#include "copyright.h"
#include "FileManagement/file_util.h"
#include "coordinateframe.h"
#include "trajectory_backend.h"

namespace mdscan {
namespace trajectory {

using diskutil::PrintSituation;

/// \brief Read an Amber ASCII .crd trajectory.  The file has a title line, then for each frame
///        the 3N coordinates in lines of ten 8-character fields, optionally followed by a line
///        with three box lengths.  The file does not state its atom count, which must come from
///        the topology.  The number of frames and the presence of a box are determined by a scan
///        of the whole file when it is opened.
class AmberCrdTrajectory : public TrajectoryBackend {
public:

  /// \brief The constructor opens the file and scans it.  An OpenError is raised if the file
  ///        cannot be read, or if its line count is not consistent with the stated number of
  ///        atoms.
  ///
  /// \param file_name_in   Name of the trajectory file
  /// \param atom_count_in  The number of atoms in each frame
  AmberCrdTrajectory(const std::string &file_name_in, int atom_count_in);

  /// \brief The destructor closes the file.
  ~AmberCrdTrajectory() override;

  /// \brief Get the title line of the trajectory.
  const std::string& getTitle() const;

  bool isOpen() const override;
  void close() override;
  void reopen() override;

private:
  std::ifstream finp;     ///< Stream for reading the file
  std::string title;      ///< The title line at the head of the file
  int lines_per_frame;    ///< Number of lines of coordinates in each frame, not counting the box
  int line_counter;       ///< Number of the line to be read next (for error messages)

  /// \brief Open the file and advance past the title line.
  void openFile();

  /// \brief Scan the file to count frames and detect the box.
  void scanFile();

  void readFrameData(CoordinateFrameWriter *cfw) override;
};

/// \brief Write frames to an Amber ASCII .crd trajectory.  Box lengths are written after each
///        frame if the frames have a unit cell.
///
/// \param file_name    Name of the file to write
/// \param frames       The frames to write, all with the same number of atoms
/// \param title        Title line for the file
/// \param expectation  Conditions under which to open the file
void writeAmberCrdTrajectory(const std::string &file_name,
                             const std::vector<CoordinateFrame> &frames,
                             const std::string &title = std::string("mdscan trajectory"),
                             PrintSituation expectation = PrintSituation::OPEN_NEW);

} // namespace trajectory
} // namespace mdscan

#endif
