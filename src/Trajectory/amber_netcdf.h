// -*-c++-*-
#ifndef MDSCAN_AMBER_NETCDF_H
#define MDSCAN_AMBER_NETCDF_H

#include <string>
#include <vector>
#include "copyright.h"
#include "FileManagement/file_util.h"
#include "coordinateframe.h"
#include "trajectory_backend.h"

namespace mdscan {
namespace trajectory {

using diskutil::PrintSituation;

/// \brief Read an Amber NetCDF trajectory.  Coordinates are stored as a (frame, atom, spatial)
///        array of single-precision values, with optional cell_lengths and cell_angles arrays
///        (the angles in degrees) for each frame.  The file states its own frame and atom counts.
class AmberNetcdfTrajectory : public TrajectoryBackend {
public:

  /// \brief The constructor opens the file and reads its dimensions.  An OpenError is raised if
  ///        the file cannot be read or does not follow the Amber conventions.
  ///
  /// \param file_name_in  Name of the trajectory file
  AmberNetcdfTrajectory(const std::string &file_name_in);

  /// \brief The destructor closes the file.
  ~AmberNetcdfTrajectory() override;

  bool isOpen() const override;
  void close() override;
  void reopen() override;

private:
  int ncid;                       ///< NetCDF identifier of the open file
  bool is_open;                   ///< Flag to indicate that the file is open
  int coordinates_id;             ///< Identifier of the coordinates variable
  int cell_lengths_id;            ///< Identifier of the box lengths variable, if present
  int cell_angles_id;             ///< Identifier of the box angles variable, if present
  std::vector<float> frame_buffer; ///< Buffer for one frame of interlaced coordinates

  /// \brief Open the file and read its dimensions and variable identifiers.  The file is closed
  ///        again if it does not have the layout of an Amber NetCDF trajectory.
  void openFile();

  /// \brief Read the dimensions, variable identifiers, and box shape of the open file.
  void readHeader();

  void readFrameData(CoordinateFrameWriter *cfw) override;
};

/// \brief Write frames to an Amber NetCDF trajectory.  Box lengths and angles are written with
///        each frame if the first frame has a unit cell.  Appending to an existing file adds
///        frames after those already present.
///
/// \param file_name    Name of the file to write
/// \param frames       The frames to write, all with the same number of atoms
/// \param expectation  Conditions under which to open the file
void writeAmberNetcdfTrajectory(const std::string &file_name,
                                const std::vector<CoordinateFrame> &frames,
                                PrintSituation expectation = PrintSituation::OPEN_NEW);

} // namespace trajectory
} // namespace mdscan

#endif
