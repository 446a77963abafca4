#include <memory>
#include "copyright.h"
#include "Reporting/error_format.h"
#include "amber_crd.h"
#include "amber_netcdf.h"
#include "trajectory_backend.h"

namespace mdscan {
namespace trajectory {

using errors::ErrorKind;

//-------------------------------------------------------------------------------------------------
TrajectoryBackend::TrajectoryBackend(const std::string &file_name_in,
                                     const CoordinateFileKind file_kind_in) :
    file_name{file_name_in}, file_kind{file_kind_in}, frame_count{0}, atom_count{0},
    frames_read{0}, unit_cell{UnitCellType::NONE}
{}

//-------------------------------------------------------------------------------------------------
int TrajectoryBackend::getFrameCount() const {
  return frame_count;
}

//-------------------------------------------------------------------------------------------------
int TrajectoryBackend::getAtomCount() const {
  return atom_count;
}

//-------------------------------------------------------------------------------------------------
int TrajectoryBackend::getFramesRead() const {
  return frames_read;
}

//-------------------------------------------------------------------------------------------------
UnitCellType TrajectoryBackend::getUnitCellType() const {
  return unit_cell;
}

//-------------------------------------------------------------------------------------------------
const std::string& TrajectoryBackend::getFileName() const {
  return file_name;
}

//-------------------------------------------------------------------------------------------------
CoordinateFileKind TrajectoryBackend::getFileKind() const {
  return file_kind;
}

//-------------------------------------------------------------------------------------------------
void TrajectoryBackend::readNextFrame(CoordinateFrameWriter *cfw) {
  if (isOpen() == false) {
    rtErr(ErrorKind::OPEN_ERROR, "Trajectory file " + file_name + " is not open.",
          "TrajectoryBackend", "readNextFrame");
  }
  if (frames_read >= frame_count) {
    rtErr(ErrorKind::END_OF_DATA, "All " + std::to_string(frame_count) + " frames of "
          "trajectory file " + file_name + " have been read.", "TrajectoryBackend",
          "readNextFrame");
  }
  if (cfw->natom != atom_count) {
    rtErr(ErrorKind::DIMENSION_MISMATCH, "A frame of " + std::to_string(cfw->natom) + " atoms "
          "cannot receive data from trajectory file " + file_name + " with " +
          std::to_string(atom_count) + " atoms.", "TrajectoryBackend", "readNextFrame");
  }
  readFrameData(cfw);
  frames_read++;
}

//-------------------------------------------------------------------------------------------------
std::unique_ptr<TrajectoryBackend> openTrajectory(const std::string &file_name,
                                                  const int atom_count,
                                                  const CoordinateFileKind kind) {
  const CoordinateFileKind actual_kind = (kind == CoordinateFileKind::UNKNOWN) ?
                                         detectCoordinateFileKind(file_name, "openTrajectory") :
                                         kind;
  switch (actual_kind) {
  case CoordinateFileKind::AMBER_CRD:
    return std::make_unique<AmberCrdTrajectory>(file_name, atom_count);
  case CoordinateFileKind::AMBER_NETCDF:
    return std::make_unique<AmberNetcdfTrajectory>(file_name);
  case CoordinateFileKind::UNKNOWN:
    rtErr(ErrorKind::OPEN_ERROR, "The format of trajectory file " + file_name + " could not be "
          "determined.", "openTrajectory");
    break;
  }
  __builtin_unreachable();
}

} // namespace trajectory
} // namespace mdscan
