// -*-c++-*-
#ifndef MDSCAN_TRAJECTORY_BACKEND_H
#define MDSCAN_TRAJECTORY_BACKEND_H

#include <memory>
#include <string>
#include "copyright.h"
#include "coordinateframe.h"
#include "trajectory_enumerators.h"

namespace mdscan {
namespace trajectory {

/// \brief A sequential-only source of trajectory frames.  Concrete readers open their file upon
///        construction (raising an OpenError if it cannot be read), report the number of frames
///        and atoms it holds, and deliver one frame per call to readNextFrame() until the frames
///        are exhausted.  There is no random access: the only way back to the first frame is to
///        close and reopen the file.
class TrajectoryBackend {
public:

  /// \brief The base class records the file name and format.  Derived classes fill in the frame
  ///        and atom counts as they open the file.
  ///
  /// \param file_name_in  Name of the trajectory file
  /// \param file_kind_in  Format of the trajectory file
  TrajectoryBackend(const std::string &file_name_in, CoordinateFileKind file_kind_in);

  /// \brief Backends own file handles and cannot be copied.
  /// \{
  TrajectoryBackend(const TrajectoryBackend &original) = delete;
  TrajectoryBackend& operator=(const TrajectoryBackend &other) = delete;
  /// \}

  /// \brief The destructor of a derived class closes its file.
  virtual ~TrajectoryBackend() = default;

  /// \brief Get the number of frames in the trajectory.
  int getFrameCount() const;

  /// \brief Get the number of atoms in each frame.
  int getAtomCount() const;

  /// \brief Get the number of frames read since the file was last opened.
  int getFramesRead() const;

  /// \brief Get the type of unit cell that accompanies each frame.
  UnitCellType getUnitCellType() const;

  /// \brief Get the name of the trajectory file.
  const std::string& getFileName() const;

  /// \brief Get the format of the trajectory file.
  CoordinateFileKind getFileKind() const;

  /// \brief Indicate whether the file is open.
  virtual bool isOpen() const = 0;

  /// \brief Read the next frame of the trajectory, overwriting the contents of a frame in place.
  ///        Raises an EndOfData error after the last frame, an OpenError if the file is closed,
  ///        and a DimensionMismatch if the frame is not sized for the trajectory's atoms.
  ///
  /// \param cfw  Writeable abstract of the frame to fill
  void readNextFrame(CoordinateFrameWriter *cfw);

  /// \brief Close the file.  Closing a file that is already closed has no effect.
  virtual void close() = 0;

  /// \brief Close the file, if it is open, and open it again at the first frame.  Raises an
  ///        OpenError if the file can no longer be read.
  virtual void reopen() = 0;

protected:
  std::string file_name;        ///< Name of the trajectory file
  CoordinateFileKind file_kind; ///< Format of the trajectory file
  int frame_count;              ///< Number of frames in the trajectory
  int atom_count;               ///< Number of atoms in each frame
  int frames_read;              ///< Number of frames read since the file was last opened
  UnitCellType unit_cell;       ///< Type of unit cell accompanying each frame

  /// \brief Read the frame at the current position of the file into a frame that has already
  ///        been checked for size.  The caller increments the frame counter.
  ///
  /// \param cfw  Writeable abstract of the frame to fill
  virtual void readFrameData(CoordinateFrameWriter *cfw) = 0;
};

/// \brief Open a trajectory file with the appropriate reader.
///
/// \param file_name   Name of the trajectory file
/// \param atom_count  The number of atoms expected in each frame.  Amber .crd files do not state
///                    their atom count and rely on this number.
/// \param kind        Format of the file, detected from the file itself if UNKNOWN
std::unique_ptr<TrajectoryBackend>
openTrajectory(const std::string &file_name, int atom_count,
               CoordinateFileKind kind = CoordinateFileKind::UNKNOWN);

} // namespace trajectory
} // namespace mdscan

#endif
