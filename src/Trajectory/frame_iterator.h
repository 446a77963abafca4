// -*-c++-*-
#ifndef MDSCAN_FRAME_ITERATOR_H
#define MDSCAN_FRAME_ITERATOR_H

#include <cstddef>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "copyright.h"
#include "Topology/atom_record.h"
#include "coordinateframe.h"
#include "trajectory_backend.h"
#include "trajectory_enumerators.h"

namespace mdscan {
namespace trajectory {

using topology::AtomRecord;

/// \brief Sentinel for "no frame has been read since the last restart"
constexpr int no_frame_index = -1;

/// \brief Sentinel for a selection that runs to the last frame of the trajectory
constexpr int default_final_frame = -1;

/// \brief An arithmetic sequence of raw frame indices to visit.  Frame indices are 1-based.  The
///        members are first, first + step, first + 2 * step, ... up to and including last.
struct FrameSelection {

  /// \brief The default selection covers every frame of the trajectory.
  ///
  /// \param first_in  The first frame to visit
  /// \param step_in   Stride between visited frames
  /// \param last_in   The last frame that may be visited
  FrameSelection(int first_in = 1, int step_in = 1, int last_in = default_final_frame);

  /// \brief Indicate whether a raw frame index is a member of the selection.
  ///
  /// \param index  The raw frame index of interest
  bool contains(int index) const;

  /// \brief Get the number of frames in the selection.  The selection must be resolved.
  int size() const;

  /// \brief Get the largest member of the selection, or no_frame_index if the selection is
  ///        empty.  The selection must be resolved.
  int getFinalIndex() const;

  /// \brief List all members of the selection, in increasing order.
  std::vector<int> getIndices() const;

  int first;  ///< The first frame to visit
  int step;   ///< Stride between visited frames
  int last;   ///< Upper bound on visited frames, default_final_frame until resolved against a
              ///<   trajectory
};

class FrameIterator;

/// \brief Input iterator over the frames of a FrameIterator's selection, for use in range-based
///        for loops.  Dereferencing gives a view of the iterator's frame buffer, valid until the
///        cursor is incremented.
class FrameCursor {
public:

  typedef std::input_iterator_tag iterator_category;
  typedef CoordinateFrameReader value_type;
  typedef std::ptrdiff_t difference_type;
  typedef const CoordinateFrameReader* pointer;
  typedef CoordinateFrameReader reference;

  /// \brief The cursor points to an iterator and knows whether it has passed the end.
  ///
  /// \param iter_in    The iterator to step through
  /// \param at_end_in  Flag to indicate that this is the past-the-end cursor
  FrameCursor(FrameIterator *iter_in, bool at_end_in);

  CoordinateFrameReader operator*() const;
  FrameCursor& operator++();
  bool operator==(const FrameCursor &other) const;
  bool operator!=(const FrameCursor &other) const;

private:
  FrameIterator *iter;  ///< The iterator being stepped through
  bool at_end;          ///< Flag to indicate that the final frame has been passed
};

/// \brief Present a trajectory that can only be read forward, one frame at a time, as a
///        restartable sequence of selected frames with arbitrary frame retrieval.  The iterator
///        owns the trajectory reader, a copy of the topology, and a single frame buffer reused by
///        every read.  All state changes are serialized by a lock owned by the iterator, so one
///        iterator may be shared by several threads.  Views of the frame buffer are invalidated by
///        the next read, and callers needing a consistent view across calls made by other threads
///        should hold the lock from acquireLock() while they work with it.
class FrameIterator {
public:

  /// \brief The constructor opens the trajectory and rewinds to the state in which no frame has
  ///        been read.  A DimensionMismatch is raised if the topology and trajectory disagree on
  ///        the number of atoms.
  ///
  /// Overloaded:
  ///   - Read the topology from a PDB file and open a trajectory file
  ///   - Take the topology as given and open a trajectory file
  ///   - Take the topology and an open trajectory reader as given
  ///
  /// \param structure_file   Name of the PDB file with the topology
  /// \param trajectory_file  Name of the trajectory file
  /// \param atoms_in         The topology
  /// \param backend_in       A trajectory reader, of which the iterator takes ownership
  /// \param selection_in     Frames to visit
  /// \param kind             Format of the trajectory file, detected from the file if UNKNOWN
  /// \{
  FrameIterator(const std::string &structure_file, const std::string &trajectory_file,
                const FrameSelection &selection_in = FrameSelection(),
                CoordinateFileKind kind = CoordinateFileKind::UNKNOWN);

  FrameIterator(const std::vector<AtomRecord> &atoms_in, const std::string &trajectory_file,
                const FrameSelection &selection_in = FrameSelection(),
                CoordinateFileKind kind = CoordinateFileKind::UNKNOWN);

  FrameIterator(const std::vector<AtomRecord> &atoms_in,
                std::unique_ptr<TrajectoryBackend> backend_in,
                const FrameSelection &selection_in = FrameSelection());
  /// \}

  /// \brief The iterator owns a file handle and a lock and cannot be copied.
  /// \{
  FrameIterator(const FrameIterator &original) = delete;
  FrameIterator& operator=(const FrameIterator &other) = delete;
  /// \}

  /// \brief Get the number of frames in the trajectory.
  int getRawFrameCount() const;

  /// \brief Get the number of frames in the selection.
  int getSelectedFrameCount() const;

  /// \brief Get the raw index of the frame in the buffer, or no_frame_index if no frame has been
  ///        read since the last restart.
  int getFrameIndex() const;

  /// \brief Indicate whether a frame has been read since the last restart.
  bool hasCurrentFrame() const;

  /// \brief Get a copy of the frame selection, taken under the iterator's lock.
  FrameSelection getSelection() const;

  /// \brief Get the name of the trajectory file.
  const std::string& getTrajectoryFileName() const;

  /// \brief Get the name of the structure file, which is blank if the topology was supplied
  ///        directly.
  const std::string& getStructureFileName() const;

  /// \brief Get the topology.
  const std::vector<AtomRecord>& getAtoms() const;

  /// \brief Get the number of atoms in the topology.
  int getAtomCount() const;

  /// \brief Get the kind of unit cell carried by frames of the trajectory.
  UnitCellType getUnitCellType() const;

  /// \brief Get the masses of atoms in the topology.
  ///
  /// Overloaded:
  ///   - Get the masses of all atoms
  ///   - Get the masses of selected atoms (0-based indices)
  ///
  /// \param atom_indices  The atoms of interest
  /// \{
  std::vector<double> getAtomMasses() const;
  std::vector<double> getAtomMasses(const std::vector<int> &atom_indices) const;
  /// \}

  /// \brief Get the unit cell matrix of the frame in the buffer, nine elements in column-major
  ///        order with the box vectors as columns.  A NoFrameRead error is raised if no frame
  ///        has been read since the last restart.
  std::vector<double> getUnitCell() const;

  /// \brief Get a view of the frame in the buffer.  A NoFrameRead error is raised if no frame
  ///        has been read since the last restart.
  CoordinateFrameReader current() const;

  /// \brief Close the trajectory file, if it is open, reopen it at the first frame, and forget
  ///        the current frame.  An OpenError is raised if the file can no longer be read.
  void restart();

  /// \brief Read the next frame of the selection into the buffer and return a view of it.
  ///        Frames of the trajectory that are not in the selection are read and discarded.  An
  ///        EndOfSelection error is raised once the final frame of the selection has been read,
  ///        or if the trajectory runs out of frames before the next selected frame.  In the latter
  ///        case the iterator also restarts.
  CoordinateFrameReader advance();

  /// \brief Restart and advance to the first frame of the selection.
  CoordinateFrameReader firstFrame();

  /// \brief Move to a particular frame of the selection.  The trajectory cannot be read
  ///        backwards, so this restarts and advances until the frame is reached.  An OutOfRange
  ///        error is raised if the frame is not in the selection.
  ///
  /// \param target_index  Raw index of the frame of interest
  CoordinateFrameReader seek(int target_index);

  /// \brief Get a copy of the topology with the positions of one frame of the selection.  The
  ///        iterator is left in its restarted state.
  ///
  /// \param frame_index  Raw index of the frame of interest
  std::vector<AtomRecord> getFrame(int frame_index);

  /// \brief Replace the frame selection and restart.  An OutOfRange error is raised if first or
  ///        step is less than one.  A last frame beyond the end of the trajectory is accepted and
  ///        surfaces as an EndOfSelection error when the trajectory runs out.
  ///
  /// \param first  The first frame to visit
  /// \param step   Stride between visited frames
  /// \param last   The last frame that may be visited, the final frame of the trajectory if
  ///               default_final_frame
  void setSelection(int first, int step, int last = default_final_frame);

  /// \brief Close the trajectory file.  Frames cannot be read again until the next restart.
  void close();

  /// \brief Restart and return a cursor at the first frame of the selection.
  FrameCursor begin();

  /// \brief Return the past-the-end cursor.
  FrameCursor end();

  /// \brief Take the iterator's lock.  The lock is recursive, so member functions of the
  ///        iterator may be called while holding it.
  std::unique_lock<std::recursive_mutex> acquireLock() const;

  /// \brief Produce a summary of the topology, trajectory, and selection.
  std::string describe() const;

private:
  std::string structure_file_name;             ///< Name of the PDB file, if one was read
  std::vector<AtomRecord> atoms;               ///< The topology
  std::unique_ptr<TrajectoryBackend> backend;  ///< Reader for the trajectory file
  FrameSelection selection;                    ///< Frames to visit
  CoordinateFrame frame_buffer;                ///< The single buffer into which all frames
                                               ///<   are read
  int current_index;                           ///< Raw index of the frame in the buffer
  mutable std::recursive_mutex lock;           ///< Serializes changes to the iterator's state

  /// \brief Check the reader against the topology and set the initial selection.
  ///
  /// \param selection_in  Frames to visit
  void initialize(const FrameSelection &selection_in);
};

} // namespace trajectory
} // namespace mdscan

#endif
