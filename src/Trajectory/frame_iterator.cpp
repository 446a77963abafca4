#include <stdexcept>
#include "copyright.h"
#include "MoleculeFormat/pdb.h"
#include "Reporting/error_format.h"
#include "frame_iterator.h"

namespace mdscan {
namespace trajectory {

using errors::ErrorKind;
using errors::EndOfData;
using structure::readPdbAtoms;

//-------------------------------------------------------------------------------------------------
FrameSelection::FrameSelection(const int first_in, const int step_in, const int last_in) :
    first{first_in}, step{step_in}, last{last_in}
{}

//-------------------------------------------------------------------------------------------------
bool FrameSelection::contains(const int index) const {
  if (index < first || (last != default_final_frame && index > last)) {
    return false;
  }
  return ((index - first) % step == 0);
}

//-------------------------------------------------------------------------------------------------
int FrameSelection::size() const {
  if (last == default_final_frame) {
    rtErr("The selection has not been resolved against a trajectory.", "FrameSelection",
          "size");
  }
  return (first > last) ? 0 : ((last - first) / step) + 1;
}

//-------------------------------------------------------------------------------------------------
int FrameSelection::getFinalIndex() const {
  const int nsel = size();
  return (nsel == 0) ? no_frame_index : first + ((nsel - 1) * step);
}

//-------------------------------------------------------------------------------------------------
std::vector<int> FrameSelection::getIndices() const {
  const int nsel = size();
  std::vector<int> result(nsel);
  for (int i = 0; i < nsel; i++) {
    result[i] = first + (i * step);
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
FrameCursor::FrameCursor(FrameIterator *iter_in, const bool at_end_in) :
    iter{iter_in}, at_end{at_end_in}
{}

//-------------------------------------------------------------------------------------------------
CoordinateFrameReader FrameCursor::operator*() const {
  return iter->current();
}

//-------------------------------------------------------------------------------------------------
FrameCursor& FrameCursor::operator++() {
  if (iter->getFrameIndex() == iter->getSelection().getFinalIndex()) {
    at_end = true;
  }
  else {
    iter->advance();
  }
  return *this;
}

//-------------------------------------------------------------------------------------------------
bool FrameCursor::operator==(const FrameCursor &other) const {
  return (iter == other.iter && at_end == other.at_end);
}

//-------------------------------------------------------------------------------------------------
bool FrameCursor::operator!=(const FrameCursor &other) const {
  return (iter != other.iter || at_end != other.at_end);
}

//-------------------------------------------------------------------------------------------------
FrameIterator::FrameIterator(const std::string &structure_file,
                             const std::string &trajectory_file,
                             const FrameSelection &selection_in, const CoordinateFileKind kind) :
    FrameIterator(readPdbAtoms(structure_file), trajectory_file, selection_in, kind)
{
  structure_file_name = structure_file;
}

//-------------------------------------------------------------------------------------------------
FrameIterator::FrameIterator(const std::vector<AtomRecord> &atoms_in,
                             const std::string &trajectory_file,
                             const FrameSelection &selection_in, const CoordinateFileKind kind) :
    FrameIterator(atoms_in, openTrajectory(trajectory_file, atoms_in.size(), kind), selection_in)
{}

//-------------------------------------------------------------------------------------------------
FrameIterator::FrameIterator(const std::vector<AtomRecord> &atoms_in,
                             std::unique_ptr<TrajectoryBackend> backend_in,
                             const FrameSelection &selection_in) :
    structure_file_name{}, atoms{atoms_in}, backend{std::move(backend_in)}, selection{},
    frame_buffer{}, current_index{no_frame_index}, lock{}
{
  initialize(selection_in);
}

//-------------------------------------------------------------------------------------------------
void FrameIterator::initialize(const FrameSelection &selection_in) {
  if (backend == nullptr) {
    rtErr(ErrorKind::OPEN_ERROR, "No trajectory reader was provided.", "FrameIterator");
  }
  const int natom = atoms.size();
  if (backend->getAtomCount() != natom) {
    rtErr(ErrorKind::DIMENSION_MISMATCH, "Trajectory " + backend->getFileName() + " has " +
          std::to_string(backend->getAtomCount()) + " atoms per frame, but the topology has " +
          std::to_string(natom) + " atoms.", "FrameIterator");
  }
  frame_buffer = CoordinateFrame(natom, backend->getUnitCellType());
  setSelection(selection_in.first, selection_in.step, selection_in.last);
}

//-------------------------------------------------------------------------------------------------
int FrameIterator::getRawFrameCount() const {
  return backend->getFrameCount();
}

//-------------------------------------------------------------------------------------------------
int FrameIterator::getSelectedFrameCount() const {
  std::lock_guard<std::recursive_mutex> guard(lock);
  return selection.size();
}

//-------------------------------------------------------------------------------------------------
int FrameIterator::getFrameIndex() const {
  std::lock_guard<std::recursive_mutex> guard(lock);
  return current_index;
}

//-------------------------------------------------------------------------------------------------
bool FrameIterator::hasCurrentFrame() const {
  std::lock_guard<std::recursive_mutex> guard(lock);
  return (current_index != no_frame_index);
}

//-------------------------------------------------------------------------------------------------
FrameSelection FrameIterator::getSelection() const {
  std::lock_guard<std::recursive_mutex> guard(lock);
  return selection;
}

//-------------------------------------------------------------------------------------------------
const std::string& FrameIterator::getTrajectoryFileName() const {
  return backend->getFileName();
}

//-------------------------------------------------------------------------------------------------
const std::string& FrameIterator::getStructureFileName() const {
  return structure_file_name;
}

//-------------------------------------------------------------------------------------------------
const std::vector<AtomRecord>& FrameIterator::getAtoms() const {
  return atoms;
}

//-------------------------------------------------------------------------------------------------
int FrameIterator::getAtomCount() const {
  return atoms.size();
}

//-------------------------------------------------------------------------------------------------
UnitCellType FrameIterator::getUnitCellType() const {
  return backend->getUnitCellType();
}

//-------------------------------------------------------------------------------------------------
std::vector<double> FrameIterator::getAtomMasses() const {
  return topology::getAtomMasses(atoms);
}

//-------------------------------------------------------------------------------------------------
std::vector<double> FrameIterator::getAtomMasses(const std::vector<int> &atom_indices) const {
  return topology::getAtomMasses(atoms, atom_indices);
}

//-------------------------------------------------------------------------------------------------
std::vector<double> FrameIterator::getUnitCell() const {
  std::lock_guard<std::recursive_mutex> guard(lock);
  const CoordinateFrameReader cfr = current();
  return std::vector<double>(cfr.invu, cfr.invu + 9);
}

//-------------------------------------------------------------------------------------------------
CoordinateFrameReader FrameIterator::current() const {
  std::lock_guard<std::recursive_mutex> guard(lock);
  if (current_index == no_frame_index) {
    rtErr(ErrorKind::NO_FRAME_READ, "No frame of trajectory " + backend->getFileName() +
          " has been read since the last restart.", "FrameIterator", "current");
  }
  return frame_buffer.data();
}

//-------------------------------------------------------------------------------------------------
void FrameIterator::restart() {
  std::lock_guard<std::recursive_mutex> guard(lock);
  current_index = no_frame_index;
  backend->reopen();
}

//-------------------------------------------------------------------------------------------------
CoordinateFrameReader FrameIterator::advance() {
  std::lock_guard<std::recursive_mutex> guard(lock);
  const int final_index = selection.getFinalIndex();
  if (final_index == no_frame_index || current_index == final_index) {
    rtErr(ErrorKind::END_OF_SELECTION, "The final frame of the selection (" +
          std::to_string(final_index) + ") has already been read from trajectory " +
          backend->getFileName() + ".", "FrameIterator", "advance");
  }

  // The number of frames the reader has delivered since it was opened is the raw index of the
  // frame in the buffer.  Frames ahead of the target, or between members of the selection, are
  // read and discarded.
  const int target = (current_index == no_frame_index) ? selection.first : current_index + 1;
  CoordinateFrameWriter cfw = frame_buffer.data();
  try {
    while (backend->getFramesRead() < target) {
      backend->readNextFrame(&cfw);
    }
    while (selection.contains(backend->getFramesRead()) == false &&
           backend->getFramesRead() < final_index) {
      backend->readNextFrame(&cfw);
    }
  }
  catch (const EndOfData &e) {

    // The buffer no longer holds a selected frame.  Rewind so that it is not mistaken for one.
    restart();
    rtErr(ErrorKind::END_OF_SELECTION, "Trajectory " + backend->getFileName() + " ran out of "
          "frames before reaching the next frame of the selection: " + e.what(),
          "FrameIterator", "advance");
  }
  catch (const std::exception &e) {

    // A partial read leaves the buffer and the reader's position out of step with the current
    // frame.  Rewind before passing the error along.
    restart();
    throw;
  }
  const int raw_index = backend->getFramesRead();
  if (selection.contains(raw_index) == false) {
    restart();
    rtErr(ErrorKind::END_OF_SELECTION, "Frame " + std::to_string(raw_index) + " of trajectory " +
          backend->getFileName() + " is past the end of the selection.", "FrameIterator",
          "advance");
  }
  current_index = raw_index;
  return CoordinateFrameReader(cfw);
}

//-------------------------------------------------------------------------------------------------
CoordinateFrameReader FrameIterator::firstFrame() {
  std::lock_guard<std::recursive_mutex> guard(lock);
  restart();
  return advance();
}

//-------------------------------------------------------------------------------------------------
CoordinateFrameReader FrameIterator::seek(const int target_index) {
  std::lock_guard<std::recursive_mutex> guard(lock);
  if (selection.contains(target_index) == false) {
    rtErr(ErrorKind::OUT_OF_RANGE, "Frame " + std::to_string(target_index) + " is not part of "
          "the selection (first " + std::to_string(selection.first) + ", step " +
          std::to_string(selection.step) + ", last " + std::to_string(selection.last) + ").",
          "FrameIterator", "seek");
  }
  restart();
  while (current_index != target_index) {
    advance();
  }
  return current();
}

//-------------------------------------------------------------------------------------------------
std::vector<AtomRecord> FrameIterator::getFrame(const int frame_index) {
  std::lock_guard<std::recursive_mutex> guard(lock);
  const CoordinateFrameReader cfr = seek(frame_index);
  std::vector<AtomRecord> result = atoms;
  topology::transcribeFramePositions(&result, cfr.xcrd, cfr.ycrd, cfr.zcrd, cfr.natom);
  restart();
  return result;
}

//-------------------------------------------------------------------------------------------------
void FrameIterator::setSelection(const int first, const int step, const int last) {
  std::lock_guard<std::recursive_mutex> guard(lock);
  if (first < 1) {
    rtErr(ErrorKind::OUT_OF_RANGE, "The first frame of a selection must be at least 1 (" +
          std::to_string(first) + " given).", "FrameIterator", "setSelection");
  }
  if (step < 1) {
    rtErr(ErrorKind::OUT_OF_RANGE, "The step of a selection must be at least 1 (" +
          std::to_string(step) + " given).", "FrameIterator", "setSelection");
  }
  if (last < 0 && last != default_final_frame) {
    rtErr(ErrorKind::OUT_OF_RANGE, "The last frame of a selection must be non-negative (" +
          std::to_string(last) + " given).", "FrameIterator", "setSelection");
  }
  selection = FrameSelection(first, step,
                             (last == default_final_frame) ? backend->getFrameCount() : last);
  restart();
}

//-------------------------------------------------------------------------------------------------
void FrameIterator::close() {
  std::lock_guard<std::recursive_mutex> guard(lock);
  current_index = no_frame_index;
  backend->close();
}

//-------------------------------------------------------------------------------------------------
FrameCursor FrameIterator::begin() {
  std::lock_guard<std::recursive_mutex> guard(lock);
  restart();
  if (selection.size() == 0) {
    return end();
  }
  advance();
  return FrameCursor(this, false);
}

//-------------------------------------------------------------------------------------------------
FrameCursor FrameIterator::end() {
  return FrameCursor(this, true);
}

//-------------------------------------------------------------------------------------------------
std::unique_lock<std::recursive_mutex> FrameIterator::acquireLock() const {
  return std::unique_lock<std::recursive_mutex>(lock);
}

//-------------------------------------------------------------------------------------------------
std::string FrameIterator::describe() const {
  std::lock_guard<std::recursive_mutex> guard(lock);
  std::string result("Atoms:            " + std::to_string(atoms.size()) + "\n");
  if (structure_file_name.size() > 0) {
    result += "Structure file:   " + structure_file_name + "\n";
  }
  result += "Trajectory file:  " + backend->getFileName() + " (" +
            getEnumerationName(backend->getFileKind()) + ", " +
            getEnumerationName(backend->getUnitCellType()) + " unit cell)\n";
  result += "Raw frames:       " + std::to_string(backend->getFrameCount()) + "\n";
  result += "Selection:        first " + std::to_string(selection.first) + ", step " +
            std::to_string(selection.step) + ", last " + std::to_string(selection.last) + "\n";
  result += "Selected frames:  " + std::to_string(selection.size()) + "\n";
  result += "Current frame:    " + ((current_index == no_frame_index) ?
                                    std::string("none") : std::to_string(current_index)) + "\n";
  return result;
}

} // namespace trajectory
} // namespace mdscan
