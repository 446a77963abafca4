#include <algorithm>
#include <cmath>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "copyright.h"
#include "../../src/Constants/symbol_values.h"
#include "../../src/FileManagement/file_listing.h"
#include "../../src/Reporting/error_format.h"
#include "../../src/Topology/atom_record.h"
#include "../../src/Trajectory/amber_crd.h"
#include "../../src/Trajectory/amber_netcdf.h"
#include "../../src/Trajectory/coordinateframe.h"
#include "../../src/Trajectory/frame_iterator.h"
#include "../../src/Trajectory/netcdf_util.h"
#include "../../src/Trajectory/trajectory_backend.h"
#include "../../src/Trajectory/trajectory_enumerators.h"
#include "../../src/UnitTesting/approx.h"
#include "../../src/UnitTesting/unit_test.h"

using mdscan::diskutil::osSeparator;
using mdscan::diskutil::PrintSituation;
using mdscan::symbols::pi;
using mdscan::errors::DimensionMismatch;
using mdscan::errors::EndOfSelection;
using mdscan::errors::NoFrameRead;
using mdscan::errors::OpenError;
using mdscan::errors::OutOfRange;
using mdscan::topology::AtomRecord;
using namespace mdscan::trajectory;
using namespace mdscan::testing;

//-------------------------------------------------------------------------------------------------
// Make a small topology of alternating CA and CB atoms.
//
// Arguments:
//   natom:  The number of atoms
//-------------------------------------------------------------------------------------------------
std::vector<AtomRecord> makeAtoms(const int natom) {
  std::vector<AtomRecord> result;
  result.reserve(natom);
  for (int i = 0; i < natom; i++) {
    result.emplace_back(i + 1, (i % 2 == 0) ? "CA" : "CB", "ALA", (i / 2) + 1, "A", "C");
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
// Make a series of frames in which every coordinate is a function of the atom and frame
// indices.  All values are exact to three decimal places so that they survive the .crd format.
//
// Arguments:
//   natom:   The number of atoms
//   nframe:  The number of frames
//   boxdim:  Box dimensions (lengths followed by angles in radians), or nullptr for no box
//-------------------------------------------------------------------------------------------------
std::vector<CoordinateFrame> makeFrames(const int natom, const int nframe,
                                        const double* boxdim = nullptr) {
  std::vector<CoordinateFrame> result;
  std::vector<double> xcrd(natom), ycrd(natom), zcrd(natom);
  for (int k = 1; k <= nframe; k++) {
    for (int i = 0; i < natom; i++) {
      xcrd[i] = (1.5 * i) + (0.25 * k);
      ycrd[i] = (-0.75 * i) + (0.5 * k);
      zcrd[i] = static_cast<double>(i) + (0.125 * k);
    }
    result.emplace_back(natom, xcrd.data(), ycrd.data(), zcrd.data(), boxdim);
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
// Cut one line of a text file short, rewriting the file in place.
//
// Arguments:
//   file_name:  Name of the file to edit
//   line_idx:   Index of the line to shorten, counting the first line as 0
//   length:     Number of characters to keep
//-------------------------------------------------------------------------------------------------
void cutCrdLine(const std::string &file_name, const int line_idx, const size_t length) {
  std::vector<std::string> lines;
  std::string line;
  std::ifstream finp(file_name.c_str());
  while (std::getline(finp, line)) {
    lines.push_back(line);
  }
  finp.close();
  if (line_idx < static_cast<int>(lines.size()) && lines[line_idx].size() > length) {
    lines[line_idx].resize(length);
  }
  std::ofstream foutp(file_name.c_str(), std::ios::trunc);
  for (size_t i = 0; i < lines.size(); i++) {
    foutp << lines[i] << "\n";
  }
  foutp.close();
}

//-------------------------------------------------------------------------------------------------
// Run the iterator through a trajectory written by makeFrames() above, checking the frames it
// visits and the errors it raises.
//
// Arguments:
//   traj_file:  Name of the trajectory file, with five frames of six atoms
//   kind:       Format of the trajectory file
//   cell:       The expected kind of unit cell
//-------------------------------------------------------------------------------------------------
void testIteration(const std::string &traj_file, const CoordinateFileKind kind,
                   const UnitCellType cell) {
  const std::string fmt = getEnumerationName(kind);
  const std::vector<AtomRecord> atoms = makeAtoms(6);
  FrameIterator iter(atoms, traj_file);
  check(iter.getRawFrameCount(), RelationalOperator::EQUAL, 5, "The number of frames in a " +
        fmt + " trajectory is incorrect.");
  check(iter.getSelectedFrameCount(), RelationalOperator::EQUAL, 5, "The default selection of "
        "a " + fmt + " trajectory does not cover every frame.");
  check(iter.hasCurrentFrame() == false, "A newly opened " + fmt + " trajectory reports a "
        "current frame.");
  CHECK_THROWS_AS(iter.current(), NoFrameRead, "A frame was obtained from a " + fmt +
                  " trajectory before any was read.");

  // Iterate over every frame
  std::vector<int> visited;
  std::vector<double> first_atom_x;
  for (const CoordinateFrameReader cfr : iter) {
    visited.push_back(iter.getFrameIndex());
    first_atom_x.push_back(cfr.xcrd[0]);
  }
  check(visited, RelationalOperator::EQUAL, std::vector<int>({ 1, 2, 3, 4, 5 }), "Iterating "
        "over a " + fmt + " trajectory did not visit every frame in order.");
  check(first_atom_x, RelationalOperator::EQUAL,
        Approx(std::vector<double>({ 0.25, 0.5, 0.75, 1.0, 1.25 })).margin(1.0e-3),
        "Coordinates read from a " + fmt + " trajectory are incorrect.");
  check(iter.getUnitCellType() == cell, "The unit cell of a " + fmt + " trajectory was not "
        "detected correctly.");

  // Iterate over a subset of the frames, twice
  iter.setSelection(2, 2, 4);
  check(iter.getSelectedFrameCount(), RelationalOperator::EQUAL, 2, "The selection (2, 2, 4) "
        "does not hold two frames.");
  for (int pass = 0; pass < 2; pass++) {
    visited.resize(0);
    for (const CoordinateFrameReader cfr : iter) {
      visited.push_back(iter.getFrameIndex());
    }
    check(visited, RelationalOperator::EQUAL, std::vector<int>({ 2, 4 }), "Iterating over the "
          "selection (2, 2, 4) of a " + fmt + " trajectory visited the wrong frames (pass " +
          std::to_string(pass + 1) + ").");
  }

  // Advance until the selection is exhausted
  iter.restart();
  int n_advance = 0;
  bool selection_ended = false;
  while (selection_ended == false && n_advance < 10) {
    try {
      iter.advance();
      n_advance++;
    }
    catch (const EndOfSelection &) {
      selection_ended = true;
    }
  }
  check(n_advance, RelationalOperator::EQUAL, 2, "The number of frames that could be advanced "
        "through in the selection (2, 2, 4) of a " + fmt + " trajectory is incorrect.");
  check(selection_ended, "Advancing past the end of a selection did not raise an "
        "EndOfSelection error.");

  // Seek frames within and outside of the selection
  const CoordinateFrameReader cfr_four = iter.seek(4);
  check(iter.getFrameIndex(), RelationalOperator::EQUAL, 4, "Seeking frame 4 of a " + fmt +
        " trajectory landed on the wrong frame.");
  check(cfr_four.ycrd[1], RelationalOperator::EQUAL, Approx(1.25).margin(1.0e-3), "The "
        "coordinates of frame 4 of a " + fmt + " trajectory are incorrect.");
  CHECK_THROWS_AS(iter.seek(3), OutOfRange, "Frame 3 was reached despite not being part of the "
                  "selection (2, 2, 4).");
  CHECK_THROWS_AS(iter.seek(100), OutOfRange, "Frame 100 was reached in a trajectory of five "
                  "frames.");
  CHECK_THROWS_AS(iter.setSelection(0, 1), OutOfRange, "A selection starting at frame 0 was "
                  "accepted.");
  CHECK_THROWS_AS(iter.setSelection(1, 0), OutOfRange, "A selection with a step of 0 was "
                  "accepted.");

  // Retrieve a frame as a copy of the topology
  iter.setSelection(1, 1);
  const std::vector<AtomRecord> frame_three = iter.getFrame(3);
  check(frame_three[5].getPosition().x, RelationalOperator::EQUAL, Approx(8.25).margin(1.0e-3),
        "The positions of atoms in frame 3 of a " + fmt + " trajectory are incorrect.");
  check(frame_three[5].getAtomName(), RelationalOperator::EQUAL, std::string("CB"),
        "Atom names were lost when retrieving a frame from a " + fmt + " trajectory.");
  check(iter.hasCurrentFrame() == false, "The iterator was not left in its restarted state after "
        "retrieving a frame.");

  // A selection reaching past the end of the trajectory runs out of frames lazily
  iter.setSelection(1, 1, 8);
  check(iter.getSelectedFrameCount(), RelationalOperator::EQUAL, 8, "A selection extending "
        "past the end of the trajectory was not kept as specified.");
  for (int i = 0; i < 5; i++) {
    iter.advance();
  }
  CHECK_THROWS_AS(iter.advance(), EndOfSelection, "Advancing beyond the last frame of a " +
                  fmt + " trajectory did not raise an EndOfSelection error.");
  check(iter.hasCurrentFrame() == false, "The iterator was not restarted after running out of "
        "frames in a " + fmt + " trajectory.");

  // Close the file, then try to read from it
  iter.setSelection(1, 1);
  iter.advance();
  iter.close();
  check(iter.hasCurrentFrame() == false, "A closed " + fmt + " trajectory still reports a "
        "current frame.");
  CHECK_THROWS_AS(iter.advance(), OpenError, "A frame was read from a closed " + fmt +
                  " trajectory.");
  iter.restart();
  iter.advance();
  check(iter.getFrameIndex(), RelationalOperator::EQUAL, 1, "A closed " + fmt + " trajectory "
        "could not be restarted.");
}

//-------------------------------------------------------------------------------------------------
// main
//-------------------------------------------------------------------------------------------------
int main(const int argc, const char* argv[]) {

  // Some baseline initialization
  TestEnvironment oe(argc, argv, TmpdirStatus::REQUIRED);
  if (oe.getTemporaryDirectoryAccess() == false) {
    check(false, "The temporary directory " + oe.getTemporaryDirectoryPath() + " cannot be "
          "written.  Trajectory files could not be prepared.", TestPriority::ABORT);
  }
  const char osc = osSeparator();
  const std::string crd_name = oe.getTemporaryDirectoryPath() + osc + "frames.crd";
  const std::string crd_box_name = oe.getTemporaryDirectoryPath() + osc + "frames_box.crd";
  const std::string cdf_name = oe.getTemporaryDirectoryPath() + osc + "frames.nc";
  const std::string cdf_box_name = oe.getTemporaryDirectoryPath() + osc + "frames_box.nc";

  // Section 1
  section("Frame selections");

  // Section 2
  section("Iteration over Amber .crd trajectories");

  // Section 3
  section("Iteration over Amber NetCDF trajectories");

  // Section 4
  section("Unit cells");

  // Section 5
  section("Error conditions");

  // Section 6
  section("Shared access from multiple threads");

  // Write test trajectories
  const double ortho_box[6] = { 30.0, 32.5, 35.0, 0.5 * pi, 0.5 * pi, 0.5 * pi };
  const double tric_box[6] = { 30.0, 30.0, 30.0, 1.910633236, 1.910633236, 1.910633236 };
  writeAmberCrdTrajectory(crd_name, makeFrames(6, 5));
  oe.logFileCreated(crd_name);
  writeAmberCrdTrajectory(crd_box_name, makeFrames(6, 5, ortho_box));
  oe.logFileCreated(crd_box_name);
  writeAmberNetcdfTrajectory(cdf_name, makeFrames(6, 5));
  oe.logFileCreated(cdf_name);
  writeAmberNetcdfTrajectory(cdf_box_name, makeFrames(6, 5, tric_box));
  oe.logFileCreated(cdf_box_name);

  // Selections on their own
  section(1);
  const FrameSelection sel_a(2, 3, 11);
  check(sel_a.size(), RelationalOperator::EQUAL, 4, "The selection (2, 3, 11) has the wrong "
        "number of frames.");
  check(sel_a.getIndices(), RelationalOperator::EQUAL, std::vector<int>({ 2, 5, 8, 11 }),
        "The selection (2, 3, 11) lists the wrong frames.");
  check(sel_a.contains(8) && sel_a.contains(7) == false && sel_a.contains(14) == false,
        "Membership in the selection (2, 3, 11) is not tested correctly.");
  check(sel_a.getFinalIndex(), RelationalOperator::EQUAL, 11, "The final frame of the "
        "selection (2, 3, 11) is incorrect.");
  const FrameSelection sel_b(2, 4, 12);
  check(sel_b.getFinalIndex(), RelationalOperator::EQUAL, 10, "The final frame of the "
        "selection (2, 4, 12) is incorrect.");
  const FrameSelection sel_empty(6, 1, 5);
  check(sel_empty.size(), RelationalOperator::EQUAL, 0, "A selection ending before it begins "
        "should be empty.");
  check(sel_empty.getFinalIndex(), RelationalOperator::EQUAL, no_frame_index, "An empty "
        "selection should have no final frame.");
  const FrameSelection sel_open;
  CHECK_THROWS(sel_open.size(), "An unresolved selection reported its size.");

  // Amber .crd trajectories
  section(2);
  check(detectCoordinateFileKind(crd_name) == CoordinateFileKind::AMBER_CRD, "An Amber .crd "
        "trajectory was not recognized.");
  testIteration(crd_name, CoordinateFileKind::AMBER_CRD, UnitCellType::NONE);
  const AmberCrdTrajectory crd_direct(crd_name, 6);
  check(crd_direct.getTitle(), RelationalOperator::EQUAL, std::string("mdscan trajectory"),
        "The title line of an Amber .crd trajectory was not read.");
  check(crd_direct.getFrameCount(), RelationalOperator::EQUAL, 5, "The number of frames found "
        "by scanning an Amber .crd trajectory is incorrect.");
  FrameIterator sel_iter(makeAtoms(6), crd_name);
  const FrameSelection sel_before = sel_iter.getSelection();
  sel_iter.setSelection(2, 2, 4);
  check(sel_before.first == 1 && sel_before.step == 1, "A copy of an iterator's selection "
        "changed when the iterator was given a new selection.");
  check(sel_iter.getSelection().getIndices(), RelationalOperator::EQUAL,
        std::vector<int>({ 2, 4 }), "An iterator does not report its new selection.");

  // Amber NetCDF trajectories
  section(3);
  check(detectCoordinateFileKind(cdf_name) == CoordinateFileKind::AMBER_NETCDF, "An Amber "
        "NetCDF trajectory was not recognized.");
  testIteration(cdf_name, CoordinateFileKind::AMBER_NETCDF, UnitCellType::NONE);
  const std::unique_ptr<TrajectoryBackend> crd_backend = openTrajectory(crd_name, 6);
  const std::unique_ptr<TrajectoryBackend> cdf_backend = openTrajectory(cdf_name, 6);
  check(crd_backend->getFileKind() == CoordinateFileKind::AMBER_CRD &&
        cdf_backend->getFileKind() == CoordinateFileKind::AMBER_NETCDF, "Trajectory readers "
        "were not created for the formats of their files.");
  check(crd_backend->isOpen() && cdf_backend->getAtomCount() == 6, "Trajectory readers were "
        "not opened on their files.");
  FrameIterator cdf_sel(makeAtoms(6), cdf_name, FrameSelection(3, 1, 4),
                        CoordinateFileKind::AMBER_NETCDF);
  cdf_sel.advance();
  check(cdf_sel.current().zcrd[2], RelationalOperator::EQUAL, Approx(2.375).margin(1.0e-5),
        "The first frame of the selection (3, 1, 4) of a NetCDF trajectory is incorrect.");

  // Unit cells
  section(4);
  FrameIterator crd_box_iter(makeAtoms(6), crd_box_name);
  check(crd_box_iter.getRawFrameCount(), RelationalOperator::EQUAL, 5, "Box lines in an Amber "
        ".crd trajectory were counted as frames.");
  CHECK_THROWS_AS(crd_box_iter.getUnitCell(), NoFrameRead, "A unit cell was obtained before any "
                  "frame was read.");
  crd_box_iter.seek(3);
  const std::vector<double> ortho_invu = { 30.0, 0.0, 0.0, 0.0, 32.5, 0.0, 0.0, 0.0, 35.0 };
  check(crd_box_iter.getUnitCell(), RelationalOperator::EQUAL, Approx(ortho_invu).margin(1.0e-6),
        "The unit cell of an Amber .crd trajectory with a box is incorrect.");
  check(crd_box_iter.current().xcrd[4], RelationalOperator::EQUAL, Approx(6.75).margin(1.0e-3),
        "Coordinates following box lines in an Amber .crd trajectory are incorrect.");
  FrameIterator cdf_box_iter(makeAtoms(6), cdf_box_name);
  check(cdf_box_iter.getUnitCellType() == UnitCellType::TRICLINIC, "A triclinic unit cell was "
        "not detected in an Amber NetCDF trajectory.");
  cdf_box_iter.advance();
  const CoordinateFrameReader tric_cfr = cdf_box_iter.current();
  check(std::vector<double>(tric_cfr.boxdim, tric_cfr.boxdim + 6), RelationalOperator::EQUAL,
        Approx(std::vector<double>(tric_box, tric_box + 6)).margin(1.0e-5), "Box dimensions "
        "read from an Amber NetCDF trajectory are incorrect.");
  const std::vector<double> tric_invu = cdf_box_iter.getUnitCell();
  check(tric_invu[0], RelationalOperator::EQUAL, Approx(30.0).margin(1.0e-5), "The first box "
        "vector of a triclinic unit cell does not lie along the X axis.");
  check(std::abs(tric_invu[3]) > 1.0, "The second box vector of a triclinic unit cell has no "
        "X component.");
  const double ortho_x[2] = { 1.0, 4.0 };
  const double ortho_y[2] = { 2.0, 5.0 };
  const double ortho_z[2] = { 3.0, 6.0 };
  const double cell_box[6] = { 20.0, 25.0, 40.0, 0.5 * pi, 0.5 * pi, 0.5 * pi };
  const CoordinateFrame ortho_cf(2, ortho_x, ortho_y, ortho_z, cell_box);
  check(ortho_cf.getUnitCellType() == UnitCellType::ORTHORHOMBIC, "A box with right angles was "
        "not recognized as orthorhombic.");
  check(ortho_cf.getInterlacedCoordinates(), RelationalOperator::EQUAL,
        Approx(std::vector<double>({ 1.0, 2.0, 3.0, 4.0, 5.0, 6.0 })), "Coordinates of a frame "
        "were not interlaced correctly.");
  check(ortho_cf.getBoxDimensions(), RelationalOperator::EQUAL,
        Approx(std::vector<double>(cell_box, cell_box + 6)).margin(1.0e-10), "The box "
        "dimensions of a frame are not those it was built with.");
  check(ortho_cf.getInverseTransform(), RelationalOperator::EQUAL,
        Approx(std::vector<double>({ 20.0, 0.0, 0.0, 0.0, 25.0, 0.0, 0.0, 0.0,
                                     40.0 })).margin(1.0e-10),
        "The box vectors of an orthorhombic frame are incorrect.");
  check(ortho_cf.getBoxSpaceTransform(), RelationalOperator::EQUAL,
        Approx(std::vector<double>({ 0.05, 0.0, 0.0, 0.0, 0.04, 0.0, 0.0, 0.0,
                                     0.025 })).margin(1.0e-10),
        "The fractional transformation of an orthorhombic frame is incorrect.");
  const CoordinateFrame open_cf(2, ortho_x, ortho_y, ortho_z);
  check(open_cf.getUnitCellType() == UnitCellType::NONE, "A frame built without box dimensions "
        "reports a unit cell.");
  CoordinateFrame edit_cf(2, ortho_x, ortho_y, ortho_z, cell_box);
  CoordinateFrameWriter edit_cfw = edit_cf.data();
  edit_cfw.xcrd[1] = 7.5;
  const CoordinateFrameReader edit_cfr(edit_cfw);
  check(edit_cfr.natom == 2 && edit_cfr.unit_cell == UnitCellType::ORTHORHOMBIC, "A read-only "
        "view of a frame does not carry the atom count and unit cell of its writable view.");
  check(edit_cfr.xcrd == edit_cfw.xcrd && edit_cfr.invu == edit_cfw.invu, "A read-only view of "
        "a frame does not point to the same memory as its writable view.");
  check(edit_cfr.xcrd[1], RelationalOperator::EQUAL, 7.5, "An edit made through the writable "
        "view of a frame is not visible through a read-only view.");

  // Error conditions
  section(5);
  CHECK_THROWS_AS(FrameIterator bad_natom(makeAtoms(5), crd_name), DimensionMismatch,
                  "A trajectory was opened with a topology of the wrong size.");
  CHECK_THROWS_AS(FrameIterator bad_file(makeAtoms(6), oe.getTemporaryDirectoryPath() + osc +
                                         "no_such_file.nc"), OpenError,
                  "A missing trajectory file was opened.");
  CHECK_THROWS_AS(FrameIterator bad_pdb(oe.getTemporaryDirectoryPath() + osc + "no_such.pdb",
                                        crd_name), OpenError,
                  "A missing structure file was read.");
  CHECK_THROWS_AS(FrameIterator no_reader(makeAtoms(6), std::unique_ptr<TrajectoryBackend>()),
                  OpenError, "An iterator was built without a trajectory reader.");
  FrameIterator empty_iter(makeAtoms(6), crd_name, FrameSelection(4, 1, 3));
  check(empty_iter.getSelectedFrameCount(), RelationalOperator::EQUAL, 0, "An empty selection "
        "was not accepted.");
  int n_empty = 0;
  for (const CoordinateFrameReader cfr : empty_iter) {
    n_empty += cfr.natom;
  }
  check(n_empty, RelationalOperator::EQUAL, 0, "Iterating over an empty selection visited "
        "frames.");
  CHECK_THROWS_AS(empty_iter.advance(), EndOfSelection, "A frame was read from an empty "
                  "selection.");
  check(empty_iter.describe().find("Selected frames:  0") != std::string::npos, "The "
        "description of an iterator does not report its selection.");

  // A NetCDF file without coordinates is rejected, and the rejected file is closed each time
  const std::string nocrd_name = oe.getTemporaryDirectoryPath() + osc + "no_coordinates.nc";
  const int nocrd_id = ncdfCreate(nocrd_name, PrintSituation::OVERWRITE);
  ncdfDefineDimension(nocrd_id, AncdfVariable::NCFRAME, NC_UNLIMITED, nocrd_name);
  ncdfDefineDimension(nocrd_id, AncdfVariable::NCSPATIAL, 3, nocrd_name);
  ncdfDefineDimension(nocrd_id, AncdfVariable::NCATOM, 6, nocrd_name);
  ncdfEndDefinitions(nocrd_id, nocrd_name);
  ncdfClose(nocrd_id, nocrd_name);
  oe.logFileCreated(nocrd_name);
  CHECK_THROWS_AS(AmberNetcdfTrajectory nocrd_traj(nocrd_name), OpenError, "A NetCDF file "
                  "without a coordinates variable was opened as a trajectory.");
  int nocrd_rejections = 0;
  for (int i = 0; i < 1200; i++) {
    try {
      AmberNetcdfTrajectory nocrd_traj(nocrd_name);
    }
    catch (const OpenError &e) {
      nocrd_rejections++;
    }
  }
  check(nocrd_rejections, RelationalOperator::EQUAL, 1200, "Repeated attempts to open a NetCDF "
        "file without coordinates were not all rejected.");
  const AmberNetcdfTrajectory cdf_after(cdf_name);
  check(cdf_after.getFrameCount(), RelationalOperator::EQUAL, 5, "A valid NetCDF trajectory "
        "could not be read after many rejected files were opened and closed.");

  // A frame that cannot be read leaves the iterator restarted
  const std::string cut_name = oe.getTemporaryDirectoryPath() + osc + "frames_cut.crd";
  writeAmberCrdTrajectory(cut_name, makeFrames(6, 4));
  oe.logFileCreated(cut_name);
  cutCrdLine(cut_name, 6, 16);
  FrameIterator cut_iter(makeAtoms(6), cut_name);
  cut_iter.advance();
  cut_iter.advance();
  check(cut_iter.getFrameIndex(), RelationalOperator::EQUAL, 2, "Frames ahead of a damaged "
        "frame in an Amber .crd trajectory were not read.");
  CHECK_THROWS(cut_iter.advance(), "A frame with a truncated line was read from an Amber .crd "
               "trajectory.");
  check(cut_iter.hasCurrentFrame() == false, "An iterator reports a current frame after "
        "failing to read one.");
  CHECK_THROWS_AS(cut_iter.current(), NoFrameRead, "A frame was obtained from an iterator "
                  "after it failed to read one.");
  const CoordinateFrameReader cut_cfr = cut_iter.advance();
  check(cut_iter.getFrameIndex(), RelationalOperator::EQUAL, 1, "An iterator did not return to "
        "the first frame after failing to read a damaged frame.");
  check(cut_cfr.xcrd[0], RelationalOperator::EQUAL, Approx(0.25).margin(1.0e-3), "The first "
        "frame read after a failed read carries the wrong coordinates.");

  // Several threads stepping through one iterator, each holding the lock while it advances
  section(6);
  FrameIterator shared_iter(makeAtoms(6), cdf_name);
  std::vector<int> thread_a_frames, thread_b_frames;
  auto worker = [&shared_iter](std::vector<int> *frames_seen) {
    bool running = true;
    while (running) {
      std::unique_lock<std::recursive_mutex> lock = shared_iter.acquireLock();
      if (shared_iter.getFrameIndex() == shared_iter.getSelection().getFinalIndex()) {
        running = false;
      }
      else {
        const CoordinateFrameReader cfr = shared_iter.advance();
        const int idx = shared_iter.getFrameIndex();
        if (std::abs(cfr.xcrd[0] - (0.25 * idx)) < 1.0e-4) {
          frames_seen->push_back(idx);
        }
      }
    }
  };
  std::thread thread_a(worker, &thread_a_frames);
  std::thread thread_b(worker, &thread_b_frames);
  thread_a.join();
  thread_b.join();
  std::vector<int> all_frames(thread_a_frames);
  all_frames.insert(all_frames.end(), thread_b_frames.begin(), thread_b_frames.end());
  std::sort(all_frames.begin(), all_frames.end());
  check(all_frames, RelationalOperator::EQUAL, std::vector<int>({ 1, 2, 3, 4, 5 }), "Two threads "
        "sharing an iterator did not see each frame exactly once, with consistent coordinates.");

  // Summary evaluation
  printTestSummary(oe.getVerbosity());
  return countGlobalTestFailures();
}
