#include <cmath>
#include "copyright.h"
#include "Reporting/error_format.h"
#include "rmsd.h"
#include "superposition.h"

namespace mdscan {
namespace structure {

using errors::ErrorKind;

//-------------------------------------------------------------------------------------------------
double rmsd(const std::vector<double3> &x, const std::vector<double3> &y) {
  const size_t npts = x.size();
  if (y.size() != npts) {
    rtErr(ErrorKind::DIMENSION_MISMATCH, "RMSD cannot be computed between sets of " +
          std::to_string(npts) + " and " + std::to_string(y.size()) + " points.", "rmsd");
  }
  if (npts == 0) {
    return 0.0;
  }
  double sum_sq = 0.0;
  for (size_t i = 0; i < npts; i++) {
    const double dx = x[i].x - y[i].x;
    const double dy = x[i].y - y[i].y;
    const double dz = x[i].z - y[i].z;
    sum_sq += (dx * dx) + (dy * dy) + (dz * dz);
  }
  return std::sqrt(sum_sq) / static_cast<double>(npts);
}

//-------------------------------------------------------------------------------------------------
std::vector<double3> extractPointSet(const CoordinateFrameReader &cfr,
                                     const std::vector<int> &atom_indices) {
  const size_t nidx = atom_indices.size();
  std::vector<double3> result(nidx);
  for (size_t i = 0; i < nidx; i++) {
    const int atom_idx = atom_indices[i];
    if (atom_idx < 0 || atom_idx >= cfr.natom) {
      rtErr(ErrorKind::OUT_OF_RANGE, "Atom index " + std::to_string(atom_idx) + " is invalid "
            "for a frame of " + std::to_string(cfr.natom) + " atoms.", "extractPointSet");
    }
    result[i] = { cfr.xcrd[atom_idx], cfr.ycrd[atom_idx], cfr.zcrd[atom_idx] };
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
std::vector<double> rmsdOverTrajectory(FrameIterator *iter, const std::vector<int> &atom_indices,
                                       const std::vector<double> &weights,
                                       const int reference_frame, const RmsdAlignment alignment) {
  if (weights.size() > 0 && weights.size() != atom_indices.size()) {
    rtErr(ErrorKind::DIMENSION_MISMATCH, "There are " + std::to_string(weights.size()) +
          " weights for " + std::to_string(atom_indices.size()) + " atoms.",
          "rmsdOverTrajectory");
  }

  // Hold the iterator for the whole pass so that no other thread moves it in between frames
  std::unique_lock<std::recursive_mutex> guard = iter->acquireLock();
  std::vector<double> result;
  if (reference_frame == no_frame_index && iter->getSelectedFrameCount() == 0) {
    return result;
  }
  std::vector<double3> reference;
  if (reference_frame == no_frame_index) {
    reference = extractPointSet(iter->firstFrame(), atom_indices);
  }
  else {

    // The reference is counted by its position in the selection, not by its raw index
    if (reference_frame < 1 || reference_frame > iter->getSelectedFrameCount()) {
      rtErr(ErrorKind::OUT_OF_RANGE, "Reference frame " + std::to_string(reference_frame) +
            " is not among the " + std::to_string(iter->getSelectedFrameCount()) +
            " selected frames.", "rmsdOverTrajectory");
    }
    iter->restart();
    for (int i = 1; i < reference_frame; i++) {
      iter->advance();
    }
    reference = extractPointSet(iter->advance(), atom_indices);
  }
  result.reserve(iter->getSelectedFrameCount());
  for (const CoordinateFrameReader &cfr : *iter) {
    const std::vector<double3> frame_pts = extractPointSet(cfr, atom_indices);
    switch (alignment) {
    case RmsdAlignment::ALIGN:
      result.push_back(rmsd(align(frame_pts, reference, weights), reference));
      break;
    case RmsdAlignment::NO_ALIGN:
      result.push_back(rmsd(frame_pts, reference));
      break;
    }
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
std::vector<double> rmsdMatrix(FrameIterator *iter, const std::vector<int> &atom_indices,
                               const std::vector<double> &weights,
                               const RmsdAlignment alignment) {
  if (weights.size() > 0 && weights.size() != atom_indices.size()) {
    rtErr(ErrorKind::DIMENSION_MISMATCH, "There are " + std::to_string(weights.size()) +
          " weights for " + std::to_string(atom_indices.size()) + " atoms.", "rmsdMatrix");
  }

  // Read every selected frame.  This pass must go through the iterator in order.
  std::vector<std::vector<double3>> frames;
  {
    std::unique_lock<std::recursive_mutex> guard = iter->acquireLock();
    frames.reserve(iter->getSelectedFrameCount());
    for (const CoordinateFrameReader &cfr : *iter) {
      frames.push_back(extractPointSet(cfr, atom_indices));
    }
  }

  // Compare every pair of frames
  const size_t nframe = frames.size();
  std::vector<double> result(nframe * nframe, 0.0);
  for (size_t i = 0; i < nframe; i++) {
    for (size_t j = i + 1; j < nframe; j++) {
      double value = 0.0;
      switch (alignment) {
      case RmsdAlignment::ALIGN:
        value = rmsd(align(frames[j], frames[i], weights), frames[i]);
        break;
      case RmsdAlignment::NO_ALIGN:
        value = rmsd(frames[j], frames[i]);
        break;
      }
      result[(i * nframe) + j] = value;
      result[(j * nframe) + i] = value;
    }
  }
  return result;
}

} // namespace structure
} // namespace mdscan
