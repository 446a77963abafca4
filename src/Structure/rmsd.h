// -*-c++-*-
#ifndef MDSCAN_STRUCTURE_RMSD_H
#define MDSCAN_STRUCTURE_RMSD_H

#include <vector>
#include "copyright.h"
#include "DataTypes/mdscan_vector_types.h"
#include "Trajectory/coordinateframe.h"
#include "Trajectory/frame_iterator.h"
#include "structure_enumerators.h"

namespace mdscan {
namespace structure {

using data_types::double3;
using trajectory::CoordinateFrameReader;
using trajectory::FrameIterator;
using trajectory::no_frame_index;

/// \brief Compute the positional RMSD between two point sets as the square root of the summed
///        squared displacements, divided by the number of points.  This is the reduction used by
///        all RMSD values in this library.  It is not the root of the mean squared displacement,
///        being smaller by a factor of the square root of the number of points.  Empty sets give
///        zero.  A DimensionMismatch is raised if the sets differ in length.
///
/// \param x  The first point set
/// \param y  The second point set
double rmsd(const std::vector<double3> &x, const std::vector<double3> &y);

/// \brief Copy the positions of selected atoms out of a frame.  An OutOfRange error is raised for
///        any index outside the frame.
///
/// \param cfr           The frame
/// \param atom_indices  Indices of the atoms of interest (0-based)
std::vector<double3> extractPointSet(const CoordinateFrameReader &cfr,
                                     const std::vector<int> &atom_indices);

/// \brief Compute the RMSD of selected atoms in every frame of an iterator's selection to the
///        same atoms in a reference frame.  The iterator is restarted and run through its whole
///        selection.  The result has one value per selected frame, in order.
///
/// \param iter             The trajectory
/// \param atom_indices     Indices of the atoms of interest (0-based)
/// \param weights          Weights of the atoms of interest in the alignment (typically masses),
///                         or an empty vector for equal weights
/// \param reference_frame  Position of the reference frame within the selection, counting the
///                         first selected frame as 1.  The first selected frame serves if
///                         no_frame_index is given.  An OutOfRange error is raised if the
///                         selection holds fewer frames.
/// \param alignment        Whether to superimpose each frame on the reference first
std::vector<double> rmsdOverTrajectory(FrameIterator *iter, const std::vector<int> &atom_indices,
                                       const std::vector<double> &weights = std::vector<double>(),
                                       int reference_frame = no_frame_index,
                                       RmsdAlignment alignment = RmsdAlignment::ALIGN);

/// \brief Compute the RMSD of selected atoms between every pair of frames in an iterator's
///        selection.  All selected frames are held in memory at once, and the number of RMSD
///        calculations grows as the square of the number of frames.  The result is a symmetric
///        matrix with zeros on the diagonal, element (i, j) stored at i * F + j for F selected
///        frames.  For each pair i < j, frame j is superimposed on frame i if alignment is
///        requested.
///
/// \param iter          The trajectory
/// \param atom_indices  Indices of the atoms of interest (0-based)
/// \param weights       Weights of the atoms of interest in the alignment, or an empty vector
/// \param alignment     Whether to superimpose frames before comparing them
std::vector<double> rmsdMatrix(FrameIterator *iter, const std::vector<int> &atom_indices,
                               const std::vector<double> &weights = std::vector<double>(),
                               RmsdAlignment alignment = RmsdAlignment::ALIGN);

} // namespace structure
} // namespace mdscan

#endif
