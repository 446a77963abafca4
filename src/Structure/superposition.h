// -*-c++-*-
#ifndef MDSCAN_SUPERPOSITION_H
#define MDSCAN_SUPERPOSITION_H

#include <vector>
#include "copyright.h"
#include "DataTypes/mdscan_vector_types.h"

namespace mdscan {
namespace structure {

using data_types::double3;

/// \brief Convert a list of interlaced Cartesian coordinates (X, Y, Z, X, Y, Z, ...) into a
///        point set.  A DimensionMismatch is raised if the length is not a multiple of three.
///
/// \param interlaced  The coordinates to convert
std::vector<double3> toPointSet(const std::vector<double> &interlaced);

/// \brief Compute the center of mass of a point set.  Without weights, this is the center of
///        geometry.  A DimensionMismatch is raised if weights are given for a different number of
///        points.
///
/// \param points   The point set
/// \param weights  Weights (typically masses) of each point
double3 centerOfMass(const std::vector<double3> &points,
                     const std::vector<double> &weights = std::vector<double>());

/// \brief Accumulate the 4 x 4 key matrix of the quaternion superposition method for two point
///        sets already centered on their respective centers of mass.  The matrix is symmetric
///        and its eigenvector of smallest eigenvalue is the quaternion of the rotation taking the
///        moving set onto the fixed set.
///
/// \param moving  The centered point set to be rotated
/// \param fixed   The centered point set held in place
std::vector<double> computeKeyMatrix(const std::vector<double3> &moving,
                                     const std::vector<double3> &fixed);

/// \brief Compute the unit quaternion (q0, q1, q2, q3) of the optimal rotation from a key
///        matrix, as the eigenvector of its smallest eigenvalue.
///
/// \param key_matrix  The 4 x 4 key matrix
std::vector<double> computeSuperpositionQuaternion(const std::vector<double> &key_matrix);

/// \brief Convert a unit quaternion into a 3 x 3 rotation matrix, stored in column-major order.
///
/// \param quaternion  The quaternion (q0, q1, q2, q3), q0 being the scalar part
std::vector<double> quaternionToRotationMatrix(const std::vector<double> &quaternion);

/// \brief Apply a rotation matrix to every point of a set.
///
/// \param points  The points to rotate, modified and returned
/// \param umat    The 3 x 3 rotation matrix, in column-major order
void rotateCoordinates(std::vector<double3> *points, const std::vector<double> &umat);

/// \brief Superimpose one point set on another, with the rotation and translation that minimize
///        the sum of squared distances between corresponding points.  No scaling or reflection
///        is applied.  A DimensionMismatch is raised if the sets differ in length, or if weights
///        are given for a different number of points.  Sets with fewer than three non-collinear
///        points do not determine a unique rotation.
///
/// Overloaded:
///   - Return an aligned copy of the moving set
///   - Align the moving set in place
///
/// \param moving   The point set to move
/// \param fixed    The point set held in place
/// \param weights  Weights (typically masses) used in computing the centers of mass
/// \{
std::vector<double3> align(const std::vector<double3> &moving, const std::vector<double3> &fixed,
                           const std::vector<double> &weights = std::vector<double>());

void alignInPlace(std::vector<double3> *moving, const std::vector<double3> &fixed,
                  const std::vector<double> &weights = std::vector<double>());
/// \}

} // namespace structure
} // namespace mdscan

#endif
