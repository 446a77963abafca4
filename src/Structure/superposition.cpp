#include "copyright.h"
#include "Math/matrix_ops.h"
#include "Reporting/error_format.h"
#include "superposition.h"

namespace mdscan {
namespace structure {

using errors::ErrorKind;
using math::jacobiEigensolver;

//-------------------------------------------------------------------------------------------------
std::vector<double3> toPointSet(const std::vector<double> &interlaced) {
  const size_t nval = interlaced.size();
  if (nval % 3 != 0) {
    rtErr(ErrorKind::DIMENSION_MISMATCH, "A list of " + std::to_string(nval) + " values cannot "
          "be read as three-dimensional points.", "toPointSet");
  }
  const size_t npts = nval / 3;
  std::vector<double3> result(npts);
  for (size_t i = 0; i < npts; i++) {
    result[i] = { interlaced[(3 * i)], interlaced[(3 * i) + 1], interlaced[(3 * i) + 2] };
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
double3 centerOfMass(const std::vector<double3> &points, const std::vector<double> &weights) {
  const size_t npts = points.size();
  const bool use_weights = (weights.size() > 0);
  if (use_weights && weights.size() != npts) {
    rtErr(ErrorKind::DIMENSION_MISMATCH, "There are " + std::to_string(weights.size()) +
          " weights for " + std::to_string(npts) + " points.", "centerOfMass");
  }
  double3 result = { 0.0, 0.0, 0.0 };
  if (npts == 0) {
    return result;
  }
  double total_weight = 0.0;
  for (size_t i = 0; i < npts; i++) {
    const double wt = (use_weights) ? weights[i] : 1.0;
    result.x += wt * points[i].x;
    result.y += wt * points[i].y;
    result.z += wt * points[i].z;
    total_weight += wt;
  }
  if (total_weight == 0.0) {
    rtErr("The weights of " + std::to_string(npts) + " points sum to zero.", "centerOfMass");
  }
  const double inv_weight = 1.0 / total_weight;
  result.x *= inv_weight;
  result.y *= inv_weight;
  result.z *= inv_weight;
  return result;
}

//-------------------------------------------------------------------------------------------------
std::vector<double> computeKeyMatrix(const std::vector<double3> &moving,
                                     const std::vector<double3> &fixed) {
  const size_t npts = moving.size();
  if (fixed.size() != npts) {
    rtErr(ErrorKind::DIMENSION_MISMATCH, "Point sets of " + std::to_string(npts) + " and " +
          std::to_string(fixed.size()) + " points cannot be superimposed.", "computeKeyMatrix");
  }
  double q11 = 0.0, q12 = 0.0, q13 = 0.0, q14 = 0.0, q22 = 0.0;
  double q23 = 0.0, q24 = 0.0, q33 = 0.0, q34 = 0.0, q44 = 0.0;
  for (size_t i = 0; i < npts; i++) {
    const double xm1 = fixed[i].x - moving[i].x;
    const double xm2 = fixed[i].y - moving[i].y;
    const double xm3 = fixed[i].z - moving[i].z;
    const double xp1 = fixed[i].x + moving[i].x;
    const double xp2 = fixed[i].y + moving[i].y;
    const double xp3 = fixed[i].z + moving[i].z;
    q11 += (xm1 * xm1) + (xm2 * xm2) + (xm3 * xm3);
    q12 += (xp2 * xm3) - (xm2 * xp3);
    q13 += (xm1 * xp3) - (xp1 * xm3);
    q14 += (xp1 * xm2) - (xm1 * xp2);
    q22 += (xp2 * xp2) + (xp3 * xp3) + (xm1 * xm1);
    q23 += (xm1 * xm2) - (xp1 * xp2);
    q24 += (xm1 * xm3) - (xp1 * xp3);
    q33 += (xp1 * xp1) + (xp3 * xp3) + (xm2 * xm2);
    q34 += (xm2 * xm3) - (xp2 * xp3);
    q44 += (xp1 * xp1) + (xp2 * xp2) + (xm3 * xm3);
  }

  // The matrix is symmetric, so row- and column-major orders coincide.
  std::vector<double> result(16);
  result[ 0] = q11;
  result[ 1] = q12;
  result[ 2] = q13;
  result[ 3] = q14;
  result[ 5] = q22;
  result[ 6] = q23;
  result[ 7] = q24;
  result[10] = q33;
  result[11] = q34;
  result[15] = q44;
  result[ 4] = result[ 1];
  result[ 8] = result[ 2];
  result[12] = result[ 3];
  result[ 9] = result[ 6];
  result[13] = result[ 7];
  result[14] = result[11];
  return result;
}

//-------------------------------------------------------------------------------------------------
std::vector<double> computeSuperpositionQuaternion(const std::vector<double> &key_matrix) {
  if (key_matrix.size() != 16) {
    rtErr(ErrorKind::DIMENSION_MISMATCH, "A key matrix must have 16 elements (" +
          std::to_string(key_matrix.size()) + " given).", "computeSuperpositionQuaternion");
  }
  std::vector<double> amat(key_matrix), vmat(16, 0.0), eigval(4, 0.0);
  jacobiEigensolver(&amat, &vmat, &eigval, 4);
  int min_eig_loc = 0;
  for (int i = 1; i < 4; i++) {
    if (eigval[i] < eigval[min_eig_loc]) {
      min_eig_loc = i;
    }
  }
  return std::vector<double>(vmat.begin() + (4 * min_eig_loc),
                             vmat.begin() + (4 * (min_eig_loc + 1)));
}

//-------------------------------------------------------------------------------------------------
std::vector<double> quaternionToRotationMatrix(const std::vector<double> &quaternion) {
  if (quaternion.size() != 4) {
    rtErr(ErrorKind::DIMENSION_MISMATCH, "A quaternion must have four elements (" +
          std::to_string(quaternion.size()) + " given).", "quaternionToRotationMatrix");
  }
  const double q0 = quaternion[0];
  const double q1 = quaternion[1];
  const double q2 = quaternion[2];
  const double q3 = quaternion[3];
  std::vector<double> umat(9);
  umat[0] = (q0 * q0) + (q1 * q1) - (q2 * q2) - (q3 * q3);
  umat[3] = 2.0 * ((q1 * q2) + (q0 * q3));
  umat[6] = 2.0 * ((q1 * q3) - (q0 * q2));
  umat[1] = 2.0 * ((q1 * q2) - (q0 * q3));
  umat[4] = (q0 * q0) + (q2 * q2) - (q1 * q1) - (q3 * q3);
  umat[7] = 2.0 * ((q2 * q3) + (q0 * q1));
  umat[2] = 2.0 * ((q1 * q3) + (q0 * q2));
  umat[5] = 2.0 * ((q2 * q3) - (q0 * q1));
  umat[8] = (q0 * q0) + (q3 * q3) - (q1 * q1) - (q2 * q2);
  return umat;
}

//-------------------------------------------------------------------------------------------------
void rotateCoordinates(std::vector<double3> *points, const std::vector<double> &umat) {
  if (umat.size() != 9) {
    rtErr(ErrorKind::DIMENSION_MISMATCH, "A rotation matrix must have nine elements (" +
          std::to_string(umat.size()) + " given).", "rotateCoordinates");
  }
  double3* pts_ptr = points->data();
  const size_t npts = points->size();
  for (size_t i = 0; i < npts; i++) {
    const double px = pts_ptr[i].x;
    const double py = pts_ptr[i].y;
    const double pz = pts_ptr[i].z;
    pts_ptr[i].x = (umat[0] * px) + (umat[3] * py) + (umat[6] * pz);
    pts_ptr[i].y = (umat[1] * px) + (umat[4] * py) + (umat[7] * pz);
    pts_ptr[i].z = (umat[2] * px) + (umat[5] * py) + (umat[8] * pz);
  }
}

//-------------------------------------------------------------------------------------------------
std::vector<double3> align(const std::vector<double3> &moving, const std::vector<double3> &fixed,
                           const std::vector<double> &weights) {
  std::vector<double3> result(moving);
  alignInPlace(&result, fixed, weights);
  return result;
}

//-------------------------------------------------------------------------------------------------
void alignInPlace(std::vector<double3> *moving, const std::vector<double3> &fixed,
                  const std::vector<double> &weights) {
  const size_t npts = moving->size();
  if (fixed.size() != npts) {
    rtErr(ErrorKind::DIMENSION_MISMATCH, "A set of " + std::to_string(npts) + " points cannot "
          "be aligned to a set of " + std::to_string(fixed.size()) + " points.", "alignInPlace");
  }

  // Center both sets on their own centers of mass, remembering where the fixed set was
  const double3 moving_com = centerOfMass(*moving, weights);
  const double3 fixed_com = centerOfMass(fixed, weights);
  std::vector<double3> centered_fixed(fixed);
  double3* mov_ptr = moving->data();
  for (size_t i = 0; i < npts; i++) {
    mov_ptr[i].x -= moving_com.x;
    mov_ptr[i].y -= moving_com.y;
    mov_ptr[i].z -= moving_com.z;
    centered_fixed[i].x -= fixed_com.x;
    centered_fixed[i].y -= fixed_com.y;
    centered_fixed[i].z -= fixed_com.z;
  }

  // Rotate, then move the result onto the fixed set's center of mass
  const std::vector<double> qtrn =
    computeSuperpositionQuaternion(computeKeyMatrix(*moving, centered_fixed));
  rotateCoordinates(moving, quaternionToRotationMatrix(qtrn));
  for (size_t i = 0; i < npts; i++) {
    mov_ptr[i].x += fixed_com.x;
    mov_ptr[i].y += fixed_com.y;
    mov_ptr[i].z += fixed_com.z;
  }
}

} // namespace structure
} // namespace mdscan
