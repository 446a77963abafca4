#include <algorithm>
#include <cmath>
#include <vector>
#include "copyright.h"
#include "../../src/DataTypes/mdscan_vector_types.h"
#include "../../src/Math/matrix_ops.h"
#include "../../src/Random/random.h"
#include "../../src/Reporting/error_format.h"
#include "../../src/Structure/rmsd.h"
#include "../../src/Structure/superposition.h"
#include "../../src/UnitTesting/approx.h"
#include "../../src/UnitTesting/unit_test.h"

using mdscan::data_types::double3;
using mdscan::errors::DimensionMismatch;
using mdscan::math::jacobiEigensolver;
using mdscan::random::Ran2Generator;
using mdscan::random::randomRotationMatrix;
using namespace mdscan::structure;
using namespace mdscan::testing;

//-------------------------------------------------------------------------------------------------
// Make a cloud of points with normally distributed coordinates.
//
// Arguments:
//   npts:   The number of points
//   scale:  Standard deviation of each coordinate
//   prng:   Source of random numbers
//-------------------------------------------------------------------------------------------------
std::vector<double3> randomPoints(const int npts, const double scale, Ran2Generator *prng) {
  std::vector<double3> result(npts);
  for (int i = 0; i < npts; i++) {
    result[i].x = scale * prng->gaussianRandomNumber();
    result[i].y = scale * prng->gaussianRandomNumber();
    result[i].z = scale * prng->gaussianRandomNumber();
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
// Flatten a set of points into a list of coordinates, to compare with Approx.
//
// Arguments:
//   pts:  The points to flatten
//-------------------------------------------------------------------------------------------------
std::vector<double> flatten(const std::vector<double3> &pts) {
  std::vector<double> result;
  result.reserve(3 * pts.size());
  for (size_t i = 0; i < pts.size(); i++) {
    result.push_back(pts[i].x);
    result.push_back(pts[i].y);
    result.push_back(pts[i].z);
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
// Rotate a set of points and then translate it.
//
// Arguments:
//   pts:    The points to move
//   umat:   Rotation matrix, column-major
//   shift:  Translation applied after the rotation
//-------------------------------------------------------------------------------------------------
std::vector<double3> moveRigidly(const std::vector<double3> &pts, const std::vector<double> &umat,
                                 const double3 shift) {
  std::vector<double3> result(pts);
  rotateCoordinates(&result, umat);
  for (size_t i = 0; i < result.size(); i++) {
    result[i].x += shift.x;
    result[i].y += shift.y;
    result[i].z += shift.z;
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
// main
//-------------------------------------------------------------------------------------------------
int main(const int argc, const char* argv[]) {

  // Some baseline initialization
  TestEnvironment oe(argc, argv);
  Ran2Generator prng(oe.getRandomSeed());

  // Section 1
  section("Centers of mass");

  // Section 2
  section("Rotation matrices from quaternions");

  // Section 3
  section("Optimal superposition");

  // Section 4
  section("RMSD of point sets");

  // Centers of mass, with and without weights
  section(1);
  const std::vector<double3> square = { { 0.0, 0.0, 0.0 }, { 2.0, 0.0, 0.0 },
                                        { 2.0, 2.0, 0.0 }, { 0.0, 2.0, 0.0 } };
  const double3 sq_com = centerOfMass(square);
  check(std::vector<double>({ sq_com.x, sq_com.y, sq_com.z }), RelationalOperator::EQUAL,
        Approx(std::vector<double>({ 1.0, 1.0, 0.0 })).margin(1.0e-12), "The center of a square "
        "of points is incorrect.");
  const double3 sq_wcom = centerOfMass(square, { 3.0, 1.0, 0.0, 0.0 });
  check(std::vector<double>({ sq_wcom.x, sq_wcom.y, sq_wcom.z }), RelationalOperator::EQUAL,
        Approx(std::vector<double>({ 0.5, 0.0, 0.0 })).margin(1.0e-12), "The weighted center of "
        "a square of points is incorrect.");
  const double3 empty_com = centerOfMass(std::vector<double3>());
  check(std::abs(empty_com.x) + std::abs(empty_com.y) + std::abs(empty_com.z),
        RelationalOperator::EQUAL, 0.0, "The center of an empty set of points is not the "
        "origin.");
  CHECK_THROWS_AS(centerOfMass(square, { 1.0, 1.0 }), DimensionMismatch, "A center of mass was "
                  "computed with too few weights.");
  CHECK_THROWS(centerOfMass(square, { 0.0, 0.0, 0.0, 0.0 }), "A center of mass was computed "
               "with weights summing to zero.");
  CHECK_THROWS_AS(toPointSet(std::vector<double>(7, 1.0)), DimensionMismatch, "Seven values were "
                  "read as three-dimensional points.");
  const std::vector<double3> pts_from_list = toPointSet({ 1.0, 2.0, 3.0, 4.0, 5.0, 6.0 });
  check(flatten(pts_from_list), RelationalOperator::EQUAL,
        Approx(std::vector<double>({ 1.0, 2.0, 3.0, 4.0, 5.0, 6.0 })).margin(1.0e-12), "A list "
        "of coordinates was not read as points in x, y, z order.");

  // Rotation matrices
  section(2);
  const std::vector<double> identity = { 1.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 1.0 };
  check(quaternionToRotationMatrix({ 1.0, 0.0, 0.0, 0.0 }), RelationalOperator::EQUAL,
        Approx(identity).margin(1.0e-12), "The unit quaternion does not produce the identity "
        "matrix.");
  const double hsqrt = std::sqrt(0.5);
  std::vector<double3> x_axis = { { 1.0, 0.0, 0.0 } };
  rotateCoordinates(&x_axis, quaternionToRotationMatrix({ hsqrt, 0.0, 0.0, hsqrt }));
  check(flatten(x_axis), RelationalOperator::EQUAL,
        Approx(std::vector<double>({ 0.0, -1.0, 0.0 })).margin(1.0e-12), "A quarter turn about "
        "the Z axis does not move the X axis as expected.");
  bool all_proper = true;
  for (int trial = 0; trial < 16; trial++) {
    std::vector<double> qtrn(4);
    double qnorm = 0.0;
    for (int i = 0; i < 4; i++) {
      qtrn[i] = prng.gaussianRandomNumber();
      qnorm += qtrn[i] * qtrn[i];
    }
    qnorm = std::sqrt(qnorm);
    for (int i = 0; i < 4; i++) {
      qtrn[i] /= qnorm;
    }
    const std::vector<double> u = quaternionToRotationMatrix(qtrn);
    const double det = (u[0] * ((u[4] * u[8]) - (u[5] * u[7]))) -
                       (u[3] * ((u[1] * u[8]) - (u[2] * u[7]))) +
                       (u[6] * ((u[1] * u[5]) - (u[2] * u[4])));
    double col_dev = 0.0;
    for (int i = 0; i < 3; i++) {
      for (int j = 0; j < 3; j++) {
        double dp = 0.0;
        for (int k = 0; k < 3; k++) {
          dp += u[(3 * i) + k] * u[(3 * j) + k];
        }
        col_dev += std::abs(dp - ((i == j) ? 1.0 : 0.0));
      }
    }
    all_proper = (all_proper && std::abs(det - 1.0) < 1.0e-10 && col_dev < 1.0e-10);
  }
  check(all_proper, "Rotation matrices built from unit quaternions are not proper rotations.");
  CHECK_THROWS_AS(quaternionToRotationMatrix({ 1.0, 0.0, 0.0 }), DimensionMismatch, "A rotation "
                  "matrix was built from a quaternion of three elements.");
  std::vector<double3> rot_target = square;
  const std::vector<double> short_umat(4, 1.0);
  CHECK_THROWS_AS(rotateCoordinates(&rot_target, short_umat), DimensionMismatch, "Points were "
                  "rotated by a matrix of the wrong size.");

  // Superposition of rigidly moved point sets
  section(3);
  const std::vector<double3> cloud = randomPoints(24, 5.0, &prng);
  int n_recovered = 0;
  int n_exact = 0;
  for (int trial = 0; trial < 8; trial++) {
    const std::vector<double> umat = randomRotationMatrix(&prng);
    const double3 shift = { 10.0 * prng.gaussianRandomNumber(), 10.0 * prng.gaussianRandomNumber(),
                            10.0 * prng.gaussianRandomNumber() };
    const std::vector<double3> moved = moveRigidly(cloud, umat, shift);
    const std::vector<double3> restored = align(moved, cloud);
    if (Approx(flatten(cloud)).margin(1.0e-8).test(flatten(restored))) {
      n_recovered++;
    }
    if (rmsd(restored, cloud) < 1.0e-9) {
      n_exact++;
    }
  }
  check(n_recovered, RelationalOperator::EQUAL, 8, "Aligning a rigidly moved point set back onto "
        "the original did not recover the original coordinates.");
  check(n_exact, RelationalOperator::EQUAL, 8, "The RMSD between a point set and a rigidly moved "
        "copy is not zero after alignment.");
  check(flatten(align(cloud, cloud)), RelationalOperator::EQUAL,
        Approx(flatten(cloud)).margin(1.0e-10), "Aligning a point set onto itself changed it.");

  // The aligned RMSD is the optimum: the smallest eigenvalue of the key matrix gives the residual
  std::vector<double3> noisy = moveRigidly(cloud, randomRotationMatrix(&prng), { 1.0, 2.0, 3.0 });
  for (size_t i = 0; i < noisy.size(); i++) {
    noisy[i].x += 0.3 * prng.gaussianRandomNumber();
    noisy[i].y += 0.3 * prng.gaussianRandomNumber();
    noisy[i].z += 0.3 * prng.gaussianRandomNumber();
  }
  const std::vector<double3> noisy_fit = align(noisy, cloud);
  const double fit_rmsd = rmsd(noisy_fit, cloud);
  std::vector<double3> ctr_noisy(noisy), ctr_cloud(cloud);
  const double3 noisy_com = centerOfMass(noisy);
  const double3 cloud_com = centerOfMass(cloud);
  for (size_t i = 0; i < noisy.size(); i++) {
    ctr_noisy[i] = { noisy[i].x - noisy_com.x, noisy[i].y - noisy_com.y,
                     noisy[i].z - noisy_com.z };
    ctr_cloud[i] = { cloud[i].x - cloud_com.x, cloud[i].y - cloud_com.y,
                     cloud[i].z - cloud_com.z };
  }
  std::vector<double> kmat = computeKeyMatrix(ctr_noisy, ctr_cloud);
  std::vector<double> kvec(16), kval(4);
  jacobiEigensolver(&kmat, &kvec, &kval, 4);
  const double min_eig = std::min(std::min(kval[0], kval[1]), std::min(kval[2], kval[3]));
  const double eig_rmsd = std::sqrt(std::max(min_eig, 0.0)) / static_cast<double>(noisy.size());
  check(fit_rmsd, RelationalOperator::EQUAL, Approx(eig_rmsd).margin(1.0e-8),
        "The RMSD after alignment does not match the residual given by the key matrix.");
  bool fit_is_optimal = true;
  for (int trial = 0; trial < 8; trial++) {
    std::vector<double3> other = noisy_fit;
    const double3 fit_com = centerOfMass(noisy_fit);
    for (size_t i = 0; i < other.size(); i++) {
      other[i] = { other[i].x - fit_com.x, other[i].y - fit_com.y, other[i].z - fit_com.z };
    }
    other = moveRigidly(other, randomRotationMatrix(&prng), fit_com);
    fit_is_optimal = (fit_is_optimal && rmsd(other, cloud) >= fit_rmsd - 1.0e-12);
  }
  check(fit_is_optimal, "A random rotation of the aligned point set achieved a lower RMSD than "
        "the optimal superposition.");
  check(rmsd(noisy, cloud), RelationalOperator::GREATER_THAN, fit_rmsd, "The RMSD of a point set "
        "before alignment is not greater than after alignment.");

  // Weighted superposition still recovers a rigid motion exactly
  std::vector<double> weights(cloud.size());
  for (size_t i = 0; i < weights.size(); i++) {
    weights[i] = (i % 3 == 0) ? 12.011 : 1.008;
  }
  const std::vector<double3> w_moved = moveRigidly(cloud, randomRotationMatrix(&prng),
                                                   { -4.0, 0.5, 7.0 });
  check(flatten(align(w_moved, cloud, weights)), RelationalOperator::EQUAL,
        Approx(flatten(cloud)).margin(1.0e-8), "Mass-weighted alignment of a rigidly moved point "
        "set did not recover the original coordinates.");
  std::vector<double3> in_place = w_moved;
  alignInPlace(&in_place, cloud, weights);
  check(rmsd(in_place, cloud), RelationalOperator::LESS_THAN, 1.0e-9, "Alignment in place did "
        "not superimpose the point sets.");
  CHECK_THROWS_AS(align(cloud, square), DimensionMismatch, "Point sets of different sizes were "
                  "aligned.");

  // RMSD of point sets
  section(4);
  const std::vector<double3> shifted_square = { { 0.0, 0.0, 1.0 }, { 2.0, 0.0, 1.0 },
                                                { 2.0, 2.0, 1.0 }, { 0.0, 2.0, 1.0 } };
  check(rmsd(square, shifted_square), RelationalOperator::EQUAL, Approx(0.5).margin(1.0e-12),
        "The RMSD between two squares one unit apart is incorrect.");
  check(rmsd(square, square), RelationalOperator::EQUAL, 0.0, "The RMSD of a point set with "
        "itself is not zero.");
  check(rmsd(std::vector<double3>(), std::vector<double3>()), RelationalOperator::EQUAL, 0.0,
        "The RMSD of two empty point sets is not zero.");
  check(rmsd(square, shifted_square), RelationalOperator::EQUAL, rmsd(shifted_square, square),
        "The RMSD is not symmetric in its arguments.");
  CHECK_THROWS_AS(rmsd(square, cloud), DimensionMismatch, "An RMSD was computed between point "
                  "sets of different sizes.");

  // Summary evaluation
  printTestSummary(oe.getVerbosity());
  return countGlobalTestFailures();
}
