#include <algorithm>
#include <cmath>
#include <vector>
#include "copyright.h"
#include "../../src/Constants/behavior.h"
#include "../../src/Constants/symbol_values.h"
#include "../../src/Math/matrix_ops.h"
#include "../../src/Math/summation.h"
#include "../../src/Random/random.h"
#include "../../src/UnitTesting/approx.h"
#include "../../src/UnitTesting/unit_test.h"

using mdscan::constants::ExceptionResponse;
using mdscan::random::Ran2Generator;
using mdscan::symbols::pi;
using namespace mdscan::math;
using namespace mdscan::testing;

//-------------------------------------------------------------------------------------------------
// Multiply two square matrices, both in column-major format.
//
// Arguments:
//   a:     The left-hand matrix
//   b:     The right-hand matrix
//   rank:  Rank of both matrices
//-------------------------------------------------------------------------------------------------
std::vector<double> matrixProduct(const std::vector<double> &a, const std::vector<double> &b,
                                  const int rank) {
  std::vector<double> result(rank * rank, 0.0);
  for (int i = 0; i < rank; i++) {
    for (int j = 0; j < rank; j++) {
      double dij = 0.0;
      for (int k = 0; k < rank; k++) {
        dij += a[(k * rank) + i] * b[(j * rank) + k];
      }
      result[(j * rank) + i] = dij;
    }
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
// Make a random symmetric matrix.
//
// Arguments:
//   rank:  Rank of the matrix
//   prng:  Source of random numbers
//-------------------------------------------------------------------------------------------------
std::vector<double> randomSymmetricMatrix(const int rank, Ran2Generator *prng) {
  std::vector<double> result(rank * rank);
  for (int i = 0; i < rank; i++) {
    for (int j = 0; j <= i; j++) {
      const double r = prng->gaussianRandomNumber();
      result[(j * rank) + i] = r;
      result[(i * rank) + j] = r;
    }
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
  section("Summation");

  // Section 2
  section("Eigenvalue problems");

  // Section 3
  section("Matrix inversion");

  // Section 4
  section("Unit cell transformations");

  // Sums of integers and reals
  section(1);
  const std::vector<int> ivec = { 1, 2, 3, 4, 5, 6, 7, 8, 9, 10 };
  check(sum<int>(ivec), RelationalOperator::EQUAL, 55, "The sum of the first ten integers is "
        "incorrect.");
  const std::vector<double> dvec = { 0.25, -1.5, 3.125 };
  check(sum<double>(dvec), RelationalOperator::EQUAL, Approx(1.875).margin(1.0e-12), "The sum "
        "of a short vector of real numbers is incorrect.");
  check(sum<double>(std::vector<double>()), RelationalOperator::EQUAL, 0.0, "The sum of an "
        "empty vector is not zero.");

  // Eigenvalues and eigenvectors of symmetric matrices
  section(2);
  for (int rank = 2; rank <= 6; rank++) {
    const std::vector<double> amat = randomSymmetricMatrix(rank, &prng);
    std::vector<double> acopy(amat), evec(rank * rank), eval(rank);
    jacobiEigensolver(&acopy, &evec, &eval, rank, ExceptionResponse::DIE);
    double trace = 0.0;
    for (int i = 0; i < rank; i++) {
      trace += amat[(i * rank) + i];
    }
    check(sum<double>(eval), RelationalOperator::EQUAL, Approx(trace).margin(1.0e-8), "The sum "
          "of eigenvalues of a rank " + std::to_string(rank) + " matrix does not equal its "
          "trace.");
    const std::vector<double> av = matrixProduct(amat, evec, rank);
    std::vector<double> lv(rank * rank);
    for (int k = 0; k < rank; k++) {
      for (int i = 0; i < rank; i++) {
        lv[(k * rank) + i] = eval[k] * evec[(k * rank) + i];
      }
    }
    check(av, RelationalOperator::EQUAL, Approx(lv).margin(1.0e-8), "Eigenvectors of a rank " +
          std::to_string(rank) + " matrix do not satisfy A v = lambda v.");
    double max_offdiag = 0.0;
    for (int i = 0; i < rank; i++) {
      for (int j = 0; j < rank; j++) {
        double vtv_ij = 0.0;
        for (int k = 0; k < rank; k++) {
          vtv_ij += evec[(i * rank) + k] * evec[(j * rank) + k];
        }
        const double target = (i == j) ? 1.0 : 0.0;
        max_offdiag = std::max(max_offdiag, fabs(vtv_ij - target));
      }
    }
    check(max_offdiag, RelationalOperator::LESS_THAN, 1.0e-8, "Eigenvectors of a rank " +
          std::to_string(rank) + " matrix are not orthonormal.");
  }
  std::vector<double> diag_mat = { 3.0, 0.0, 0.0, 0.0, -1.0, 0.0, 0.0, 0.0, 7.5 };
  std::vector<double> diag_vec(9), diag_val(3);
  jacobiEigensolver(&diag_mat, &diag_vec, &diag_val);
  check(diag_val, RelationalOperator::EQUAL, Approx(std::vector<double>({ 3.0, -1.0, 7.5 })),
        "Eigenvalues of a diagonal matrix are not its diagonal elements.");
  std::vector<double> asym_mat = { 1.0, 2.0, 0.0, 1.0 };
  std::vector<double> asym_vec(4), asym_val(2);
  CHECK_THROWS(jacobiEigensolver(&asym_mat, &asym_vec, &asym_val, 2, ExceptionResponse::DIE),
               "A matrix that is not symmetric was diagonalized.");
  std::vector<double> short_mat = { 1.0, 2.0, 2.0 };
  std::vector<double> short_vec(4), short_val(2);
  CHECK_THROWS(jacobiEigensolver(&short_mat, &short_vec, &short_val, 2, ExceptionResponse::DIE),
               "A matrix with too few elements for its rank was diagonalized.");

  // Inverses of general matrices
  section(3);
  const std::vector<double> identity3 = { 1.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 1.0 };
  const std::vector<double> gmat = { 4.0, 2.0, 0.5, 1.0, 3.0, -1.0, 0.0, 1.5, 2.0 };
  std::vector<double> ginv(9);
  invertSquareMatrix(gmat.data(), ginv.data(), 3);
  check(matrixProduct(gmat, ginv, 3), RelationalOperator::EQUAL,
        Approx(identity3).margin(1.0e-10),
        "The product of a matrix and its inverse is not the identity.");
  const std::vector<double> sing_mat = { 1.0, 2.0, 3.0, 0.0, 0.0, 0.0, 0.0, 1.0, 1.0 };
  std::vector<double> sing_inv(9);
  CHECK_THROWS(invertSquareMatrix(sing_mat.data(), sing_inv.data(), 3), "A singular matrix was "
               "inverted.");

  // Box transformations for orthorhombic and triclinic cells
  section(4);
  std::vector<double> umat(9), invu(9);
  computeBoxTransform(30.0, 40.0, 50.0, 0.5 * pi, 0.5 * pi, 0.5 * pi, umat.data(), invu.data());
  check(invu, RelationalOperator::EQUAL,
        Approx(std::vector<double>({ 30.0, 0.0, 0.0, 0.0, 40.0, 0.0, 0.0, 0.0,
                                     50.0 })).margin(1.0e-10),
        "The cell vectors of an orthorhombic box are incorrect.");
  check(umat, RelationalOperator::EQUAL,
        Approx(std::vector<double>({ 1.0 / 30.0, 0.0, 0.0, 0.0, 0.025, 0.0, 0.0, 0.0,
                                     0.02 })).margin(1.0e-10),
        "The fractional transformation of an orthorhombic box is incorrect.");
  const double tric_angle = 109.4712206 * pi / 180.0;
  const std::vector<double> tric_dims = { 35.0, 35.0, 35.0, tric_angle, tric_angle, tric_angle };
  computeBoxTransform(tric_dims.data(), umat.data(), invu.data());
  check(matrixProduct(umat, invu, 3), RelationalOperator::EQUAL,
        Approx(identity3).margin(1.0e-10),
        "The fractional and Cartesian transformations of a triclinic box are not inverses.");
  double lx, ly, lz, alpha, beta, gamma;
  extractBoxDimensions(&lx, &ly, &lz, &alpha, &beta, &gamma, invu.data());
  check(std::vector<double>({ lx, ly, lz, alpha, beta, gamma }), RelationalOperator::EQUAL,
        Approx(tric_dims).margin(1.0e-8), "Box dimensions recovered from the cell vectors of a "
        "triclinic box are incorrect.");
  const std::vector<double> mono_dims = { 20.0, 25.0, 32.0, 0.5 * pi, 1.9, 0.5 * pi };
  computeBoxTransform(mono_dims.data(), umat.data(), invu.data());
  extractBoxDimensions(&lx, &ly, &lz, &alpha, &beta, &gamma, invu.data());
  check(std::vector<double>({ lx, ly, lz, alpha, beta, gamma }), RelationalOperator::EQUAL,
        Approx(mono_dims).margin(1.0e-8), "Box dimensions recovered from the cell vectors of a "
        "monoclinic box are incorrect.");

  // Summary evaluation
  printTestSummary(oe.getVerbosity());
  return countGlobalTestFailures();
}
