// -*-c++-*-
#ifndef MDSCAN_MATRIX_OPS_H
#define MDSCAN_MATRIX_OPS_H

#include <algorithm>
#include <cmath>
#include <vector>
#include "copyright.h"
#include "Constants/behavior.h"
#include "Constants/scaling.h"
#include "Parsing/parse.h"
#include "Reporting/error_format.h"

namespace mdscan {
namespace math {

using constants::ExceptionResponse;
using parse::realToString;

/// \brief A twin pointer, useful for performing partial-pivoting Gaussian elimination on
///        matrices with rows swapped by reassigning pointers rather than moving data.
template <typename T> struct TwinPointer {
  T* ptr_a;  ///< Pointer to the first stretch of data
  T* ptr_b;  ///< Pointer to the second stretch of data
};

/// \brief Invert a square matrix.  Simple function to avoid the heavy lift of QR decomposition.
///        Matrices in this library are stored in column-major format.
///
/// Overloaded:
///   - Destroy the original matrix in the process of computing the inverse
///   - Preserve the original matrix by working on a copy
///
/// \param matrix   The matrix to invert
/// \param inverse  Pre-allocated space for the inverse, rank x rank elements
/// \param rank     Rank of the matrix
/// \{
template <typename T> void invertSquareMatrix(T* matrix, T* inverse, size_t rank);
template <typename T> void invertSquareMatrix(const T* matrix, T* inverse, size_t rank);
/// \}

/// \brief Check the sizes of arrays submitted to the Jacobi eigensolver against the stated or
///        inferred rank of the matrix.
///
/// \param actual_rank  Rank of the matrix, as inferred from the eigenvalue array if necessary
/// \param rank         Rank of the matrix as stated by the caller (0 to infer it)
/// \param s_a          Size of the input matrix
/// \param s_v          Size of the eigenvector matrix
/// \param policy       Course of action if the arrays are larger than necessary
void checkArraySizeToMatrixRank(size_t actual_rank, size_t rank, size_t s_a, size_t s_v,
                                ExceptionResponse policy);

/// \brief Compute the eigenvalues and eigenvectors of a real, symmetric matrix by the method of
///        Jacobi rotations.  Eigenvectors are returned in the columns of v, so that eigenvector k
///        occupies elements [k * rank, (k + 1) * rank).  Eigenvalues are not sorted.  The input
///        matrix is destroyed in the process.
///
/// Overloaded:
///   - Operate on raw pointers of pre-allocated arrays
///   - Operate on standard template library vectors, inferring the rank if it is not given
///
/// \param a       The matrix to diagonalize
/// \param v       Space for the eigenvectors
/// \param d       Space for the eigenvalues
/// \param rank    Rank of the matrix
/// \param policy  Course of action if the matrix is not symmetric or the iterations do not
///                converge
/// \{
template <typename T>
void jacobiEigensolver(T* a, T* v, T* d, size_t rank,
                       ExceptionResponse policy = ExceptionResponse::WARN);

template <typename T>
void jacobiEigensolver(std::vector<T> *a, std::vector<T> *v, std::vector<T> *d, size_t rank = 0,
                       ExceptionResponse policy = ExceptionResponse::WARN);
/// \}

/// \brief Compute the transformation matrix taking Cartesian coordinates into fractional space
///        (umat) and its inverse (invu), whose columns are the unit cell vectors.
///
/// Overloaded:
///   - Take the box lengths and angles as six separate values
///   - Take the box dimensions as an array of six values
///
/// \param lx     Length of the first box vector
/// \param ly     Length of the second box vector
/// \param lz     Length of the third box vector
/// \param alpha  Angle between the second and third box vectors, in radians
/// \param beta   Angle between the first and third box vectors, in radians
/// \param gamma  Angle between the first and second box vectors, in radians
/// \param dims   Array of the box lengths followed by the box angles
/// \param umat   Transformation matrix into fractional space (filled and returned)
/// \param invu   Transformation matrix back to Cartesian space (filled and returned)
/// \{
template <typename T>
void computeBoxTransform(T lx, T ly, T lz, T alpha, T beta, T gamma, T* umat, T* invu);

template <typename T> void computeBoxTransform(const T* dims, T* umat, T* invu);
/// \}

/// \brief Recover the box lengths and angles from the matrix of unit cell vectors.
///
/// \param lx     Length of the first box vector (returned)
/// \param ly     Length of the second box vector (returned)
/// \param lz     Length of the third box vector (returned)
/// \param alpha  Angle between the second and third box vectors, in radians (returned)
/// \param beta   Angle between the first and third box vectors, in radians (returned)
/// \param gamma  Angle between the first and second box vectors, in radians (returned)
/// \param invu   Transformation matrix back to Cartesian space
template <typename T>
void extractBoxDimensions(T *lx, T *ly, T *lz, T *alpha, T *beta, T *gamma, const T* invu);

} // namespace math
} // namespace mdscan

#include "matrix_ops.tpp"

#endif
