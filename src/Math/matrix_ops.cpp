#include "copyright.h"
#include "matrix_ops.h"

namespace mdscan {
namespace math {

using errors::ErrorKind;

//-------------------------------------------------------------------------------------------------
void checkArraySizeToMatrixRank(const size_t actual_rank, const size_t rank, const size_t s_a,
                                const size_t s_v, const ExceptionResponse policy) {
  if (actual_rank == 0LLU) {
    rtErr(ErrorKind::DIMENSION_MISMATCH, "The rank of the matrix could not be determined, or was "
          "given as zero.", "jacobiEigensolver");
  }
  const size_t n_elem = actual_rank * actual_rank;
  const std::string rank_desc = std::to_string(actual_rank) +
                                ((rank == 0LLU) ? " (taken from the eigenvalue array)" : "");
  if (s_a < n_elem || s_v < n_elem) {
    rtErr(ErrorKind::DIMENSION_MISMATCH, "A matrix of rank " + rank_desc + " needs " +
          std::to_string(n_elem) + " elements, but the input holds " + std::to_string(s_a) +
          " and the eigenvector space holds " + std::to_string(s_v) + ".", "jacobiEigensolver");
  }

  // Arrays with room to spare are legal, but may indicate a mistaken rank
  if (s_a > n_elem || s_v > n_elem) {
    const std::string msg = "Arrays of " + std::to_string(s_a) + " and " + std::to_string(s_v) +
                            " elements exceed what a matrix of rank " + rank_desc + " requires.";
    switch (policy) {
    case ExceptionResponse::DIE:
      rtErr(ErrorKind::DIMENSION_MISMATCH, msg, "jacobiEigensolver");
      break;
    case ExceptionResponse::WARN:
      rtWarn(msg, "jacobiEigensolver");
      break;
    case ExceptionResponse::SILENT:
      break;
    }
  }
}

} // namespace math
} // namespace mdscan
