// -*-c++-*-
#include "copyright.h"

namespace mdscan {
namespace math {

//-------------------------------------------------------------------------------------------------
template <typename T> void invertSquareMatrix(T* matrix, T* inverse, const size_t rank) {
  if (rank == 0LLU) {
    return;
  }

  // Pair each row of the input with a row of the output, which begins as the identity matrix.
  // Row swaps then exchange pointers rather than data.
  std::vector<TwinPointer<T>> s(rank);
  for (size_t i = 0; i < rank; i++) {
    s[i].ptr_a = &matrix[i * rank];
    s[i].ptr_b = &inverse[i * rank];
    for (size_t j = 0; j < rank; j++) {
      s[i].ptr_b[j] = 0.0;
    }
    s[i].ptr_b[i] = 1.0;
  }

  // Forward elimination with partial pivoting
  for (size_t i = 0; i < rank; i++) {
    size_t pivot_row = i;
    T pivot_val = fabs(s[i].ptr_a[i]);
    for (size_t j = i + 1; j < rank; j++) {
      if (fabs(s[j].ptr_a[i]) > pivot_val) {
        pivot_val = fabs(s[j].ptr_a[i]);
        pivot_row = j;
      }
    }
    if (pivot_val < constants::verytiny) {
      rtErr("A matrix of rank " + std::to_string(rank) + " is singular and cannot be inverted.",
            "invertSquareMatrix");
    }
    std::swap(s[i], s[pivot_row]);
    const T diag_val = s[i].ptr_a[i];
    for (size_t j = i + 1; j < rank; j++) {
      const T factor = s[j].ptr_a[i] / diag_val;
      if (factor == 0.0) {
        continue;
      }
      for (size_t k = 0; k < rank; k++) {
        s[j].ptr_a[k] -= factor * s[i].ptr_a[k];
        s[j].ptr_b[k] -= factor * s[i].ptr_b[k];
      }
    }
  }

  // Back substitution, leaving the identity in place of the original matrix
  for (size_t i = rank; i > 0; i--) {
    const size_t ir = i - 1;
    const T inv_diag = 1.0 / s[ir].ptr_a[ir];
    for (size_t k = 0; k < rank; k++) {
      s[ir].ptr_b[k] *= inv_diag;
    }
    s[ir].ptr_a[ir] = 1.0;
    for (size_t j = 0; j < ir; j++) {
      const T factor = s[j].ptr_a[ir];
      s[j].ptr_a[ir] = 0.0;
      for (size_t k = 0; k < rank; k++) {
        s[j].ptr_b[k] -= factor * s[ir].ptr_b[k];
      }
    }
  }

  // The rows of the inverse are now scattered by the pointer swaps.  The input matrix has been
  // consumed, so use it as scratch space to put them back in order.
  for (size_t i = 0; i < rank; i++) {
    for (size_t j = 0; j < rank; j++) {
      matrix[(i * rank) + j] = s[i].ptr_b[j];
    }
  }
  for (size_t i = 0; i < rank * rank; i++) {
    inverse[i] = matrix[i];
  }
}

//-------------------------------------------------------------------------------------------------
template <typename T> void invertSquareMatrix(const T* matrix, T* inverse, const size_t rank) {
  std::vector<T> matrix_copy(matrix, matrix + (rank * rank));
  invertSquareMatrix(matrix_copy.data(), inverse, rank);
}

//-------------------------------------------------------------------------------------------------
template <typename T>
void jacobiEigensolver(T* a, T* v, T* d, const size_t rank, const ExceptionResponse policy) {
  if (rank == 0LLU) {
    return;
  }

  // The eigenvector matrix starts as the identity, the eigenvalues as the diagonal
  std::vector<T> b(rank), z(rank, 0.0);
  for (size_t i = 0; i < rank * rank; i++) {
    v[i] = 0.0;
  }
  for (size_t i = 0; i < rank; i++) {
    v[(i * rank) + i] = 1.0;
    d[i] = a[(i * rank) + i];
    b[i] = d[i];
  }

  // Only the lower triangle is referenced below.  Check that it mirrors the upper.
  for (size_t i = 1; i < rank; i++) {
    for (size_t j = 0; j < i; j++) {
      if (fabs(a[(i * rank) + j] - a[(j * rank) + i]) > constants::tiny) {
        const std::string msg("Matrix of rank " + std::to_string(rank) + " is not symmetric: " +
                              realToString(a[(i * rank) + j]) + " != " +
                              realToString(a[(j * rank) + i]) + ".");
        switch (policy) {
        case ExceptionResponse::DIE:
          rtErr(msg, "jacobiEigensolver");
          break;
        case ExceptionResponse::WARN:
          rtWarn(msg, "jacobiEigensolver");
          return;
        case ExceptionResponse::SILENT:
          return;
        }
      }
    }
  }

  // Apply one Jacobi rotation to a pair of elements
  const auto rotate = [](T* x, T* y, const double s, const double tau) {
    const double g = *x;
    const double h = *y;
    *x = g - s * (h + g * tau);
    *y = h + s * (g - h * tau);
  };

  // Sweep over the off-diagonal elements until they vanish
  const size_t rank_sq = rank * rank;
  for (int sweep = 1; sweep <= 50; sweep++) {
    double off_diag = 0.0;
    for (size_t p = 0; p < rank - 1; p++) {
      for (size_t q = p + 1; q < rank; q++) {
        off_diag += fabs(a[(q * rank) + p]);
      }
    }
    if (off_diag == 0.0) {
      return;
    }
    const double thresh = (sweep < 4) ? 0.2 * off_diag / static_cast<double>(rank_sq) : 0.0;
    for (size_t p = 0; p < rank - 1; p++) {
      for (size_t q = p + 1; q < rank; q++) {
        const size_t pq = (q * rank) + p;
        const double g = 100.0 * fabs(a[pq]);

        // After four sweeps, skip the rotation if the off-diagonal element is negligible
        if (sweep > 4 && fabs(d[p]) + g == fabs(d[p]) && fabs(d[q]) + g == fabs(d[q])) {
          a[pq] = 0.0;
          continue;
        }
        if (fabs(a[pq]) <= thresh) {
          continue;
        }
        double h = d[q] - d[p];
        double t;
        if (fabs(h) + g == fabs(h)) {
          t = a[pq] / h;
        }
        else {
          const double theta = 0.5 * h / a[pq];
          t = 1.0 / (fabs(theta) + sqrt(1.0 + (theta * theta)));
          if (theta < 0.0) {
            t = -t;
          }
        }
        const double c = 1.0 / sqrt(1.0 + (t * t));
        const double s = t * c;
        const double tau = s / (1.0 + c);
        h = t * a[pq];
        z[p] -= h;
        z[q] += h;
        d[p] -= h;
        d[q] += h;
        a[pq] = 0.0;
        for (size_t j = 0; j < p; j++) {
          rotate(&a[(p * rank) + j], &a[(q * rank) + j], s, tau);
        }
        for (size_t j = p + 1; j < q; j++) {
          rotate(&a[(j * rank) + p], &a[(q * rank) + j], s, tau);
        }
        for (size_t j = q + 1; j < rank; j++) {
          rotate(&a[(j * rank) + p], &a[(j * rank) + q], s, tau);
        }
        for (size_t j = 0; j < rank; j++) {
          rotate(&v[(p * rank) + j], &v[(q * rank) + j], s, tau);
        }
      }
    }
    for (size_t p = 0; p < rank; p++) {
      b[p] += z[p];
      d[p] = b[p];
      z[p] = 0.0;
    }
  }
  switch (policy) {
  case ExceptionResponse::DIE:
    rtErr("Jacobi iterations on a " + std::to_string(rank) + "-rank matrix did not converge.",
          "jacobiEigensolver");
    break;
  case ExceptionResponse::WARN:
    rtWarn("Jacobi iterations on a " + std::to_string(rank) + "-rank matrix did not converge.",
           "jacobiEigensolver");
    break;
  case ExceptionResponse::SILENT:
    break;
  }
}

//-------------------------------------------------------------------------------------------------
template <typename T>
void jacobiEigensolver(std::vector<T> *a, std::vector<T> *v, std::vector<T> *d, const size_t rank,
                       const ExceptionResponse policy) {
  const size_t actual_rank = (rank == 0LLU) ? d->size() : rank;
  checkArraySizeToMatrixRank(actual_rank, rank, a->size(), v->size(), policy);
  if (d->size() < actual_rank) {
    d->resize(actual_rank);
  }
  jacobiEigensolver(a->data(), v->data(), d->data(), actual_rank, policy);
}

//-------------------------------------------------------------------------------------------------
template <typename T>
void computeBoxTransform(const T lx, const T ly, const T lz, const T alpha, const T beta,
                         const T gamma, T* umat, T* invu) {
  const T dx = ((cos(beta) * cos(gamma)) - cos(alpha)) / (sin(beta) * sin(gamma));
  const T dy = sqrt(1.0 - (dx * dx));
  invu[0] =  lx;
  invu[1] = 0.0;
  invu[2] = 0.0;
  invu[3] =  ly * cos(gamma);
  invu[4] =  ly * sin(gamma);
  invu[5] = 0.0;
  invu[6] =  lz * cos(beta);
  invu[7] = -lz * sin(beta) * dx;
  invu[8] =  lz * sin(beta) * dy;
  invertSquareMatrix(static_cast<const T*>(invu), umat, 3);
}

//-------------------------------------------------------------------------------------------------
template <typename T> void computeBoxTransform(const T* dims, T* umat, T* invu) {
  computeBoxTransform(dims[0], dims[1], dims[2], dims[3], dims[4], dims[5], umat, invu);
}

//-------------------------------------------------------------------------------------------------
template <typename T>
void extractBoxDimensions(T *lx, T *ly, T *lz, T *alpha, T *beta, T *gamma, const T* invu) {
  *lx = invu[0];
  *ly = sqrt((invu[3] * invu[3]) + (invu[4] * invu[4]));
  *gamma = acos(invu[3] / (*ly));

  // The third column holds lz * (cos(beta), -sin(beta) * dx, sin(beta) * dy), a vector of
  // length lz.
  *lz = sqrt((invu[6] * invu[6]) + (invu[7] * invu[7]) + (invu[8] * invu[8]));
  *beta = acos(invu[6] / (*lz));
  const T dx = -invu[7] / (sin(*beta) * (*lz));
  *alpha = acos((cos(*beta) * cos(*gamma)) - (dx * sin(*beta) * sin(*gamma)));
}

} // namespace math
} // namespace mdscan
