// -*-c++-*-
#ifndef MDSCAN_VECTOR_TYPES_H
#define MDSCAN_VECTOR_TYPES_H

#include "copyright.h"

namespace mdscan {
namespace data_types {

/// \brief A Cartesian point, displacement, or center of mass.  This mirrors the CUDA tuple of the
///        same name so that host code reads the same way regardless of the back end.
struct double3 {
  double x;
  double y;
  double z;
};

} // namespace data_types
} // namespace mdscan

namespace mdscan {
using data_types::double3;
} // namespace mdscan

#endif
