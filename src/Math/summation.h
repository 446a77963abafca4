// -*-c++-*-
#ifndef MDSCAN_SUMMATION_H
#define MDSCAN_SUMMATION_H

#include <vector>
#include "copyright.h"

namespace mdscan {
namespace math {

/// \brief Sum the elements of an array or standard template library vector.  Developers must take
///        care that the sum type have a sufficient range, particularly in cases with integral
///        types.
///
/// \param v     The array or vector to sum
/// \param vlen  The length of the array
/// \{
template <typename TSum, typename TBase> TSum sum(const TBase* v, size_t vlen);

template <typename TSum, typename TBase> TSum sum(const std::vector<TBase> &v);
/// \}

} // namespace math
} // namespace mdscan

#include "summation.tpp"

#endif
