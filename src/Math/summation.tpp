// -*-c++-*-
#include "copyright.h"

namespace mdscan {
namespace math {

//-------------------------------------------------------------------------------------------------
template <typename TSum, typename TBase> TSum sum(const TBase* v, const size_t vlen) {
  TSum total = static_cast<TSum>(0);
  for (size_t i = 0; i < vlen; i++) {
    total += static_cast<TSum>(v[i]);
  }
  return total;
}

//-------------------------------------------------------------------------------------------------
template <typename TSum, typename TBase> TSum sum(const std::vector<TBase> &v) {
  return sum<TSum, TBase>(v.data(), v.size());
}

} // namespace math
} // namespace mdscan
