// -*-c++-*-
#ifndef MDSCAN_SYMBOLS_H
#define MDSCAN_SYMBOLS_H

#include "copyright.h"

namespace mdscan {
namespace symbols {

/// \brief Pi and related quantities, represented in values that can be stored exactly in
///        double-precision floating point numbers according to the IEEE_754 standard.
constexpr double pi = 3.141592653589793115997963468544185161590576171875;
constexpr double twopi = 2.0 * pi;
constexpr double half_pi = 0.5 * pi;

/// \brief Conversion between degrees (the unit of box angles in trajectory files) and radians
/// \{
constexpr double degrees_to_radians = pi / 180.0;
constexpr double radians_to_degrees = 180.0 / pi;
/// \}

} // namespace symbols
} // namespace mdscan

#endif
