// -*-c++-*-
#ifndef MDSCAN_SCALING_H
#define MDSCAN_SCALING_H

#include "copyright.h"

namespace mdscan {
namespace constants {

/// \brief a value bigger than tiny but still small enough to often be negligible
constexpr double small = 1.0e-8;

/// \brief The default tiny value, below which most quantities are unimportant
constexpr double tiny = 1.0e-10;

/// \brief An even tinier value, for the most stringent comparisons
constexpr double verytiny = 1.0e-12;

/// \brief The Amber ASCII trajectory layout: ten coordinates of eight characters per line
/// \{
constexpr int crd_values_per_line = 10;
constexpr int crd_field_width = 8;
/// \}

} // namespace constants
} // namespace mdscan

#endif
