// -*-c++-*-
#ifndef MDSCAN_RANDOM_H
#define MDSCAN_RANDOM_H

#include <cstddef>
#include <vector>
#include "copyright.h"

namespace mdscan {
namespace random {

/// \brief Constants for the "ran2" pseudo-random number generator
/// \{
constexpr int im1 = 2147483563;
constexpr int im2 = 2147483399;
constexpr double am = 1.0 / im1;
constexpr int im1_minus_one = im1 - 1;
constexpr int ia1 = 40014;
constexpr int ia2 = 40692;
constexpr int iq1 = 53668;
constexpr int iq2 = 52774;
constexpr int ir1 = 12211;
constexpr int ir2 = 3791;
constexpr int ntab = 32;
constexpr int ndiv = 1 + im1_minus_one / ntab;
constexpr double double_increment = 2.2205e-16;
constexpr double ran2_max = 1.0 - double_increment;
/// \}

/// \brief The default random seed for generators in mdscan
constexpr int default_random_seed = 827493;

/// \brief Stores the state of a Ran2 pseudo-random number generator.  Member functions produce
///        random numbers along various distributions.  This generator is fast and reproducible
///        across platforms, which makes it suitable for generating test cases.
class Ran2Generator {
public:

  /// \brief Initialize the unit testing-on-the-CPU random number generator.
  ///
  /// \param igseed  Random number seed
  Ran2Generator(int igseed = default_random_seed);

  /// \brief Get a random number on the range [0, 1) from a uniform distribution.
  ///
  /// Overloaded:
  ///   - Get a single number
  ///   - Get a series of numbers
  ///
  /// \param count  The number of values to produce
  /// \{
  double uniformRandomNumber();
  std::vector<double> uniformRandomNumber(size_t count);
  /// \}

  /// \brief Get a normally distributed random number with mean zero and standard deviation one.
  ///        Overloading follows from uniformRandomNumber() above.
  ///
  /// \param count  The number of values to produce
  /// \{
  double gaussianRandomNumber();
  std::vector<double> gaussianRandomNumber(size_t count);
  /// \}

private:
  int iunstable_a;
  int iunstable_b;
  int state_sample;
  int state_vector[ntab + 8];
};

/// \brief Produce a random proper rotation matrix, nine elements in column-major order, by
///        normalizing a quaternion with normally distributed components.
///
/// \param prng  Source of random numbers
std::vector<double> randomRotationMatrix(Ran2Generator *prng);

} // namespace random
} // namespace mdscan

#endif
