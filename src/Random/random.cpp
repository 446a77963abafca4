#include <algorithm>
#include <cmath>
#include "copyright.h"
#include "Constants/symbol_values.h"
#include "random.h"

namespace mdscan {
namespace random {

//-------------------------------------------------------------------------------------------------
Ran2Generator::Ran2Generator(const int igseed) :
  iunstable_a{-1},
  iunstable_b{123456789},
  state_sample{0},
  state_vector{0}
{
  uniformRandomNumber();

  // Run through the correlated results left over after the common initialization, so that
  // generators with different seeds diverge.
  iunstable_a = igseed;
  for (int i = 0; i < 15; i++) {
    uniformRandomNumber();
  }
}

//-------------------------------------------------------------------------------------------------
double Ran2Generator::uniformRandomNumber() {
  int lcl_iunstbl_a  = iunstable_a;
  int lcl_iunstbl_b  = iunstable_b;
  int lcl_state_sample = state_sample;

  // Populate the state vector
  int unstbl_quotient;
  if (lcl_iunstbl_a <= 0) {
    lcl_iunstbl_a = (-lcl_iunstbl_a < 1) ? 1 : -lcl_iunstbl_a;
    lcl_iunstbl_b = lcl_iunstbl_a;
    for (int j = ntab + 7; j >= 0 ; j--) {
      unstbl_quotient = lcl_iunstbl_a / iq1;
      lcl_iunstbl_a = ia1 * (lcl_iunstbl_a - unstbl_quotient * iq1) - (unstbl_quotient * ir1);
      lcl_iunstbl_a += (lcl_iunstbl_a < 0) * im1;
      state_vector[j] = lcl_iunstbl_a;
    }
    lcl_state_sample = state_vector[0];
  }
  unstbl_quotient = lcl_iunstbl_a / iq1;
  lcl_iunstbl_a = ia1 * (lcl_iunstbl_a - unstbl_quotient * iq1) - unstbl_quotient * ir1;
  lcl_iunstbl_a += (lcl_iunstbl_a < 0) * im1;
  unstbl_quotient = lcl_iunstbl_b / iq2;
  lcl_iunstbl_b = ia2 * (lcl_iunstbl_b - unstbl_quotient * iq2) - unstbl_quotient * ir2;
  lcl_iunstbl_b += (lcl_iunstbl_b < 0) * im2;
  const int swap_index = lcl_state_sample / ndiv;
  lcl_state_sample = state_vector[swap_index] - lcl_iunstbl_b;
  state_vector[swap_index] = lcl_iunstbl_a;
  lcl_state_sample += (lcl_state_sample < 1) * im1_minus_one;
  const double result = am * lcl_state_sample;
  iunstable_a = lcl_iunstbl_a;
  iunstable_b = lcl_iunstbl_b;
  state_sample = lcl_state_sample;
  return std::min(ran2_max, result);
}

//-------------------------------------------------------------------------------------------------
std::vector<double> Ran2Generator::uniformRandomNumber(const size_t count) {
  std::vector<double> result(count);
  for (size_t i = 0; i < count; i++) {
    result[i] = uniformRandomNumber();
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
double Ran2Generator::gaussianRandomNumber() {
  using symbols::twopi;

  // The uniform generator never returns exactly zero, but guard the logarithm all the same.
  const double u1 = std::max(uniformRandomNumber(), double_increment);
  const double x1 = std::sqrt(-2.0 * std::log(u1));
  const double x2 = std::sin(twopi * uniformRandomNumber());
  return x1 * x2;
}

//-------------------------------------------------------------------------------------------------
std::vector<double> Ran2Generator::gaussianRandomNumber(const size_t count) {
  std::vector<double> result(count);
  for (size_t i = 0; i < count; i++) {
    result[i] = gaussianRandomNumber();
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
std::vector<double> randomRotationMatrix(Ran2Generator *prng) {
  double q[4];
  double qnorm = 0.0;
  while (qnorm < 1.0e-4) {
    qnorm = 0.0;
    for (int i = 0; i < 4; i++) {
      q[i] = prng->gaussianRandomNumber();
      qnorm += q[i] * q[i];
    }
  }
  qnorm = std::sqrt(qnorm);
  for (int i = 0; i < 4; i++) {
    q[i] /= qnorm;
  }
  const double w = q[0];
  const double x = q[1];
  const double y = q[2];
  const double z = q[3];
  std::vector<double> result(9);
  result[0] = 1.0 - 2.0 * ((y * y) + (z * z));
  result[1] = 2.0 * ((x * y) + (w * z));
  result[2] = 2.0 * ((x * z) - (w * y));
  result[3] = 2.0 * ((x * y) - (w * z));
  result[4] = 1.0 - 2.0 * ((x * x) + (z * z));
  result[5] = 2.0 * ((y * z) + (w * x));
  result[6] = 2.0 * ((x * z) + (w * y));
  result[7] = 2.0 * ((y * z) - (w * x));
  result[8] = 1.0 - 2.0 * ((x * x) + (y * y));
  return result;
}

} // namespace random
} // namespace mdscan
