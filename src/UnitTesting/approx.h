// -*-c++-*-
#ifndef MDSCAN_APPROX_H
#define MDSCAN_APPROX_H

#include <vector>
#include "copyright.h"
#include "unit_test_enumerators.h"

namespace mdscan {
namespace testing {

/// \brief The default tolerance for approximate comparisons
constexpr double default_approx_tolerance = 1.0e-6;

/// \brief A target value, or series of values, with a tolerance for comparisons.  Used in the
///        manner of Catch2's Approx, on the right hand side of check() statements.
class Approx {
public:

  /// \brief The constructor takes one value or a series of values.  The tolerance and the style
  ///        may be given in either order.
  ///
  /// \param value_in   The single target value
  /// \param values_in  The series of target values
  /// \param style_in   Style of comparison
  /// \param tol_in     The tolerance
  /// \{
  Approx(double value_in, ComparisonType style_in = ComparisonType::ABSOLUTE,
         double tol_in = default_approx_tolerance);
  Approx(double value_in, double tol_in, ComparisonType style_in = ComparisonType::ABSOLUTE);
  Approx(const std::vector<double> &values_in, ComparisonType style_in = ComparisonType::ABSOLUTE,
         double tol_in = default_approx_tolerance);
  Approx(const std::vector<double> &values_in, double tol_in,
         ComparisonType style_in = ComparisonType::ABSOLUTE);
  /// \}

  /// \brief Get the number of target values.
  int size() const;

  /// \brief Get the single target value.  An error is raised if there are several.
  double getValue() const;

  /// \brief Get all target values.
  const std::vector<double>& getValues() const;

  /// \brief Get the style of comparison.
  ComparisonType getStyle() const;

  /// \brief Get the tolerance.
  double getMargin() const;

  /// \brief Produce a copy of the object with a new tolerance.
  ///
  /// \param dtol_in  The new tolerance
  Approx margin(double dtol_in) const;

  /// \brief Test whether a value, or a series of values, agrees with the target.  A series must
  ///        have as many elements as the target.
  ///
  /// \param test_value   The single value to test
  /// \param test_values  The series of values to test
  /// \{
  bool test(double test_value) const;
  bool test(const std::vector<double> &test_values) const;
  /// \}

private:
  std::vector<double> values;  ///< The target values
  ComparisonType style;        ///< Style of comparison
  double dtol;                 ///< The tolerance

  /// \brief Test one value against one of the targets.
  ///
  /// \param test_value  The value to test
  /// \param index       Index of the target
  bool testElement(double test_value, size_t index) const;
};

/// \brief Relational operators for scalars and approximate values.  Inequalities are strict
///        beyond the margin: a value exceeds an Approx only if it exceeds the target by more than
///        the tolerance.
/// \{
bool operator==(double d, const Approx &cr);
bool operator==(const Approx &cr, double d);
bool operator!=(double d, const Approx &cr);
bool operator!=(const Approx &cr, double d);
bool operator>(double d, const Approx &cr);
bool operator>(const Approx &cr, double d);
bool operator<(double d, const Approx &cr);
bool operator<(const Approx &cr, double d);
bool operator>=(double d, const Approx &cr);
bool operator>=(const Approx &cr, double d);
bool operator<=(double d, const Approx &cr);
bool operator<=(const Approx &cr, double d);
bool operator==(const std::vector<double> &dv, const Approx &cr);
bool operator!=(const std::vector<double> &dv, const Approx &cr);
/// \}

} // namespace testing
} // namespace mdscan

#endif
