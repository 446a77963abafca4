#include <cmath>
#include <string>
#include "copyright.h"
#include "Constants/scaling.h"
#include "Reporting/error_format.h"
#include "approx.h"

namespace mdscan {
namespace testing {

//-------------------------------------------------------------------------------------------------
Approx::Approx(const double value_in, const ComparisonType style_in, const double tol_in) :
    Approx(std::vector<double>(1, value_in), style_in, tol_in)
{}

//-------------------------------------------------------------------------------------------------
Approx::Approx(const double value_in, const double tol_in, const ComparisonType style_in) :
    Approx(std::vector<double>(1, value_in), style_in, tol_in)
{}

//-------------------------------------------------------------------------------------------------
Approx::Approx(const std::vector<double> &values_in, const ComparisonType style_in,
               const double tol_in) :
    values{values_in}, style{style_in}, dtol{std::abs(tol_in)}
{}

//-------------------------------------------------------------------------------------------------
Approx::Approx(const std::vector<double> &values_in, const double tol_in,
               const ComparisonType style_in) :
    Approx(values_in, style_in, tol_in)
{}

//-------------------------------------------------------------------------------------------------
int Approx::size() const {
  return values.size();
}

//-------------------------------------------------------------------------------------------------
double Approx::getValue() const {
  if (values.size() != 1) {
    rtErr("A single value was requested for an approximate comparison containing a vector of " +
          std::to_string(values.size()) + " values.  Use getValues() to retrieve them all.",
          "Approx", "getValue");
  }
  return values[0];
}

//-------------------------------------------------------------------------------------------------
const std::vector<double>& Approx::getValues() const {
  return values;
}

//-------------------------------------------------------------------------------------------------
ComparisonType Approx::getStyle() const {
  return style;
}

//-------------------------------------------------------------------------------------------------
double Approx::getMargin() const {
  return dtol;
}

//-------------------------------------------------------------------------------------------------
Approx Approx::margin(const double dtol_in) const {
  return Approx(values, style, dtol_in);
}

//-------------------------------------------------------------------------------------------------
bool Approx::testElement(const double test_value, const size_t index) const {
  const double target = values[index];
  switch (style) {
  case ComparisonType::ABSOLUTE:
    return (std::abs(test_value - target) <= dtol);
  case ComparisonType::RELATIVE:
    if (std::abs(target) > constants::tiny) {
      return (std::abs((test_value - target) / target) <= dtol);
    }
    else {
      return (std::abs((test_value - target) / constants::tiny) <= dtol);
    }
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
bool Approx::test(const double test_value) const {
  if (values.size() != 1) {
    return false;
  }
  return testElement(test_value, 0);
}

//-------------------------------------------------------------------------------------------------
bool Approx::test(const std::vector<double> &test_values) const {
  if (test_values.size() != values.size()) {
    return false;
  }
  for (size_t i = 0; i < values.size(); i++) {
    if (testElement(test_values[i], i) == false) {
      return false;
    }
  }
  return true;
}

//-------------------------------------------------------------------------------------------------
bool operator==(const double d, const Approx &cr) {
  return cr.test(d);
}

//-------------------------------------------------------------------------------------------------
bool operator==(const Approx &cr, const double d) {
  return cr.test(d);
}

//-------------------------------------------------------------------------------------------------
bool operator!=(const double d, const Approx &cr) {
  return (cr.test(d) == false);
}

//-------------------------------------------------------------------------------------------------
bool operator!=(const Approx &cr, const double d) {
  return (cr.test(d) == false);
}

//-------------------------------------------------------------------------------------------------
bool operator>(const double d, const Approx &cr) {
  return (d > cr.getValue() + cr.getMargin());
}

//-------------------------------------------------------------------------------------------------
bool operator>(const Approx &cr, const double d) {
  return (cr.getValue() - cr.getMargin() > d);
}

//-------------------------------------------------------------------------------------------------
bool operator<(const double d, const Approx &cr) {
  return (d < cr.getValue() - cr.getMargin());
}

//-------------------------------------------------------------------------------------------------
bool operator<(const Approx &cr, const double d) {
  return (cr.getValue() + cr.getMargin() < d);
}

//-------------------------------------------------------------------------------------------------
bool operator>=(const double d, const Approx &cr) {
  return (d >= cr.getValue() - cr.getMargin());
}

//-------------------------------------------------------------------------------------------------
bool operator>=(const Approx &cr, const double d) {
  return (cr.getValue() + cr.getMargin() >= d);
}

//-------------------------------------------------------------------------------------------------
bool operator<=(const double d, const Approx &cr) {
  return (d <= cr.getValue() + cr.getMargin());
}

//-------------------------------------------------------------------------------------------------
bool operator<=(const Approx &cr, const double d) {
  return (cr.getValue() - cr.getMargin() <= d);
}

//-------------------------------------------------------------------------------------------------
bool operator==(const std::vector<double> &dv, const Approx &cr) {
  return cr.test(dv);
}

//-------------------------------------------------------------------------------------------------
bool operator!=(const std::vector<double> &dv, const Approx &cr) {
  return (cr.test(dv) == false);
}

} // namespace testing
} // namespace mdscan
