#include "copyright.h"
#include <string>
#include "unit_test_enumerators.h"

namespace mdscan {
namespace testing {

//-------------------------------------------------------------------------------------------------
std::string getEnumerationName(const CheckResult x) {
  switch (x) {
  case CheckResult::SUCCESS:
    return std::string("SUCCESS");
  case CheckResult::FAILURE:
    return std::string("FAILURE");
  case CheckResult::SKIPPED:
    return std::string("SKIPPED");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
std::string getEnumerationName(const TestPriority x) {
  switch (x) {
  case TestPriority::CRITICAL:
    return std::string("CRITICAL");
  case TestPriority::NON_CRITICAL:
    return std::string("NON_CRITICAL");
  case TestPriority::ABORT:
    return std::string("ABORT");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
std::string getEnumerationName(const RelationalOperator x) {
  switch (x) {
  case RelationalOperator::EQUAL:
    return std::string("EQUAL");
  case RelationalOperator::NOT_EQUAL:
    return std::string("NOT_EQUAL");
  case RelationalOperator::GREATER_THAN:
    return std::string("GREATER_THAN");
  case RelationalOperator::LESS_THAN:
    return std::string("LESS_THAN");
  case RelationalOperator::GREATER_THAN_OR_EQUAL:
    return std::string("GREATER_THAN_OR_EQUAL");
  case RelationalOperator::LESS_THAN_OR_EQUAL:
    return std::string("LESS_THAN_OR_EQUAL");
  case RelationalOperator::EQ:
    return std::string("EQ");
  case RelationalOperator::NE:
    return std::string("NE");
  case RelationalOperator::GT:
    return std::string("GT");
  case RelationalOperator::LT:
    return std::string("LT");
  case RelationalOperator::GE:
    return std::string("GE");
  case RelationalOperator::LE:
    return std::string("LE");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
std::string getEnumerationName(const ComparisonType x) {
  switch (x) {
  case ComparisonType::ABSOLUTE:
    return std::string("ABSOLUTE");
  case ComparisonType::RELATIVE:
    return std::string("RELATIVE");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
std::string getEnumerationName(const TestVerbosity x) {
  switch (x) {
  case TestVerbosity::FULL:
    return std::string("FULL");
  case TestVerbosity::COMPACT:
    return std::string("COMPACT");
  case TestVerbosity::SILENT:
    return std::string("SILENT");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
std::string getEnumerationName(const TmpdirStatus x) {
  switch (x) {
  case TmpdirStatus::NOT_REQUIRED:
    return std::string("NOT_REQUIRED");
  case TmpdirStatus::REQUIRED:
    return std::string("REQUIRED");
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
std::string getRelationalSymbol(const RelationalOperator x) {
  switch (expandRelationalOperator(x)) {
  case RelationalOperator::EQUAL:
    return std::string("==");
  case RelationalOperator::NOT_EQUAL:
    return std::string("!=");
  case RelationalOperator::GREATER_THAN:
    return std::string(">");
  case RelationalOperator::LESS_THAN:
    return std::string("<");
  case RelationalOperator::GREATER_THAN_OR_EQUAL:
    return std::string(">=");
  case RelationalOperator::LESS_THAN_OR_EQUAL:
    return std::string("<=");
  case RelationalOperator::EQ:
  case RelationalOperator::NE:
  case RelationalOperator::GT:
  case RelationalOperator::LT:
  case RelationalOperator::GE:
  case RelationalOperator::LE:
    break;
  }
  __builtin_unreachable();
}

//-------------------------------------------------------------------------------------------------
RelationalOperator expandRelationalOperator(const RelationalOperator x) {
  switch (x) {
  case RelationalOperator::EQUAL:
  case RelationalOperator::NOT_EQUAL:
  case RelationalOperator::GREATER_THAN:
  case RelationalOperator::LESS_THAN:
  case RelationalOperator::GREATER_THAN_OR_EQUAL:
  case RelationalOperator::LESS_THAN_OR_EQUAL:
    return x;
  case RelationalOperator::EQ:
    return RelationalOperator::EQUAL;
  case RelationalOperator::NE:
    return RelationalOperator::NOT_EQUAL;
  case RelationalOperator::GT:
    return RelationalOperator::GREATER_THAN;
  case RelationalOperator::LT:
    return RelationalOperator::LESS_THAN;
  case RelationalOperator::GE:
    return RelationalOperator::GREATER_THAN_OR_EQUAL;
  case RelationalOperator::LE:
    return RelationalOperator::LESS_THAN_OR_EQUAL;
  }
  __builtin_unreachable();
}

} // namespace testing
} // namespace mdscan
