// -*-c++-*-
#ifndef MDSCAN_UNIT_TEST_ENUMERATORS_H
#define MDSCAN_UNIT_TEST_ENUMERATORS_H

#include <string>
#include "copyright.h"

namespace mdscan {
namespace testing {

/// \brief Enumerate the possible outcomes of a test
enum class CheckResult {
  SUCCESS,  ///< The test passed
  FAILURE,  ///< The test failed
  SKIPPED   ///< The test was skipped, most likely because a required file was absent
};

/// \brief Priorities for a test.  A critical test counts against the test program's exit status,
///        a non-critical test only reports its failure, and a failed test of ABORT priority
///        terminates the program.
enum class TestPriority {
  CRITICAL,      ///< Failure counts against the program
  NON_CRITICAL,  ///< Failure is reported but does not count against the program
  ABORT          ///< Failure terminates the program immediately
};

/// \brief Relational operators used in check() statements.  Each long-form operator has a
///        two-letter abbreviation.
enum class RelationalOperator {
  EQUAL,                  ///< Values must match (to within a tolerance, if one is given)
  NOT_EQUAL,              ///< Values must differ (by more than the tolerance, if one is given)
  GREATER_THAN,           ///< The value must exceed the target
  LESS_THAN,              ///< The value must be less than the target
  GREATER_THAN_OR_EQUAL,  ///< The value must meet or exceed the target
  LESS_THAN_OR_EQUAL,     ///< The value must not exceed the target
  EQ,                     ///< Abbreviation of EQUAL
  NE,                     ///< Abbreviation of NOT_EQUAL
  GT,                     ///< Abbreviation of GREATER_THAN
  LT,                     ///< Abbreviation of LESS_THAN
  GE,                     ///< Abbreviation of GREATER_THAN_OR_EQUAL
  LE                      ///< Abbreviation of LESS_THAN_OR_EQUAL
};

/// \brief Styles of approximate comparison
enum class ComparisonType {
  ABSOLUTE,  ///< Values must agree to within an absolute tolerance
  RELATIVE   ///< Values must agree to within a tolerance relative to the target
};

/// \brief Levels of detail in the test report
enum class TestVerbosity {
  FULL,     ///< Report every failure in full, along with a detailed summary
  COMPACT,  ///< Report failures in full but print only a one-line summary
  SILENT    ///< Print only the one-line summary
};

/// \brief Indicate whether a test program needs a scratch directory for files it writes
enum class TmpdirStatus {
  NOT_REQUIRED,  ///< No files will be written
  REQUIRED       ///< The program writes files and needs a writable directory
};

/// \brief Produce a human-readable string for each enumerator.
///
/// \param x  The enumerator to translate
/// \{
std::string getEnumerationName(CheckResult x);
std::string getEnumerationName(TestPriority x);
std::string getEnumerationName(RelationalOperator x);
std::string getEnumerationName(ComparisonType x);
std::string getEnumerationName(TestVerbosity x);
std::string getEnumerationName(TmpdirStatus x);
/// \}

/// \brief Get the symbol for a relational operator, as it would appear in code.
///
/// \param x  The operator of interest
std::string getRelationalSymbol(RelationalOperator x);

/// \brief Convert any of the two-letter abbreviations to the long form of the operator.
///
/// \param x  The operator of interest
RelationalOperator expandRelationalOperator(RelationalOperator x);

} // namespace testing
} // namespace mdscan

#endif
