// -*-c++-*-
#ifndef MDSCAN_UNIT_TEST_H
#define MDSCAN_UNIT_TEST_H

#include <exception>
#include <string>
#include <vector>
#include "copyright.h"
#include "approx.h"
#include "unit_test_enumerators.h"

namespace mdscan {
namespace testing {

/// \brief The default random seed for test programs, which can be changed with -seed
constexpr int default_test_seed = 38015;

/// \brief Interpret the command line of a test program and manage the scratch directory in which
///        it writes files.  Recognized arguments:
///
///   -tmpdir <path>  Directory for files written by the tests (a fresh directory is made in /tmp
///                   if this is not given and the program needs one)
///   -verbose        Report every failure and a detailed summary
///   -silent         Print only the one-line summary
///   -seed <int>     Random number seed
class TestEnvironment {
public:

  /// \brief The constructor parses the command line and, if needed, prepares the scratch
  ///        directory.
  ///
  /// \param argc            Number of command-line arguments
  /// \param argv            The command-line arguments
  /// \param tmpdir_status   Indicate whether the program will write files
  TestEnvironment(int argc, const char* argv[],
                  TmpdirStatus tmpdir_status = TmpdirStatus::NOT_REQUIRED);

  /// \brief The destructor removes every file logged as created by the tests, then the scratch
  ///        directory if the environment made it.
  ~TestEnvironment();

  /// \brief The environment owns files on disk and cannot be copied.
  /// \{
  TestEnvironment(const TestEnvironment &original) = delete;
  TestEnvironment& operator=(const TestEnvironment &other) = delete;
  /// \}

  /// \brief Get the level of detail in the test report.
  TestVerbosity getVerbosity() const;

  /// \brief Get the path to the scratch directory.
  const std::string& getTemporaryDirectoryPath() const;

  /// \brief Indicate whether the scratch directory exists and can be written.
  bool getTemporaryDirectoryAccess() const;

  /// \brief Get the random number seed.
  int getRandomSeed() const;

  /// \brief Note that a file has been written, so that it will be removed when the tests finish.
  ///
  /// \param path  Name of the file
  void logFileCreated(const std::string &path);

private:
  TestVerbosity verbosity;                 ///< Level of detail in the test report
  std::string tmpdir_path;                 ///< The scratch directory
  bool tmpdir_created;                     ///< Indicate that the environment made the directory
  int random_seed;                         ///< Seed for random numbers used by the tests
  std::vector<std::string> files_created;  ///< Files to remove when the tests finish
};

/// \brief Declare a new section of tests, or enter a section that has already been declared.
///        Section 0 is "General" and collects tests made before any section is entered.
///
/// Overloaded:
///   - Declare a section with a title, which will be numbered after all existing sections
///   - Enter a section by its number
///
/// \param title  Title of the new section
/// \param index  Number of the section to enter
/// \{
void section(const std::string &title);
void section(int index);
/// \}

/// \brief Get the title of a section.
///
/// \param index  Number of the section of interest
std::string unitTestSectionName(int index);

/// \brief Get the number of the section currently collecting results.
int getCurrentSection();

/// \brief Record the result of a test.  A failure is reported with the message provided, along
///        with the values compared where there are any.
///
/// Overloaded:
///   - Test a boolean statement
///   - Compare a number to an approximate value or to another number
///   - Compare a series of numbers to an approximate series
///   - Compare two series of integers
///   - Compare two strings
///
/// \param statement      The statement that must be true
/// \param value          The value produced by the code under test
/// \param values         Series of values produced by the code under test
/// \param op             Relation that must hold between the value and the target
/// \param target         The expected value
/// \param targets        Series of expected values
/// \param error_message  Message to display if the test fails
/// \param priority       Priority of the test
/// \{
CheckResult check(bool statement, const std::string &error_message,
                  TestPriority priority = TestPriority::CRITICAL);

CheckResult check(double value, RelationalOperator op, const Approx &target,
                  const std::string &error_message,
                  TestPriority priority = TestPriority::CRITICAL);

CheckResult check(double value, RelationalOperator op, double target,
                  const std::string &error_message,
                  TestPriority priority = TestPriority::CRITICAL);

CheckResult check(const std::vector<double> &values, RelationalOperator op,
                  const Approx &targets, const std::string &error_message,
                  TestPriority priority = TestPriority::CRITICAL);

CheckResult check(const std::vector<int> &values, RelationalOperator op,
                  const std::vector<int> &targets, const std::string &error_message,
                  TestPriority priority = TestPriority::CRITICAL);

CheckResult check(const std::string &value, RelationalOperator op, const std::string &target,
                  const std::string &error_message,
                  TestPriority priority = TestPriority::CRITICAL);
/// \}

/// \brief Get the number of critical tests that have failed, across all sections.  This is the
///        exit status of a test program.
int countGlobalTestFailures();

/// \brief Print a summary of the test results.
///
/// \param verbosity  Level of detail in the report
void printTestSummary(TestVerbosity verbosity);

} // namespace testing
} // namespace mdscan

/// \brief Test that a statement throws an exception.  The statement must not contain commas
///        outside of parentheses.
#define CHECK_THROWS(test_code, error_message) {                                             \
    bool mdscan_code_threw = false;                                                            \
    try {                                                                                      \
      test_code;                                                                               \
    }                                                                                          \
    catch (const std::exception &) {                                                           \
      mdscan_code_threw = true;                                                                \
    }                                                                                          \
    mdscan::testing::check(mdscan_code_threw, error_message);                                  \
  }

/// \brief Test that a statement throws an exception, with a priority given to the test
#define CHECK_THROWS_SOFT(test_code, error_message, priority) {                              \
    bool mdscan_code_threw = false;                                                            \
    try {                                                                                      \
      test_code;                                                                               \
    }                                                                                          \
    catch (const std::exception &) {                                                           \
      mdscan_code_threw = true;                                                                \
    }                                                                                          \
    mdscan::testing::check(mdscan_code_threw, error_message, priority);                        \
  }

/// \brief Test that a statement throws an exception of a particular class.  An exception of any
///        other class counts as a failure.
#define CHECK_THROWS_AS(test_code, exception_class, error_message) {                         \
    bool mdscan_code_threw = false;                                                            \
    try {                                                                                      \
      test_code;                                                                               \
    }                                                                                          \
    catch (const exception_class &) {                                                          \
      mdscan_code_threw = true;                                                                \
    }                                                                                          \
    catch (const std::exception &) {                                                           \
      mdscan_code_threw = false;                                                               \
    }                                                                                          \
    mdscan::testing::check(mdscan_code_threw, error_message);                                  \
  }

#endif
