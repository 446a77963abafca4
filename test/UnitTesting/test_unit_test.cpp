#include <fstream>
#include <string>
#include <vector>
#include "copyright.h"
#include "../../src/Constants/behavior.h"
#include "../../src/FileManagement/file_listing.h"
#include "../../src/FileManagement/file_util.h"
#include "../../src/Random/random.h"
#include "../../src/Reporting/display.h"
#include "../../src/Reporting/error_format.h"
#include "../../src/UnitTesting/approx.h"
#include "../../src/UnitTesting/unit_test.h"

using mdscan::constants::ExceptionResponse;
using mdscan::constants::translateExceptionResponse;
using mdscan::display::mdscanSplash;
using mdscan::errors::DimensionMismatch;
using mdscan::errors::OpenError;
using mdscan::errors::rtErr;
using mdscan::errors::rtWarn;
using mdscan::errors::terminalFormat;
using mdscan::errors::ErrorKind;
using mdscan::random::Ran2Generator;
using namespace mdscan::diskutil;
using namespace mdscan::testing;

//-------------------------------------------------------------------------------------------------
// main
//-------------------------------------------------------------------------------------------------
int main(const int argc, const char* argv[]) {

  // Some baseline initialization
  TestEnvironment oe(argc, argv, TmpdirStatus::REQUIRED);
  if (oe.getVerbosity() == TestVerbosity::FULL) {
    mdscanSplash("test_unit_test");
  }

  // Section 1
  section("Approximate comparisons");

  // Section 2
  section("Checks and their bookkeeping");

  // Section 3
  section("Scratch files");

  // Section 4
  section("Random numbers");

  // Perform basic checks of the Approx object
  section(1);
  const Approx gray_number(9.6, ComparisonType::ABSOLUTE, 0.11);
  check(gray_number.test(9.7), "Approx object fails to perform a real-to-real scalar comparison.");
  check(gray_number.test(9.75) == false, "Approx object accepts a value beyond its tolerance.");
  const Approx gray_vector(std::vector<double>{9.8, 8.1, 8.0, 4.5, 7.3}, ComparisonType::ABSOLUTE,
                           0.011);
  check(gray_vector.size(), RelationalOperator::EQUAL, 5, "The number of values in an Approx "
        "object is incorrect.");
  check(gray_vector.test(9.7) == false, "A scalar-to-vector approximate comparison was judged "
        "successful.");
  check(gray_vector.test(std::vector<double>{9.79, 8.11, 7.99, 4.49, 7.31}), "Approx object fails "
        "to pass a correct vector-to-vector comparison.");
  check(gray_vector.test(std::vector<double>{9.79, 8.08, 7.99, 4.49, 7.31}) == false,
        "Approx object fails to reject an unacceptable real vector-to-vector comparison.");
  check(gray_vector.test(std::vector<double>{9.8, 8.1, 8.0}) == false, "Approx object performs a "
        "comparison on vectors of different lengths and returns success.");
  CHECK_THROWS(gray_vector.getValue(), "A single value was taken from an Approx object holding "
               "a series.");
  check(9.8, RelationalOperator::GREATER_THAN, Approx(9.4), "Approximate comparison fails to "
        "process a scalar greater-than inequality.");
  check((9.75 > gray_number) == false, "Approximate comparison fails to give the benefit of the "
        "doubt in a scalar greater-than inequality.");
  check(4.5, RelationalOperator::LESS_THAN, gray_number, "Approximate comparison fails to "
        "process a scalar less-than inequality.");
  check((9.5 < gray_number) == false, "Approximate comparison fails to give the benefit of the "
        "doubt in a scalar less-than inequality.");
  check(4, RelationalOperator::GREATER_THAN_OR_EQUAL, Approx(4), "Approximate comparison fails "
        "to identify a true greater-than-or-equal scalar comparison.");
  check(6, RelationalOperator::LE, Approx(8), "Approximate comparison fails to identify a true "
        "less-than-or-equal scalar comparison.");
  check(8.000001, RelationalOperator::LE, Approx(8.0, 1.0e-5), "A less-than-or-equal "
        "comparison does not let the tolerance work in favor of the inequality.");
  check((gray_number > 9.0) && (gray_number < 10.0), "Comparisons with the Approx object on "
        "the left-hand side are incorrect.");
  const Approx rel_number(1000.0, ComparisonType::RELATIVE, 1.0e-3);
  check(rel_number.test(1000.9), "A relative comparison rejects a value within its tolerance.");
  check(rel_number.test(1001.1) == false, "A relative comparison accepts a value beyond its "
        "tolerance.");
  check(rel_number.getStyle() == ComparisonType::RELATIVE, "The style of an Approx object was "
        "not recorded.");
  const Approx wide_number = rel_number.margin(0.01);
  check(wide_number.getMargin(), RelationalOperator::EQUAL, 0.01, "A new margin was not applied "
        "to a copy of an Approx object.");
  check(rel_number.getMargin(), RelationalOperator::EQUAL, 1.0e-3, "Applying a new margin "
        "altered the original Approx object.");
  check(Approx(0.5).getMargin(), RelationalOperator::EQUAL, default_approx_tolerance, "The "
        "default tolerance of an Approx object is incorrect.");
  check(std::vector<double>{9.79, 8.11, 7.99, 4.49, 7.31}, RelationalOperator::NE,
        Approx(std::vector<double>{9.79, 8.11, 7.99, 4.49}), "Series of different lengths were "
        "judged equal.");

  // Check results, section names, and the enumerators behind them
  section(2);
  check(getCurrentSection(), RelationalOperator::EQUAL, 2, "The current section is not the one "
        "most recently entered.");
  check(unitTestSectionName(3), RelationalOperator::EQUAL, std::string("Scratch files"),
        "The title of a section was not recorded.");
  check(unitTestSectionName(0), RelationalOperator::EQUAL, std::string("General"), "The default "
        "section is not titled \"General\".");
  check(getRelationalSymbol(RelationalOperator::GE), RelationalOperator::EQUAL, std::string(">="),
        "The symbol for an abbreviated relational operator is incorrect.");
  check(expandRelationalOperator(RelationalOperator::NE) == RelationalOperator::NOT_EQUAL,
        "An abbreviated relational operator was not expanded.");
  check(getEnumerationName(TestPriority::NON_CRITICAL), RelationalOperator::EQUAL,
        std::string("NON_CRITICAL"), "The name of a test priority is incorrect.");
  check(std::vector<int>({ 4, 8, 15 }), RelationalOperator::EQUAL, std::vector<int>({ 4, 8, 15 }),
        "Identical integer series were not judged equal.");
  check(std::string("CA"), RelationalOperator::NOT_EQUAL, std::string("CB"), "Different strings "
        "were judged equal.");
  const int failures_before = countGlobalTestFailures();
  const CheckResult soft_result = check(false, "This check fails on purpose, with low priority, "
                                        "and should be reported as skipped.",
                                        TestPriority::NON_CRITICAL);
  check(soft_result == CheckResult::SKIPPED, "A failed check of low priority was not reported as "
        "skipped.");
  check(countGlobalTestFailures(), RelationalOperator::EQUAL, failures_before, "A failed check "
        "of low priority was counted as a failure.");
  check(check(true, "A true statement fails.") == CheckResult::SUCCESS, "A passing check does "
        "not report success.");
  CHECK_THROWS(check(std::vector<int>({ 1, 2 }), RelationalOperator::GREATER_THAN,
                     std::vector<int>({ 0, 1 }), "Ordering comparisons of integer series are not "
                     "supported."), "An ordering comparison of two series was attempted.");
  CHECK_THROWS_AS(rtErr(ErrorKind::DIMENSION_MISMATCH, "Sizes differ.", "test_unit_test"),
                  DimensionMismatch, "An error of a specific kind was not thrown as its own "
                  "exception class.");
  CHECK_THROWS(rtErr("General failure.", "test_unit_test"), "A general error was not thrown.");
  check(terminalFormat("Short message", "Caller", "method").find("Caller") != std::string::npos,
        "The calling class was not named in a formatted message.");
  check(translateExceptionResponse("Warning") == ExceptionResponse::WARN, "A bad input policy "
        "was not translated from text.");
  CHECK_THROWS(translateExceptionResponse("ignore"), "An invalid bad input policy was "
               "translated.");
  check(getEnumerationName(ErrorKind::END_OF_SELECTION) + " " +
        getEnumerationName(PrintSituation::APPEND) + " " +
        getEnumerationName(ExceptionResponse::SILENT), RelationalOperator::EQUAL,
        std::string("END_OF_SELECTION APPEND SILENT"), "Names of error kinds, print situations, "
        "or bad input policies are incorrect.");

  // Write files in the scratch directory and remove them
  section(3);
  const TestPriority tmp_tests = (oe.getTemporaryDirectoryAccess()) ? TestPriority::CRITICAL :
                                                                      TestPriority::ABORT;
  if (tmp_tests == TestPriority::ABORT) {
    rtWarn("The temporary directory " + oe.getTemporaryDirectoryPath() + " is not writeable and "
           "will therefore not support some subsequent tests.  Make sure that the directory "
           "given with -tmpdir can be written.", "test_unit_test");
  }
  check(getDrivePathType(oe.getTemporaryDirectoryPath()) == DrivePathType::DIRECTORY, "The "
        "scratch directory " + oe.getTemporaryDirectoryPath() + " is not a directory.", tmp_tests);
  const std::string scratch_file = oe.getTemporaryDirectoryPath() + osSeparator() + "notes.txt";
  std::ofstream foutp = openOutputFile(scratch_file, PrintSituation::OPEN_NEW, "scratch notes");
  foutp << "First line\n";
  foutp.close();
  oe.logFileCreated(scratch_file);
  check(getDrivePathType(scratch_file) == DrivePathType::FILE, "A file written to the scratch "
        "directory does not exist.", tmp_tests);
  check(getBaseName(scratch_file), RelationalOperator::EQUAL, std::string("notes.txt"), "The "
        "base name of a file in the scratch directory is incorrect.");
  CHECK_THROWS_AS(openOutputFile(scratch_file, PrintSituation::OPEN_NEW, "scratch notes"),
                  OpenError, "A new file was opened over one that already exists.");
  foutp = openOutputFile(scratch_file, PrintSituation::APPEND, "scratch notes");
  foutp << "Second line\n";
  foutp.close();
  std::ifstream finp(scratch_file.c_str());
  std::string line_a, line_b;
  std::getline(finp, line_a);
  std::getline(finp, line_b);
  finp.close();
  check(line_b, RelationalOperator::EQUAL, std::string("Second line"), "Text was not appended "
        "to an existing file.", tmp_tests);
  check(translatePrintSituation("overwrite") == PrintSituation::OVERWRITE, "A print situation "
        "was not translated from text.");
  const std::string doomed_file = oe.getTemporaryDirectoryPath() + osSeparator() + "doomed.txt";
  foutp = openOutputFile(doomed_file, PrintSituation::OVERWRITE, "file to remove");
  foutp.close();
  check(removeFile(doomed_file, ExceptionResponse::DIE), RelationalOperator::EQUAL, 0,
        "A file in the scratch directory could not be removed.", tmp_tests);
  check(getDrivePathType(doomed_file) == DrivePathType::REGEXP, "A removed file still exists.",
        tmp_tests);

  // Random numbers are reproducible and roughly normal
  section(4);
  Ran2Generator prng_a(oe.getRandomSeed()), prng_b(oe.getRandomSeed());
  const std::vector<double> draws_a = prng_a.gaussianRandomNumber(2000);
  const std::vector<double> draws_b = prng_b.gaussianRandomNumber(2000);
  check(draws_a, RelationalOperator::EQUAL, Approx(draws_b).margin(1.0e-12), "Generators with "
        "the same seed produce different series.");
  double mean = 0.0, msq = 0.0;
  for (size_t i = 0; i < draws_a.size(); i++) {
    mean += draws_a[i];
    msq += draws_a[i] * draws_a[i];
  }
  mean /= static_cast<double>(draws_a.size());
  msq /= static_cast<double>(draws_a.size());
  check(mean, RelationalOperator::EQUAL, Approx(0.0).margin(0.1), "The mean of normally "
        "distributed random numbers is far from zero.", TestPriority::NON_CRITICAL);
  check(msq - (mean * mean), RelationalOperator::EQUAL, Approx(1.0).margin(0.1), "The variance "
        "of normally distributed random numbers is far from one.", TestPriority::NON_CRITICAL);
  const std::vector<double> uniforms = prng_a.uniformRandomNumber(500);
  bool in_range = true;
  for (size_t i = 0; i < uniforms.size(); i++) {
    in_range = (in_range && uniforms[i] > 0.0 && uniforms[i] < 1.0);
  }
  check(in_range, "Uniform random numbers fall outside the range (0, 1).");

  // Print results
  printTestSummary(oe.getVerbosity());
  return countGlobalTestFailures();
}
