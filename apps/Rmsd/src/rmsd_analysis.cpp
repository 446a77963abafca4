#include <cstdio>
#include <fstream>
#include <string>
#include <vector>
#include "../../../src/copyright.h"
#include "../../../src/Constants/behavior.h"
#include "../../../src/FileManagement/file_util.h"
#include "../../../src/Math/summation.h"
#include "../../../src/Namelists/nml_rmsd.h"
#include "../../../src/Namelists/nml_trajectory.h"
#include "../../../src/Parsing/textfile.h"
#include "../../../src/Reporting/display.h"
#include "../../../src/Reporting/error_format.h"
#include "../../../src/Structure/rmsd.h"
#include "../../../src/Structure/structure_enumerators.h"
#include "../../../src/Trajectory/frame_iterator.h"

using namespace mdscan::constants;
using namespace mdscan::diskutil;
using namespace mdscan::display;
using namespace mdscan::errors;
using mdscan::math::sum;
using namespace mdscan::namelist;
using namespace mdscan::parse;
using namespace mdscan::structure;
using namespace mdscan::trajectory;

//-------------------------------------------------------------------------------------------------
// Display a general help message for this program
//-------------------------------------------------------------------------------------------------
void displayGeneralHelpMessage() {
  const std::string base_msg =
    terminalFormat("A program for measuring the positional RMSD of selected atoms across a "
                   "molecular dynamics trajectory, either against a reference frame or between "
                   "every pair of frames.\n\n", "mdscan.rmsd", nullptr, 0, 0, 0, 0,
                   RTMessageKind::TABULAR);
  const std::string cmd_msg =
    terminalFormat("Command line:\n  mdscan.rmsd -i <input file> [-warn | -silent | "
                   "-policy <die | warn | silent>]\n\n"
                   "Applicable namelists (re-run with one of these terms as the command-line "
                   "argument, IN QUOTES, i.e. \"&rmsd\" or '&rmsd', for further details):\n"
                   "  - &trajectory\n  - &rmsd\n", nullptr, nullptr, 0, 0, 2, 0,
                   RTMessageKind::TABULAR);
  printf("%s", base_msg.c_str());
  printf("%s\n", cmd_msg.c_str());
}

//-------------------------------------------------------------------------------------------------
// Display the keywords of a namelist, if one is named on the command line.  Returns true if any
// help was displayed.
//-------------------------------------------------------------------------------------------------
bool displayNamelistHelp(const int argc, const char* argv[]) {
  const TextFile blank_tf;
  bool result = false;
  for (int i = 1; i < argc; i++) {
    const std::string arg(argv[i]);
    int start_line = 0;
    bool found = false;
    if (arg == "&trajectory") {
      const NamelistEmulator t_nml = trajectoryInput(blank_tf, &start_line, &found,
                                                     ExceptionResponse::SILENT);
      printf("%s\n", t_nml.getHelp().c_str());
      result = true;
    }
    else if (arg == "&rmsd") {
      const NamelistEmulator t_nml = rmsdInput(blank_tf, &start_line, &found,
                                               ExceptionResponse::SILENT);
      printf("%s\n", t_nml.getHelp().c_str());
      result = true;
    }
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
// Print a table of RMSD values against a reference, to the terminal and to a report file if
// one is named.
//-------------------------------------------------------------------------------------------------
void reportReferenceRmsd(const std::vector<int> &frames, const std::vector<double> &values,
                         const int reference_frame, const std::string &report_file) {
  std::string table("    Frame      RMSD\n  --------  ----------\n");
  char buffer[64];
  for (size_t i = 0; i < values.size(); i++) {
    snprintf(buffer, 64, "  %8d  %10.4lf\n", frames[i], values[i]);
    table += std::string(buffer);
  }
  if (values.size() > 0) {
    snprintf(buffer, 64, "  --------  ----------\n      Mean  %10.4lf\n",
             sum<double>(values) / static_cast<double>(values.size()));
    table += std::string(buffer);
  }
  printf("RMSD to reference frame %d:\n\n%s\n", reference_frame, table.c_str());
  if (report_file.size() > 0) {
    std::ofstream foutp = openOutputFile(report_file, PrintSituation::OVERWRITE,
                                         "RMSD to a reference frame");
    foutp << "# RMSD to reference frame " << reference_frame << "\n" << table;
    foutp.close();
  }
}

//-------------------------------------------------------------------------------------------------
// Print the pairwise RMSD matrix, to the terminal and to a report file if one is named.
//-------------------------------------------------------------------------------------------------
void reportRmsdMatrix(const std::vector<int> &frames, const std::vector<double> &values,
                      const std::string &report_file) {
  const size_t nframe = frames.size();
  std::string table("  Frame ");
  char buffer[64];
  for (size_t i = 0; i < nframe; i++) {
    snprintf(buffer, 64, " %9d", frames[i]);
    table += std::string(buffer);
  }
  table += "\n";
  for (size_t i = 0; i < nframe; i++) {
    snprintf(buffer, 64, "  %6d", frames[i]);
    table += std::string(buffer);
    for (size_t j = 0; j < nframe; j++) {
      snprintf(buffer, 64, " %9.4lf", values[(i * nframe) + j]);
      table += std::string(buffer);
    }
    table += "\n";
  }
  printf("Pairwise RMSD between %zu frames:\n\n%s\n", nframe, table.c_str());
  if (report_file.size() > 0) {
    std::ofstream foutp = openOutputFile(report_file, PrintSituation::OVERWRITE,
                                         "pairwise RMSD matrix");
    foutp << "# Pairwise RMSD matrix\n" << table;
    foutp.close();
  }
}

//-------------------------------------------------------------------------------------------------
// main
//-------------------------------------------------------------------------------------------------
int main(int argc, const char* argv[]) {

  // Check for a help message
  if (argc == 1) {
    displayGeneralHelpMessage();
    return 0;
  }
  for (int i = 1; i < argc; i++) {
    const std::string arg(argv[i]);
    if (arg == "-help" || arg == "--help" || arg == "help") {
      displayGeneralHelpMessage();
      return 0;
    }
  }
  if (displayNamelistHelp(argc, argv)) {
    return 0;
  }

  // Read the command line
  std::string input_file;
  ExceptionResponse policy = ExceptionResponse::DIE;
  for (int i = 1; i < argc; i++) {
    const std::string arg(argv[i]);
    if (arg == "-i" && i < argc - 1) {
      input_file = std::string(argv[i + 1]);
      i++;
    }
    else if (arg == "-warn") {
      policy = ExceptionResponse::WARN;
    }
    else if (arg == "-silent") {
      policy = ExceptionResponse::SILENT;
    }
    else if (arg == "-policy" && i < argc - 1) {
      policy = translateExceptionResponse(std::string(argv[i + 1]));
      i++;
    }
    else {
      rtErr("Unrecognized command-line argument " + arg + ".", "mdscan.rmsd");
    }
  }
  if (input_file.size() == 0) {
    rtErr("An input file must be specified with -i.", "mdscan.rmsd");
  }

  // Read the namelists
  const TextFile inp_tf(input_file);
  int start_line = 0;
  bool found_nml = false;
  const TrajectoryControls trajcon(inp_tf, &start_line, &found_nml, policy);
  if (found_nml == false) {
    rtErr("No &trajectory namelist was found in " + input_file + ".", "mdscan.rmsd");
  }
  start_line = 0;
  const RmsdControls rmsdcon(inp_tf, &start_line, &found_nml, policy);
  if (trajcon.getStructureFileName().size() == 0) {
    rtErr("A structure file must be given in the &trajectory namelist, to supply the atoms of "
          "the system.", "mdscan.rmsd");
  }

  // Open the trajectory and select the atoms of interest
  mdscanSplash("mdscan.rmsd");
  FrameIterator iter(trajcon.getStructureFileName(), trajcon.getTrajectoryFileName(),
                     trajcon.getSelection(), trajcon.getTrajectoryFormat());
  printf("%s\n", iter.describe().c_str());
  const std::vector<int> atom_indices = rmsdcon.getAtomIndices(iter.getAtoms());
  const std::vector<double> weights = (rmsdcon.useMassWeighting()) ?
                                      iter.getAtomMasses(atom_indices) : std::vector<double>();
  printf("Atoms selected: %zu of %d.  Alignment: %s.  Weighting: %s.\n", atom_indices.size(),
         iter.getAtomCount(), getEnumerationName(rmsdcon.getAlignment()).c_str(),
         (rmsdcon.useMassWeighting()) ? "mass" : "uniform");
  printf("Task: %s.  Bad input policy: %s.\n\n", getEnumerationName(rmsdcon.getTask()).c_str(),
         getEnumerationName(policy).c_str());

  // Run the analysis
  const std::vector<int> frames = iter.getSelection().getIndices();
  if (frames.size() == 0) {
    const FrameSelection fsel = iter.getSelection();
    rtAlert("The frame selection (first " + std::to_string(fsel.first) + ", step " +
            std::to_string(fsel.step) + ", last " + std::to_string(fsel.last) + ") contains no "
            "frames.", "mdscan.rmsd");
  }
  switch (rmsdcon.getTask()) {
  case RMSDTask::REFERENCE:
    {
      // The reference is given by its position in the selection, but reported by its raw index
      const int ref_pos = rmsdcon.getReferenceFrame();
      if (ref_pos != no_frame_index && ref_pos > static_cast<int>(frames.size())) {
        rtErr("Reference frame " + std::to_string(ref_pos) + " is not among the " +
              std::to_string(frames.size()) + " selected frames.", "mdscan.rmsd");
      }
      const int ref_frame = (ref_pos == no_frame_index) ? iter.getSelection().first :
                                                          frames[ref_pos - 1];
      const std::vector<double> values = rmsdOverTrajectory(&iter, atom_indices, weights,
                                                            rmsdcon.getReferenceFrame(),
                                                            rmsdcon.getAlignment());
      reportReferenceRmsd(frames, values, ref_frame, rmsdcon.getReportFileName());
    }
    break;
  case RMSDTask::MATRIX:
    {
      const std::vector<double> values = rmsdMatrix(&iter, atom_indices, weights,
                                                    rmsdcon.getAlignment());
      reportRmsdMatrix(frames, values, rmsdcon.getReportFileName());
    }
    break;
  }
  iter.close();
  return 0;
}
