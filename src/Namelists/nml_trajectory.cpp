#include "copyright.h"
#include "Reporting/error_format.h"
#include "namelist_element.h"
#include "nml_trajectory.h"

namespace mdscan {
namespace namelist {

using trajectory::translateCoordinateFileKind;

//-------------------------------------------------------------------------------------------------
TrajectoryControls::TrajectoryControls(const ExceptionResponse policy_in) :
    policy{policy_in}, structure_file{}, trajectory_file{},
    format{translateCoordinateFileKind(default_trajectory_format)},
    first{default_trajectory_first}, step{default_trajectory_step},
    last{default_trajectory_last}
{}

//-------------------------------------------------------------------------------------------------
TrajectoryControls::TrajectoryControls(const TextFile &tf, int *start_line, bool *found_nml,
                                       const ExceptionResponse policy_in,
                                       const WrapTextSearch wrap) :
    TrajectoryControls(policy_in)
{
  const NamelistEmulator t_nml = trajectoryInput(tf, start_line, found_nml, policy, wrap);
  if (t_nml.getKeywordStatus("structure") != InputStatus::MISSING) {
    setStructureFileName(t_nml.getStringValue("structure"));
  }
  if (t_nml.getKeywordStatus("trajectory") != InputStatus::MISSING) {
    setTrajectoryFileName(t_nml.getStringValue("trajectory"));
  }
  setTrajectoryFormat(t_nml.getStringValue("format"));
  setSelection(t_nml.getIntValue("first"), t_nml.getIntValue("step"), t_nml.getIntValue("last"));
}

//-------------------------------------------------------------------------------------------------
const std::string& TrajectoryControls::getStructureFileName() const {
  return structure_file;
}

//-------------------------------------------------------------------------------------------------
const std::string& TrajectoryControls::getTrajectoryFileName() const {
  return trajectory_file;
}

//-------------------------------------------------------------------------------------------------
CoordinateFileKind TrajectoryControls::getTrajectoryFormat() const {
  return format;
}

//-------------------------------------------------------------------------------------------------
FrameSelection TrajectoryControls::getSelection() const {
  return FrameSelection(first, step, last);
}

//-------------------------------------------------------------------------------------------------
void TrajectoryControls::setStructureFileName(const std::string &file_name) {
  structure_file = file_name;
}

//-------------------------------------------------------------------------------------------------
void TrajectoryControls::setTrajectoryFileName(const std::string &file_name) {
  trajectory_file = file_name;
}

//-------------------------------------------------------------------------------------------------
void TrajectoryControls::setTrajectoryFormat(const std::string &format_in) {
  format = translateCoordinateFileKind(format_in);
}

//-------------------------------------------------------------------------------------------------
void TrajectoryControls::badInputResponse(const std::string &message, const char* caller) const {
  switch (policy) {
  case ExceptionResponse::DIE:
    rtErr(message, "TrajectoryControls", caller);
    break;
  case ExceptionResponse::WARN:
    rtWarn(message + "  The default will be restored.", "TrajectoryControls", caller);
    break;
  case ExceptionResponse::SILENT:
    break;
  }
}

//-------------------------------------------------------------------------------------------------
void TrajectoryControls::setSelection(const int first_in, const int step_in, const int last_in) {
  first = first_in;
  step = step_in;
  last = last_in;
  if (first < 1) {
    badInputResponse("The first frame must be at least 1 (" + std::to_string(first) +
                     " given).", "setSelection");
    first = default_trajectory_first;
  }
  if (step < 1) {
    badInputResponse("The frame step must be at least 1 (" + std::to_string(step) + " given).",
                     "setSelection");
    step = default_trajectory_step;
  }
  if (last < 0 && last != trajectory::default_final_frame) {
    badInputResponse("The last frame must be non-negative, or " +
                     std::to_string(trajectory::default_final_frame) + " to run to the end of "
                     "the trajectory (" + std::to_string(last) + " given).", "setSelection");
    last = default_trajectory_last;
  }
}

//-------------------------------------------------------------------------------------------------
NamelistEmulator trajectoryInput(const TextFile &tf, int *start_line, bool *found,
                                 const ExceptionResponse policy, const WrapTextSearch wrap) {
  NamelistEmulator t_nml("trajectory", CaseSensitivity::NO, policy, "Name the topology and "
                         "trajectory files of a simulation and select the frames to analyze.");
  t_nml.addKeyword(NamelistElement("structure", NamelistType::STRING));
  t_nml.addKeyword(NamelistElement("trajectory", NamelistType::STRING));
  t_nml.addKeyword(NamelistElement("format", NamelistType::STRING,
                                   std::string(default_trajectory_format)));
  t_nml.addKeyword(NamelistElement("first", NamelistType::INTEGER,
                                   std::to_string(default_trajectory_first)));
  t_nml.addKeyword(NamelistElement("step", NamelistType::INTEGER,
                                   std::to_string(default_trajectory_step)));
  t_nml.addKeyword(NamelistElement("last", NamelistType::INTEGER,
                                   std::to_string(default_trajectory_last)));
  t_nml.addHelp("structure", "Protein Data Bank file with the atoms of the system, in the order "
                "of the trajectory.");
  t_nml.addHelp("trajectory", "Trajectory file to analyze.");
  t_nml.addHelp("format", "Format of the trajectory file: AMBER_CRD (also CRD or MDCRD), "
                "AMBER_NETCDF (also NETCDF or NC), or AUTO to detect the format from the file.");
  t_nml.addHelp("first", "First frame to analyze, counting from 1.");
  t_nml.addHelp("step", "Stride between analyzed frames.");
  t_nml.addHelp("last", "Last frame that may be analyzed.  The default of -1 runs to the end of "
                "the trajectory.");
  *start_line = readNamelist(tf, &t_nml, *start_line, wrap, tf.getLineCount(), found);
  return t_nml;
}

} // namespace namelist
} // namespace mdscan
