// -*-c++-*-
#ifndef MDSCAN_NML_TRAJECTORY_H
#define MDSCAN_NML_TRAJECTORY_H

#include <string>
#include "copyright.h"
#include "Constants/behavior.h"
#include "Parsing/textfile.h"
#include "Trajectory/frame_iterator.h"
#include "Trajectory/trajectory_enumerators.h"
#include "input.h"
#include "namelist_emulator.h"

namespace mdscan {
namespace namelist {

using constants::ExceptionResponse;
using parse::TextFile;
using parse::WrapTextSearch;
using trajectory::CoordinateFileKind;
using trajectory::FrameSelection;

/// \brief Default values for the &trajectory namelist
/// \{
constexpr char default_trajectory_format[] = "AUTO";
constexpr int default_trajectory_first = 1;
constexpr int default_trajectory_step = 1;
constexpr int default_trajectory_last = trajectory::default_final_frame;
/// \}

/// \brief Collect the files and the frame selection of a trajectory to analyze.
class TrajectoryControls {
public:

  /// \brief The constructor can prepare an object with default settings or read the corresponding
  ///        namelist to accept user input.
  ///
  /// \param tf          Input file translated into RAM
  /// \param start_line  Line of the input file to begin searching for the &trajectory namelist
  /// \param found_nml   Indicator of whether namelist input was found
  /// \param policy_in   Requested error handling behavior
  /// \param wrap        Indicate that the search for a &trajectory namelist should carry on from
  ///                    the beginning of an input file if no such namelist is found starting
  ///                    from the original starting point
  /// \{
  TrajectoryControls(ExceptionResponse policy_in = ExceptionResponse::DIE);
  TrajectoryControls(const TextFile &tf, int *start_line, bool *found_nml,
                     ExceptionResponse policy_in = ExceptionResponse::DIE,
                     WrapTextSearch wrap = WrapTextSearch::YES);
  /// \}

  /// \brief Get the name of the PDB file with the topology.
  const std::string& getStructureFileName() const;

  /// \brief Get the name of the trajectory file.
  const std::string& getTrajectoryFileName() const;

  /// \brief Get the format of the trajectory file (UNKNOWN calls for detection).
  CoordinateFileKind getTrajectoryFormat() const;

  /// \brief Get the frame selection.
  FrameSelection getSelection() const;

  /// \brief Set the name of the PDB file.
  ///
  /// \param file_name  The new file name
  void setStructureFileName(const std::string &file_name);

  /// \brief Set the name of the trajectory file.
  ///
  /// \param file_name  The new file name
  void setTrajectoryFileName(const std::string &file_name);

  /// \brief Set the format of the trajectory file.
  ///
  /// \param format_in  Name of the format, "AUTO" to detect it from the file
  void setTrajectoryFormat(const std::string &format_in);

  /// \brief Set the frame selection.  Invalid settings are handled according to the object's
  ///        policy, and replaced by defaults if they do not raise an error.
  ///
  /// \param first_in  The first frame to visit
  /// \param step_in   Stride between visited frames
  /// \param last_in   The last frame that may be visited
  void setSelection(int first_in, int step_in, int last_in);

private:
  ExceptionResponse policy;     ///< Set the behavior when bad inputs are encountered
  std::string structure_file;   ///< Name of the PDB file with the topology
  std::string trajectory_file;  ///< Name of the trajectory file
  CoordinateFileKind format;    ///< Format of the trajectory file
  int first;                    ///< The first frame to visit
  int step;                     ///< Stride between visited frames
  int last;                     ///< The last frame that may be visited

  /// \brief Respond to an invalid setting according to the object's policy.
  ///
  /// \param message  Description of the problem
  /// \param caller   Name of the calling function
  void badInputResponse(const std::string &message, const char* caller) const;
};

/// \brief Produce a namelist for specifying the trajectory to analyze.
///
/// \param tf          Input text file to scan immediately after the namelist is created
/// \param start_line  Line at which to begin scanning the input file for the namelist (this
///                    will wrap back to the beginning of the file in search of a unique
///                    &trajectory namelist)
/// \param found       Indicate that the namelist was found
/// \param policy      Reaction to exceptions encountered during namelist reading
/// \param wrap        Indicate that the search for a &trajectory namelist should carry on from
///                    the beginning of an input file if no such namelist is found starting
///                    from the original starting point
NamelistEmulator trajectoryInput(const TextFile &tf, int *start_line, bool *found,
                                 ExceptionResponse policy = ExceptionResponse::DIE,
                                 WrapTextSearch wrap = WrapTextSearch::YES);

} // namespace namelist
} // namespace mdscan

#endif
