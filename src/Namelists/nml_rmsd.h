// -*-c++-*-
#ifndef MDSCAN_NML_RMSD_H
#define MDSCAN_NML_RMSD_H

#include <string>
#include <vector>
#include "copyright.h"
#include "Constants/behavior.h"
#include "Parsing/textfile.h"
#include "Structure/structure_enumerators.h"
#include "Topology/atom_record.h"
#include "input.h"
#include "namelist_emulator.h"

namespace mdscan {
namespace namelist {

using constants::ExceptionResponse;
using parse::TextFile;
using parse::WrapTextSearch;
using structure::RmsdAlignment;
using structure::RMSDTask;
using topology::AtomRecord;

/// \brief Default values for the &rmsd namelist
/// \{
constexpr char default_rmsd_task[] = "REFERENCE";
constexpr char default_rmsd_alignment[] = "yes";
constexpr int default_rmsd_reference_frame = -1;
/// \}

/// \brief Collect directives for RMSD analysis of a trajectory: the atoms to compare, the
///        reference, and where to put the results.
class RmsdControls {
public:

  /// \brief The constructor can prepare an object with default settings or read the corresponding
  ///        namelist to accept user input.
  ///
  /// \param tf          Input file translated into RAM
  /// \param start_line  Line of the input file to begin searching for the &rmsd namelist
  /// \param found_nml   Indicator of whether namelist input was found
  /// \param policy_in   Requested error handling behavior
  /// \param wrap        Indicate that the search for an &rmsd namelist should carry on from the
  ///                    beginning of an input file if no such namelist is found starting from
  ///                    the original starting point
  /// \{
  RmsdControls(ExceptionResponse policy_in = ExceptionResponse::DIE);
  RmsdControls(const TextFile &tf, int *start_line, bool *found_nml,
               ExceptionResponse policy_in = ExceptionResponse::DIE,
               WrapTextSearch wrap = WrapTextSearch::YES);
  /// \}

  /// \brief Get the order of the calculation: all frames to one reference, or all to all.
  RMSDTask getTask() const;

  /// \brief Get the names of atoms selected for comparison.
  const std::vector<std::string>& getAtomNames() const;

  /// \brief Get the list of atom indices selected for comparison, as given in the input.
  const std::string& getAtomRange() const;

  /// \brief Get the position of the reference frame in the selection (-1 for the first frame).
  int getReferenceFrame() const;

  /// \brief Get the directive on superimposing frames before comparing them.
  RmsdAlignment getAlignment() const;

  /// \brief Indicate whether atoms are weighted by their masses in the superposition.
  bool useMassWeighting() const;

  /// \brief Get the name of the file to which results will be written (blank for none).
  const std::string& getReportFileName() const;

  /// \brief Resolve the atom names and index list against a topology, returning the sorted,
  ///        unique indices of all selected atoms.  All atoms are selected if neither names nor
  ///        indices were given.
  ///
  /// \param atoms  The topology
  std::vector<int> getAtomIndices(const std::vector<AtomRecord> &atoms) const;

  /// \brief Set the order of the calculation.
  ///
  /// \param task_in  Name of the task, REFERENCE or MATRIX
  void setTask(const std::string &task_in);

  /// \brief Add an atom name to the selection.
  ///
  /// \param atom_name  Name of the atoms to add, as it appears in the structure file
  void addAtomName(const std::string &atom_name);

  /// \brief Set the list of atom indices to select, i.e. "0-9, 15".
  ///
  /// \param atom_range_in  The list of atom indices
  void setAtomRange(const std::string &atom_range_in);

  /// \brief Set the reference frame.  Invalid frame numbers are handled according to the
  ///        object's policy, and replaced by the default if they do not raise an error.
  ///
  /// \param reference_frame_in  Position of the reference frame among the selected frames
  void setReferenceFrame(int reference_frame_in);

  /// \brief Set the directive on superimposing frames before comparing them.
  ///
  /// \param alignment_in  "yes" or "no", or the name of the enumeration
  void setAlignment(const std::string &alignment_in);

  /// \brief Set whether atoms are weighted by their masses in the superposition.
  ///
  /// \param mass_weighting_in  The new setting
  void setMassWeighting(bool mass_weighting_in);

  /// \brief Set the name of the file to which results will be written.
  ///
  /// \param file_name  The new file name
  void setReportFileName(const std::string &file_name);

private:
  ExceptionResponse policy;             ///< Set the behavior when bad inputs are encountered
  RMSDTask task;                        ///< All frames to one reference, or all to all
  std::vector<std::string> atom_names;  ///< Names of atoms selected for comparison
  std::string atom_range;               ///< Indices of atoms selected for comparison
  int reference_frame;                  ///< Position of the reference among selected frames
  RmsdAlignment alignment;              ///< Whether to superimpose frames before comparison
  bool mass_weighting;                  ///< Whether to weight atoms by mass in superposition
  std::string report_file;              ///< File to which results will be written

  /// \brief Respond to an invalid setting according to the object's policy.
  ///
  /// \param message  Description of the problem
  /// \param caller   Name of the calling function
  void badInputResponse(const std::string &message, const char* caller) const;
};

/// \brief Produce a namelist for specifying an RMSD analysis.
///
/// \param tf          Input text file to scan immediately after the namelist is created
/// \param start_line  Line at which to begin scanning the input file for the namelist
/// \param found       Indicate that the namelist was found
/// \param policy      Reaction to exceptions encountered during namelist reading
/// \param wrap        Indicate that the search for an &rmsd namelist should carry on from the
///                    beginning of an input file if no such namelist is found starting from the
///                    original starting point
NamelistEmulator rmsdInput(const TextFile &tf, int *start_line, bool *found,
                           ExceptionResponse policy = ExceptionResponse::DIE,
                           WrapTextSearch wrap = WrapTextSearch::YES);

} // namespace namelist
} // namespace mdscan

#endif
