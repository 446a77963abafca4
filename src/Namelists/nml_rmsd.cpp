#include <algorithm>
#include "copyright.h"
#include "Parsing/parse.h"
#include "Reporting/error_format.h"
#include "namelist_element.h"
#include "nml_rmsd.h"

namespace mdscan {
namespace namelist {

using parse::parseIndexList;
using structure::translateRmsdAlignment;
using structure::translateRMSDTask;
using topology::findAtomsByName;

//-------------------------------------------------------------------------------------------------
RmsdControls::RmsdControls(const ExceptionResponse policy_in) :
    policy{policy_in}, task{translateRMSDTask(default_rmsd_task)}, atom_names{}, atom_range{},
    reference_frame{default_rmsd_reference_frame},
    alignment{translateRmsdAlignment(default_rmsd_alignment)}, mass_weighting{false},
    report_file{}
{}

//-------------------------------------------------------------------------------------------------
RmsdControls::RmsdControls(const TextFile &tf, int *start_line, bool *found_nml,
                           const ExceptionResponse policy_in, const WrapTextSearch wrap) :
    RmsdControls(policy_in)
{
  const NamelistEmulator t_nml = rmsdInput(tf, start_line, found_nml, policy, wrap);
  setTask(t_nml.getStringValue("task"));
  const std::vector<std::string> names = t_nml.getAllStringValues("atom_name");
  for (size_t i = 0; i < names.size(); i++) {
    addAtomName(names[i]);
  }
  if (t_nml.getKeywordStatus("atom_range") != InputStatus::MISSING) {
    setAtomRange(t_nml.getStringValue("atom_range"));
  }
  setReferenceFrame(t_nml.getIntValue("reference_frame"));
  setAlignment(t_nml.getStringValue("align"));
  setMassWeighting(t_nml.getBoolValue("mass_weighting"));
  if (t_nml.getKeywordStatus("report") != InputStatus::MISSING) {
    setReportFileName(t_nml.getStringValue("report"));
  }
}

//-------------------------------------------------------------------------------------------------
RMSDTask RmsdControls::getTask() const {
  return task;
}

//-------------------------------------------------------------------------------------------------
const std::vector<std::string>& RmsdControls::getAtomNames() const {
  return atom_names;
}

//-------------------------------------------------------------------------------------------------
const std::string& RmsdControls::getAtomRange() const {
  return atom_range;
}

//-------------------------------------------------------------------------------------------------
int RmsdControls::getReferenceFrame() const {
  return reference_frame;
}

//-------------------------------------------------------------------------------------------------
RmsdAlignment RmsdControls::getAlignment() const {
  return alignment;
}

//-------------------------------------------------------------------------------------------------
bool RmsdControls::useMassWeighting() const {
  return mass_weighting;
}

//-------------------------------------------------------------------------------------------------
const std::string& RmsdControls::getReportFileName() const {
  return report_file;
}

//-------------------------------------------------------------------------------------------------
std::vector<int> RmsdControls::getAtomIndices(const std::vector<AtomRecord> &atoms) const {
  const int natom = atoms.size();
  std::vector<int> result;
  if (atom_names.size() == 0 && atom_range.size() == 0) {
    result.resize(natom);
    for (int i = 0; i < natom; i++) {
      result[i] = i;
    }
    return result;
  }
  for (size_t i = 0; i < atom_names.size(); i++) {
    const std::vector<int> named = findAtomsByName(atoms, atom_names[i]);
    if (named.size() == 0) {
      badInputResponse("No atoms are named " + atom_names[i] + ".", "getAtomIndices");
    }
    result.insert(result.end(), named.begin(), named.end());
  }
  if (atom_range.size() > 0) {
    const std::vector<int> listed = parseIndexList(atom_range, natom);
    result.insert(result.end(), listed.begin(), listed.end());
  }
  std::sort(result.begin(), result.end());
  result.erase(std::unique(result.begin(), result.end()), result.end());
  if (result.size() == 0) {
    rtErr("The atom selection matches no atoms.", "RmsdControls", "getAtomIndices");
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
void RmsdControls::setTask(const std::string &task_in) {
  task = translateRMSDTask(task_in);
}

//-------------------------------------------------------------------------------------------------
void RmsdControls::addAtomName(const std::string &atom_name) {
  atom_names.push_back(atom_name);
}

//-------------------------------------------------------------------------------------------------
void RmsdControls::setAtomRange(const std::string &atom_range_in) {
  atom_range = atom_range_in;
}

//-------------------------------------------------------------------------------------------------
void RmsdControls::badInputResponse(const std::string &message, const char* caller) const {
  switch (policy) {
  case ExceptionResponse::DIE:
    rtErr(message, "RmsdControls", caller);
    break;
  case ExceptionResponse::WARN:
    rtWarn(message, "RmsdControls", caller);
    break;
  case ExceptionResponse::SILENT:
    break;
  }
}

//-------------------------------------------------------------------------------------------------
void RmsdControls::setReferenceFrame(const int reference_frame_in) {
  if (reference_frame_in < 1 && reference_frame_in != default_rmsd_reference_frame) {
    badInputResponse("The reference frame must be at least 1, or " +
                     std::to_string(default_rmsd_reference_frame) + " to use the first "
                     "selected frame (" + std::to_string(reference_frame_in) + " given).  The "
                     "first selected frame will be used.", "setReferenceFrame");
    reference_frame = default_rmsd_reference_frame;
  }
  else {
    reference_frame = reference_frame_in;
  }
}

//-------------------------------------------------------------------------------------------------
void RmsdControls::setAlignment(const std::string &alignment_in) {
  alignment = translateRmsdAlignment(alignment_in);
}

//-------------------------------------------------------------------------------------------------
void RmsdControls::setMassWeighting(const bool mass_weighting_in) {
  mass_weighting = mass_weighting_in;
}

//-------------------------------------------------------------------------------------------------
void RmsdControls::setReportFileName(const std::string &file_name) {
  report_file = file_name;
}

//-------------------------------------------------------------------------------------------------
NamelistEmulator rmsdInput(const TextFile &tf, int *start_line, bool *found,
                           const ExceptionResponse policy, const WrapTextSearch wrap) {
  NamelistEmulator t_nml("rmsd", CaseSensitivity::NO, policy, "Compute the positional root "
                         "mean squared deviation of selected atoms across a trajectory.");
  t_nml.addKeyword(NamelistElement("task", NamelistType::STRING, std::string(default_rmsd_task)));
  t_nml.addKeyword(NamelistElement("atom_name", NamelistType::STRING, std::string(""),
                                   InputRepeats::YES));
  t_nml.addKeyword(NamelistElement("atom_range", NamelistType::STRING));
  t_nml.addKeyword(NamelistElement("reference_frame", NamelistType::INTEGER,
                                   std::to_string(default_rmsd_reference_frame)));
  t_nml.addKeyword(NamelistElement("align", NamelistType::STRING,
                                   std::string(default_rmsd_alignment)));
  t_nml.addKeyword(NamelistElement("mass_weighting", NamelistType::BOOLEAN));
  t_nml.addKeyword(NamelistElement("report", NamelistType::STRING));
  t_nml.addHelp("task", "REFERENCE to compare every selected frame to one reference frame, or "
                "MATRIX to compare every selected frame to every other.");
  t_nml.addHelp("atom_name", "Name of atoms to compare, i.e. CA.  This keyword may be repeated.");
  t_nml.addHelp("atom_range", "Indices of atoms to compare, counting from 0, i.e. '0-9, 15'.  "
                "These are combined with any atoms selected by name.  All atoms are compared if "
                "no atoms are selected.");
  t_nml.addHelp("reference_frame", "Position of the reference frame among the selected frames, "
                "counting the first selected frame as 1.  With first = 2 and step = 2 in the "
                "&trajectory namelist, a value of 2 takes frame 4 of the trajectory.  The default "
                "of -1 takes the first selected frame.");
  t_nml.addHelp("align", "Superimpose frames before comparing them (yes or no).");
  t_nml.addHelp("mass_weighting", "Weight atoms by their masses when superimposing frames.");
  t_nml.addHelp("report", "File to which results will be written.  Results are printed to the "
                "terminal in any case.");
  *start_line = readNamelist(tf, &t_nml, *start_line, wrap, tf.getLineCount(), found);
  return t_nml;
}

} // namespace namelist
} // namespace mdscan
