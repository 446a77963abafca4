// -*-c++-*-
#ifndef MDSCAN_PDB_H
#define MDSCAN_PDB_H

#include <string>
#include <vector>
#include "copyright.h"
#include "Parsing/textfile.h"
#include "Topology/atom_record.h"

namespace mdscan {
namespace structure {

using parse::TextFile;
using topology::AtomRecord;

/// \brief Read the atoms of a Protein Data Bank file.  Only ATOM and HETATM records of the first
///        model are taken, and of atoms with alternate locations only the blank or 'A' location
///        is kept.  The element is read from columns 77-78 if present, otherwise inferred from
///        the atom name.  Masses follow from the element.
///
/// Overloaded:
///   - Read from a named file (an OpenError is raised if the file cannot be read)
///   - Read from text already in memory
///
/// \param file_name  Name of the PDB file
/// \param tf         Text of the PDB file
/// \{
std::vector<AtomRecord> readPdbAtoms(const std::string &file_name);
std::vector<AtomRecord> readPdbAtoms(const TextFile &tf);
/// \}

} // namespace structure
} // namespace mdscan

#endif
