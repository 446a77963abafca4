// -*-c++-*-
#ifndef MDSCAN_ATOM_RECORD_H
#define MDSCAN_ATOM_RECORD_H

#include <string>
#include <vector>
#include "copyright.h"
#include "DataTypes/mdscan_vector_types.h"

namespace mdscan {
namespace topology {

/// \brief One atom of a molecular system, as described by a structure file.  The record carries
///        the atom's identity, its mass, and a mutable position which may be refreshed from any
///        frame of a trajectory.
class AtomRecord {
public:

  /// \brief The constructor accepts all identifying details.  The mass is inferred from the
  ///        element if it is not given (a negative mass indicates that it should be inferred).
  ///
  /// Overloaded:
  ///   - Create a blank record (a virtual site of zero mass at the origin)
  ///   - Create a record from its identifying details
  ///
  /// \param serial_in        Serial number of the atom in its structure file
  /// \param atom_name_in     Name of the atom, i.e. "CA"
  /// \param residue_name_in  Name of the residue, i.e. "ALA"
  /// \param residue_number_in  Number of the residue
  /// \param chain_in         Chain identifier
  /// \param element_in       Element symbol
  /// \param mass_in          Mass of the atom, in Daltons
  /// \param x_in             Cartesian X coordinate
  /// \param y_in             Cartesian Y coordinate
  /// \param z_in             Cartesian Z coordinate
  /// \{
  AtomRecord();
  AtomRecord(int serial_in, const std::string &atom_name_in, const std::string &residue_name_in,
             int residue_number_in, const std::string &chain_in, const std::string &element_in,
             double mass_in = -1.0, double x_in = 0.0, double y_in = 0.0, double z_in = 0.0);
  /// \}

  /// \brief Get the serial number of the atom.
  int getSerialNumber() const;

  /// \brief Get the atom name.
  const std::string& getAtomName() const;

  /// \brief Get the residue name.
  const std::string& getResidueName() const;

  /// \brief Get the residue number.
  int getResidueNumber() const;

  /// \brief Get the chain identifier.
  const std::string& getChain() const;

  /// \brief Get the element symbol.
  const std::string& getElement() const;

  /// \brief Get the mass of the atom.
  double getMass() const;

  /// \brief Get the position of the atom.
  double3 getPosition() const;

  /// \brief Set the position of the atom.
  ///
  /// \param x_in  Cartesian X coordinate
  /// \param y_in  Cartesian Y coordinate
  /// \param z_in  Cartesian Z coordinate
  void setPosition(double x_in, double y_in, double z_in);

private:
  int serial;              ///< Serial number of the atom in its structure file
  std::string atom_name;   ///< Name of the atom
  std::string residue_name;  ///< Name of the residue to which the atom belongs
  int residue_number;      ///< Number of the residue to which the atom belongs
  std::string chain;       ///< Chain identifier
  std::string element;     ///< Element symbol
  double mass;             ///< Mass of the atom
  double3 position;        ///< Current position of the atom
};

/// \brief Get the masses of a series of atoms.  Any type with a getMass() member function will
///        do.
///
/// Overloaded:
///   - Get the masses of all atoms
///   - Get the masses of a subset of the atoms
///
/// \param atoms         The atoms of interest
/// \param atom_indices  Indices of the subset of atoms (0-based)
/// \{
template <typename T> std::vector<double> getAtomMasses(const std::vector<T> &atoms);

template <typename T> std::vector<double> getAtomMasses(const std::vector<T> &atoms,
                                                        const std::vector<int> &atom_indices);
/// \}

/// \brief Transcribe the positions of one frame into a series of atoms.  Any type with a
///        setPosition(double, double, double) member function will do.
///
/// \param atoms   The atoms to modify
/// \param xcrd    Cartesian X coordinates of the frame
/// \param ycrd    Cartesian Y coordinates of the frame
/// \param zcrd    Cartesian Z coordinates of the frame
/// \param natom   The number of atoms in the frame, which must match the number of atoms
template <typename T, typename Tcoord>
void transcribeFramePositions(std::vector<T> *atoms, const Tcoord* xcrd, const Tcoord* ycrd,
                              const Tcoord* zcrd, int natom);

/// \brief Find the indices of all atoms with a particular name.
///
/// \param atoms      The atoms to search
/// \param atom_name  Name of the atoms of interest
std::vector<int> findAtomsByName(const std::vector<AtomRecord> &atoms,
                                 const std::string &atom_name);

} // namespace topology
} // namespace mdscan

#include "atom_record.tpp"

#endif
