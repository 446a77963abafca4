// -*-c++-*-
#include "copyright.h"
#include "Reporting/error_format.h"

namespace mdscan {
namespace topology {

//-------------------------------------------------------------------------------------------------
template <typename T> std::vector<double> getAtomMasses(const std::vector<T> &atoms) {
  const size_t natom = atoms.size();
  std::vector<double> result(natom);
  for (size_t i = 0; i < natom; i++) {
    result[i] = atoms[i].getMass();
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
template <typename T> std::vector<double> getAtomMasses(const std::vector<T> &atoms,
                                                        const std::vector<int> &atom_indices) {
  const int natom = atoms.size();
  const size_t nidx = atom_indices.size();
  std::vector<double> result(nidx);
  for (size_t i = 0; i < nidx; i++) {
    const int atom_idx = atom_indices[i];
    if (atom_idx < 0 || atom_idx >= natom) {
      rtErr(errors::ErrorKind::OUT_OF_RANGE, "Atom index " + std::to_string(atom_idx) +
            " is invalid for a system of " + std::to_string(natom) + " atoms.", "getAtomMasses");
    }
    result[i] = atoms[atom_idx].getMass();
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
template <typename T, typename Tcoord>
void transcribeFramePositions(std::vector<T> *atoms, const Tcoord* xcrd, const Tcoord* ycrd,
                              const Tcoord* zcrd, const int natom) {
  if (static_cast<int>(atoms->size()) != natom) {
    rtErr(errors::ErrorKind::DIMENSION_MISMATCH, "A frame of " + std::to_string(natom) +
          " atoms cannot be transcribed into a topology of " + std::to_string(atoms->size()) +
          " atoms.", "transcribeFramePositions");
  }
  T* atom_ptr = atoms->data();
  for (int i = 0; i < natom; i++) {
    atom_ptr[i].setPosition(xcrd[i], ycrd[i], zcrd[i]);
  }
}

} // namespace topology
} // namespace mdscan
