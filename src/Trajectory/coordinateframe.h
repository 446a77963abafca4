// -*-c++-*-
#ifndef MDSCAN_COORDINATEFRAME_H
#define MDSCAN_COORDINATEFRAME_H

#include <string>
#include <vector>
#include "copyright.h"
#include "trajectory_enumerators.h"

namespace mdscan {
namespace trajectory {

struct CoordinateFrameWriter;

/// \brief Collect C-style pointers for a read-only view of a CoordinateFrame.  The view borrows
///        from the frame and is invalidated by any subsequent read into the same frame.
struct CoordinateFrameReader {

  /// \brief The constructor takes all of the frame's member pointers verbatim, or converts a
  ///        writeable view of the same frame.
  ///
  /// \param cfw  Writeable view of the frame to present as read-only
  /// \{
  CoordinateFrameReader(int natom_in, UnitCellType unit_cell_in, const double* xcrd_in,
                        const double* ycrd_in, const double* zcrd_in, const double* umat_in,
                        const double* invu_in, const double* boxdim_in);

  CoordinateFrameReader(const CoordinateFrameWriter &cfw);
  /// \}

  const int natom;               ///< The number of atoms in the frame
  const UnitCellType unit_cell;  ///< The type of unit cell
  const double* xcrd;            ///< Cartesian X coordinates of all particles
  const double* ycrd;            ///< Cartesian Y coordinates of all particles
  const double* zcrd;            ///< Cartesian Z coordinates of all particles
  const double* umat;            ///< Transformation matrix to take coordinates into box
                                 ///<   (fractional) space
  const double* invu;            ///< Transformation matrix to take coordinates into real space.
                                 ///<   The columns of this matrix are the box vectors.
  const double* boxdim;          ///< Box lengths followed by box angles (in radians)
};

/// \brief Collect C-style pointers for a writeable view of a CoordinateFrame.  Trajectory readers
///        fill frames through this view.
struct CoordinateFrameWriter {

  /// \brief The constructor takes all of the frame's member pointers verbatim.
  CoordinateFrameWriter(int natom_in, UnitCellType unit_cell_in, double* xcrd_in,
                        double* ycrd_in, double* zcrd_in, double* umat_in, double* invu_in,
                        double* boxdim_in);

  const int natom;               ///< The number of atoms in the frame
  const UnitCellType unit_cell;  ///< The type of unit cell
  double* xcrd;                  ///< Cartesian X coordinates of all particles
  double* ycrd;                  ///< Cartesian Y coordinates of all particles
  double* zcrd;                  ///< Cartesian Z coordinates of all particles
  double* umat;                  ///< Transformation matrix into fractional space
  double* invu;                  ///< Transformation matrix back to real space
  double* boxdim;                ///< Box lengths followed by box angles (in radians)
};

/// \brief Store the coordinates and box information for one frame of a trajectory.  A single
///        frame of this kind is reused as the buffer for every read of a trajectory.
class CoordinateFrame {
public:

  /// \brief The constructor allocates space for a frame and sets the box to the identity, or
  ///        takes coordinates from existing arrays.
  ///
  /// Overloaded:
  ///   - Allocate a blank frame for some number of atoms
  ///   - Take the coordinates from C-style arrays, with box dimensions as lengths and angles (in
  ///     radians).  A null pointer for the box dimensions indicates that there is no unit cell.
  ///
  /// \param natom_in      The number of atoms in the frame
  /// \param unit_cell_in  The type of unit cell
  /// \param xcrd_in       Cartesian X coordinates of all particles
  /// \param ycrd_in       Cartesian Y coordinates of all particles
  /// \param zcrd_in       Cartesian Z coordinates of all particles
  /// \param boxdim_in     Box lengths and angles
  /// \{
  CoordinateFrame(int natom_in = 0, UnitCellType unit_cell_in = UnitCellType::NONE);

  CoordinateFrame(int natom_in, const double* xcrd_in, const double* ycrd_in,
                  const double* zcrd_in, const double* boxdim_in = nullptr);
  /// \}

  /// \brief Get the number of atoms in the frame.
  int getAtomCount() const;

  /// \brief Get the type of the unit cell.
  UnitCellType getUnitCellType() const;

  /// \brief Get the coordinates of all atoms in the frame, interlaced as X, Y, Z.
  std::vector<double> getInterlacedCoordinates() const;

  /// \brief Get the transformation matrix taking coordinates into box (fractional) space.
  std::vector<double> getBoxSpaceTransform() const;

  /// \brief Get the transformation matrix taking fractional coordinates back into real space.
  std::vector<double> getInverseTransform() const;

  /// \brief Get the box lengths and angles.
  std::vector<double> getBoxDimensions() const;

  /// \brief Get a read-only abstract of the frame.
  const CoordinateFrameReader data() const;

  /// \brief Get a writeable abstract of the frame.
  CoordinateFrameWriter data();

private:
  int atom_count;                          ///< The number of atoms in the frame
  UnitCellType unit_cell;                  ///< The type of unit cell
  std::vector<double> x_coordinates;       ///< Cartesian X coordinates of all particles
  std::vector<double> y_coordinates;       ///< Cartesian Y coordinates of all particles
  std::vector<double> z_coordinates;       ///< Cartesian Z coordinates of all particles
  std::vector<double> box_space_transform; ///< Matrix to transform coordinates into box space
  std::vector<double> inverse_transform;   ///< Matrix to transform coordinates into real space
  std::vector<double> box_dimensions;      ///< Three box lengths, then three box angles
};

/// \brief Set the box of a frame from its lengths and angles, computing both transformation
///        matrices.  Frames with no unit cell get the identity transformation and right angles.
///
/// \param cfw    Writeable abstract of the frame to modify
/// \param lx     Length of the first box vector
/// \param ly     Length of the second box vector
/// \param lz     Length of the third box vector
/// \param alpha  Angle between the second and third box vectors, in radians
/// \param beta   Angle between the first and third box vectors, in radians
/// \param gamma  Angle between the first and second box vectors, in radians
/// \{
void setFrameBox(CoordinateFrameWriter *cfw, double lx, double ly, double lz, double alpha,
                 double beta, double gamma);

void setFrameBox(CoordinateFrameWriter *cfw);
/// \}

} // namespace trajectory
} // namespace mdscan

#endif
