#include "copyright.h"
#include "Constants/symbol_values.h"
#include "Math/matrix_ops.h"
#include "Reporting/error_format.h"
#include "coordinateframe.h"

namespace mdscan {
namespace trajectory {

using math::computeBoxTransform;
using symbols::half_pi;

//-------------------------------------------------------------------------------------------------
CoordinateFrameReader::CoordinateFrameReader(const int natom_in, const UnitCellType unit_cell_in,
                                             const double* xcrd_in, const double* ycrd_in,
                                             const double* zcrd_in, const double* umat_in,
                                             const double* invu_in, const double* boxdim_in) :
    natom{natom_in}, unit_cell{unit_cell_in}, xcrd{xcrd_in}, ycrd{ycrd_in}, zcrd{zcrd_in},
    umat{umat_in}, invu{invu_in}, boxdim{boxdim_in}
{}

//-------------------------------------------------------------------------------------------------
CoordinateFrameReader::CoordinateFrameReader(const CoordinateFrameWriter &cfw) :
    natom{cfw.natom}, unit_cell{cfw.unit_cell}, xcrd{cfw.xcrd}, ycrd{cfw.ycrd}, zcrd{cfw.zcrd},
    umat{cfw.umat}, invu{cfw.invu}, boxdim{cfw.boxdim}
{}

//-------------------------------------------------------------------------------------------------
CoordinateFrameWriter::CoordinateFrameWriter(const int natom_in, const UnitCellType unit_cell_in,
                                             double* xcrd_in, double* ycrd_in, double* zcrd_in,
                                             double* umat_in, double* invu_in, double* boxdim_in) :
    natom{natom_in}, unit_cell{unit_cell_in}, xcrd{xcrd_in}, ycrd{ycrd_in}, zcrd{zcrd_in},
    umat{umat_in}, invu{invu_in}, boxdim{boxdim_in}
{}

//-------------------------------------------------------------------------------------------------
CoordinateFrame::CoordinateFrame(const int natom_in, const UnitCellType unit_cell_in) :
    atom_count{natom_in},
    unit_cell{unit_cell_in},
    x_coordinates(natom_in, 0.0),
    y_coordinates(natom_in, 0.0),
    z_coordinates(natom_in, 0.0),
    box_space_transform(9, 0.0),
    inverse_transform(9, 0.0),
    box_dimensions(6, 0.0)
{
  if (natom_in < 0) {
    rtErr(errors::ErrorKind::OUT_OF_RANGE, "A frame cannot hold " + std::to_string(natom_in) +
          " atoms.", "CoordinateFrame");
  }
  CoordinateFrameWriter cfw = data();
  setFrameBox(&cfw);
}

//-------------------------------------------------------------------------------------------------
CoordinateFrame::CoordinateFrame(const int natom_in, const double* xcrd_in, const double* ycrd_in,
                                 const double* zcrd_in, const double* boxdim_in) :
    CoordinateFrame(natom_in, UnitCellType::NONE)
{
  for (int i = 0; i < natom_in; i++) {
    x_coordinates[i] = xcrd_in[i];
    y_coordinates[i] = ycrd_in[i];
    z_coordinates[i] = zcrd_in[i];
  }
  if (boxdim_in != nullptr) {
    CoordinateFrameWriter cfw = data();
    setFrameBox(&cfw, boxdim_in[0], boxdim_in[1], boxdim_in[2], boxdim_in[3], boxdim_in[4],
                boxdim_in[5]);
    unit_cell = determineUnitCellTypeByShape(inverse_transform.data());
  }
}

//-------------------------------------------------------------------------------------------------
int CoordinateFrame::getAtomCount() const {
  return atom_count;
}

//-------------------------------------------------------------------------------------------------
UnitCellType CoordinateFrame::getUnitCellType() const {
  return unit_cell;
}

//-------------------------------------------------------------------------------------------------
std::vector<double> CoordinateFrame::getInterlacedCoordinates() const {
  std::vector<double> result(3 * atom_count);
  for (int i = 0; i < atom_count; i++) {
    result[(3 * i)    ] = x_coordinates[i];
    result[(3 * i) + 1] = y_coordinates[i];
    result[(3 * i) + 2] = z_coordinates[i];
  }
  return result;
}

//-------------------------------------------------------------------------------------------------
std::vector<double> CoordinateFrame::getBoxSpaceTransform() const {
  return box_space_transform;
}

//-------------------------------------------------------------------------------------------------
std::vector<double> CoordinateFrame::getInverseTransform() const {
  return inverse_transform;
}

//-------------------------------------------------------------------------------------------------
std::vector<double> CoordinateFrame::getBoxDimensions() const {
  return box_dimensions;
}

//-------------------------------------------------------------------------------------------------
const CoordinateFrameReader CoordinateFrame::data() const {
  return CoordinateFrameReader(atom_count, unit_cell, x_coordinates.data(), y_coordinates.data(),
                               z_coordinates.data(), box_space_transform.data(),
                               inverse_transform.data(), box_dimensions.data());
}

//-------------------------------------------------------------------------------------------------
CoordinateFrameWriter CoordinateFrame::data() {
  return CoordinateFrameWriter(atom_count, unit_cell, x_coordinates.data(), y_coordinates.data(),
                               z_coordinates.data(), box_space_transform.data(),
                               inverse_transform.data(), box_dimensions.data());
}

//-------------------------------------------------------------------------------------------------
void setFrameBox(CoordinateFrameWriter *cfw, const double lx, const double ly, const double lz,
                 const double alpha, const double beta, const double gamma) {
  if (lx <= 0.0 || ly <= 0.0 || lz <= 0.0) {
    rtErr("Box lengths " + std::to_string(lx) + ", " + std::to_string(ly) + ", " +
          std::to_string(lz) + " are invalid.", "setFrameBox");
  }
  computeBoxTransform(lx, ly, lz, alpha, beta, gamma, cfw->umat, cfw->invu);
  cfw->boxdim[0] = lx;
  cfw->boxdim[1] = ly;
  cfw->boxdim[2] = lz;
  cfw->boxdim[3] = alpha;
  cfw->boxdim[4] = beta;
  cfw->boxdim[5] = gamma;
}

//-------------------------------------------------------------------------------------------------
void setFrameBox(CoordinateFrameWriter *cfw) {
  for (int i = 0; i < 9; i++) {
    cfw->umat[i] = static_cast<double>((i & 0x3) == 0);
    cfw->invu[i] = static_cast<double>((i & 0x3) == 0);
  }
  for (int i = 0; i < 3; i++) {
    cfw->boxdim[i    ] = 0.0;
    cfw->boxdim[i + 3] = half_pi;
  }
}

} // namespace trajectory
} // namespace mdscan
