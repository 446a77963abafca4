#include <cmath>
#include <stdexcept>
#include "copyright.h"
#include "Constants/scaling.h"
#include "Constants/symbol_values.h"
#include "FileManagement/file_listing.h"
#include "Reporting/error_format.h"
#include "amber_netcdf.h"
#include "netcdf_util.h"

namespace mdscan {
namespace trajectory {

using constants::small;
using diskutil::checkOutputFileAvailability;
using diskutil::DrivePathType;
using diskutil::getDrivePathType;
using errors::ErrorKind;
using symbols::degrees_to_radians;
using symbols::radians_to_degrees;

//-------------------------------------------------------------------------------------------------
AmberNetcdfTrajectory::AmberNetcdfTrajectory(const std::string &file_name_in) :
    TrajectoryBackend(file_name_in, CoordinateFileKind::AMBER_NETCDF),
    ncid{-1}, is_open{false}, coordinates_id{-1}, cell_lengths_id{-1}, cell_angles_id{-1},
    frame_buffer{}
{
  openFile();
}

//-------------------------------------------------------------------------------------------------
AmberNetcdfTrajectory::~AmberNetcdfTrajectory() {
  if (is_open) {

    // Errors in closing the file cannot propagate out of the destructor.
    nc_close(ncid);
    is_open = false;
  }
}

//-------------------------------------------------------------------------------------------------
bool AmberNetcdfTrajectory::isOpen() const {
  return is_open;
}

//-------------------------------------------------------------------------------------------------
void AmberNetcdfTrajectory::close() {
  if (is_open) {
    is_open = false;
    ncdfClose(ncid, file_name);
  }
  frames_read = 0;
}

//-------------------------------------------------------------------------------------------------
void AmberNetcdfTrajectory::reopen() {
  close();
  openFile();
}

//-------------------------------------------------------------------------------------------------
void AmberNetcdfTrajectory::openFile() {
  ncid = ncdfOpen(file_name);
  is_open = true;
  frames_read = 0;
  try {
    readHeader();
  }
  catch (const std::exception &e) {

    // The file must not stay open if it cannot be read as an Amber NetCDF trajectory.
    is_open = false;
    nc_close(ncid);
    throw;
  }
}

//-------------------------------------------------------------------------------------------------
void AmberNetcdfTrajectory::readHeader() {
  if (ncdfGetDimensionLength(ncid, AncdfVariable::NCSPATIAL, file_name) != 3) {
    rtErr(ErrorKind::OPEN_ERROR, "Trajectory file " + file_name + " does not describe "
          "three-dimensional coordinates.", "AmberNetcdfTrajectory", "readHeader");
  }
  frame_count = ncdfGetDimensionLength(ncid, AncdfVariable::NCFRAME, file_name);
  atom_count = ncdfGetDimensionLength(ncid, AncdfVariable::NCATOM, file_name);
  coordinates_id = ncdfGetVariableId(ncid, AncdfVariable::NCCOORDS, file_name);
  frame_buffer.resize(3 * atom_count);

  // The box, if present, is taken to be of the same shape in every frame.  Its shape is set by
  // the angles of the first frame.
  if (ncdfHasVariable(ncid, AncdfVariable::NCCELL_LENGTHS) &&
      ncdfHasVariable(ncid, AncdfVariable::NCCELL_ANGLES)) {
    cell_lengths_id = ncdfGetVariableId(ncid, AncdfVariable::NCCELL_LENGTHS, file_name);
    cell_angles_id = ncdfGetVariableId(ncid, AncdfVariable::NCCELL_ANGLES, file_name);
    unit_cell = UnitCellType::ORTHORHOMBIC;
    if (frame_count > 0) {
      const size_t start[2] = { 0, 0 };
      const size_t count[2] = { 1, 3 };
      double angles[3];
      checkNetcdfStatus(nc_get_vara_double(ncid, cell_angles_id, start, count, angles),
                        file_name, "reading box angles of the first frame",
                        ErrorKind::OPEN_ERROR);
      for (int i = 0; i < 3; i++) {
        if (fabs(angles[i] - 90.0) > small) {
          unit_cell = UnitCellType::TRICLINIC;
        }
      }
    }
  }
  else {
    cell_lengths_id = -1;
    cell_angles_id = -1;
    unit_cell = UnitCellType::NONE;
  }
}

//-------------------------------------------------------------------------------------------------
void AmberNetcdfTrajectory::readFrameData(CoordinateFrameWriter *cfw) {
  const size_t start[3] = { static_cast<size_t>(frames_read), 0, 0 };
  const size_t count[3] = { 1, static_cast<size_t>(atom_count), 3 };
  checkNetcdfStatus(nc_get_vara_float(ncid, coordinates_id, start, count, frame_buffer.data()),
                    file_name, "reading coordinates of frame " + std::to_string(frames_read + 1));
  for (int i = 0; i < atom_count; i++) {
    cfw->xcrd[i] = frame_buffer[(3 * i)    ];
    cfw->ycrd[i] = frame_buffer[(3 * i) + 1];
    cfw->zcrd[i] = frame_buffer[(3 * i) + 2];
  }
  switch (unit_cell) {
  case UnitCellType::NONE:
    setFrameBox(cfw);
    break;
  case UnitCellType::ORTHORHOMBIC:
  case UnitCellType::TRICLINIC:
    {
      const size_t box_start[2] = { static_cast<size_t>(frames_read), 0 };
      const size_t box_count[2] = { 1, 3 };
      double lengths[3], angles[3];
      checkNetcdfStatus(nc_get_vara_double(ncid, cell_lengths_id, box_start, box_count, lengths),
                        file_name, "reading box lengths of frame " +
                        std::to_string(frames_read + 1));
      checkNetcdfStatus(nc_get_vara_double(ncid, cell_angles_id, box_start, box_count, angles),
                        file_name, "reading box angles of frame " +
                        std::to_string(frames_read + 1));
      setFrameBox(cfw, lengths[0], lengths[1], lengths[2], angles[0] * degrees_to_radians,
                  angles[1] * degrees_to_radians, angles[2] * degrees_to_radians);
    }
    break;
  }
}

//-------------------------------------------------------------------------------------------------
void writeAmberNetcdfTrajectory(const std::string &file_name,
                                const std::vector<CoordinateFrame> &frames,
                                const PrintSituation expectation) {
  const int nframe = frames.size();
  const int natom = (nframe > 0) ? frames[0].getAtomCount() : 0;
  const bool has_box = (nframe > 0 && frames[0].getUnitCellType() != UnitCellType::NONE);
  checkOutputFileAvailability(file_name, expectation, "write an Amber NetCDF trajectory");
  const bool appending = (expectation == PrintSituation::APPEND &&
                          getDrivePathType(file_name) == DrivePathType::FILE);
  const int ncid = ncdfCreate(file_name, expectation);
  int coords_id, time_id, lengths_id, angles_id;
  size_t frame_offset = 0;
  if (appending) {
    frame_offset = ncdfGetDimensionLength(ncid, AncdfVariable::NCFRAME, file_name);
    const int existing_natom = ncdfGetDimensionLength(ncid, AncdfVariable::NCATOM, file_name);
    const bool existing_box = ncdfHasVariable(ncid, AncdfVariable::NCCELL_LENGTHS);
    if (nframe > 0 && (existing_natom != natom || existing_box != has_box)) {
      nc_close(ncid);
      rtErr(ErrorKind::DIMENSION_MISMATCH, "Frames of " + std::to_string(natom) + " atoms " +
            ((has_box) ? "with" : "without") + " a box cannot be appended to trajectory " +
            file_name + ", which holds " + std::to_string(existing_natom) + " atoms " +
            ((existing_box) ? "with" : "without") + " a box.", "writeAmberNetcdfTrajectory");
    }
    coords_id = ncdfGetVariableId(ncid, AncdfVariable::NCCOORDS, file_name);
    time_id = ncdfGetVariableId(ncid, AncdfVariable::NCTIME, file_name);
    lengths_id = -1;
    angles_id = -1;
    if (has_box) {
      lengths_id = ncdfGetVariableId(ncid, AncdfVariable::NCCELL_LENGTHS, file_name);
      angles_id = ncdfGetVariableId(ncid, AncdfVariable::NCCELL_ANGLES, file_name);
    }
  }
  else {
    const int frame_dim = ncdfDefineDimension(ncid, AncdfVariable::NCFRAME, NC_UNLIMITED,
                                              file_name);
    const int spatial_dim = ncdfDefineDimension(ncid, AncdfVariable::NCSPATIAL, 3, file_name);
    const int atom_dim = ncdfDefineDimension(ncid, AncdfVariable::NCATOM, natom, file_name);
    const int label_dim = ncdfDefineDimension(ncid, AncdfVariable::NCLABEL, 5, file_name);
    const int spatial_id = ncdfDefineVariable(ncid, AncdfVariable::NCSPATIAL, NC_CHAR,
                                              { spatial_dim }, file_name);
    time_id = ncdfDefineVariable(ncid, AncdfVariable::NCTIME, NC_FLOAT, { frame_dim },
                                 file_name);
    ncdfPlaceAttributeText(ncid, time_id, "units", "picosecond", file_name);
    coords_id = ncdfDefineVariable(ncid, AncdfVariable::NCCOORDS, NC_FLOAT,
                                   { frame_dim, atom_dim, spatial_dim }, file_name);
    ncdfPlaceAttributeText(ncid, coords_id, "units", "angstrom", file_name);
    int cell_spatial_id = -1;
    int cell_angular_id = -1;
    lengths_id = -1;
    angles_id = -1;
    if (has_box) {
      const int cell_spatial_dim = ncdfDefineDimension(ncid, AncdfVariable::NCCELL_SPATIAL, 3,
                                                       file_name);
      const int cell_angular_dim = ncdfDefineDimension(ncid, AncdfVariable::NCCELL_ANGULAR, 3,
                                                       file_name);
      cell_spatial_id = ncdfDefineVariable(ncid, AncdfVariable::NCCELL_SPATIAL, NC_CHAR,
                                           { cell_spatial_dim }, file_name);
      cell_angular_id = ncdfDefineVariable(ncid, AncdfVariable::NCCELL_ANGULAR, NC_CHAR,
                                           { cell_angular_dim, label_dim }, file_name);
      lengths_id = ncdfDefineVariable(ncid, AncdfVariable::NCCELL_LENGTHS, NC_DOUBLE,
                                      { frame_dim, cell_spatial_dim }, file_name);
      ncdfPlaceAttributeText(ncid, lengths_id, "units", "angstrom", file_name);
      angles_id = ncdfDefineVariable(ncid, AncdfVariable::NCCELL_ANGLES, NC_DOUBLE,
                                     { frame_dim, cell_angular_dim }, file_name);
      ncdfPlaceAttributeText(ncid, angles_id, "units", "degree", file_name);
    }
    ncdfPlaceAttributeText(ncid, NC_GLOBAL, "title", "mdscan trajectory", file_name);
    ncdfPlaceAttributeText(ncid, NC_GLOBAL, "application", "AMBER", file_name);
    ncdfPlaceAttributeText(ncid, NC_GLOBAL, "program", "mdscan", file_name);
    ncdfPlaceAttributeText(ncid, NC_GLOBAL, "programVersion", "1.0", file_name);
    ncdfPlaceAttributeText(ncid, NC_GLOBAL, "Conventions", "AMBER", file_name);
    ncdfPlaceAttributeText(ncid, NC_GLOBAL, "ConventionVersion", "1.0", file_name);
    ncdfEndDefinitions(ncid, file_name);

    // Label the spatial dimensions
    checkNetcdfStatus(nc_put_var_text(ncid, spatial_id, "xyz"), file_name,
                      "writing spatial labels");
    if (has_box) {
      checkNetcdfStatus(nc_put_var_text(ncid, cell_spatial_id, "abc"), file_name,
                        "writing cell spatial labels");
      checkNetcdfStatus(nc_put_var_text(ncid, cell_angular_id, "alpha"
                                        "beta "
                                        "gamma"), file_name, "writing cell angular labels");
    }
  }

  // Write each frame
  std::vector<float> buffer(3 * natom);
  for (int i = 0; i < nframe; i++) {
    const CoordinateFrameReader cfr = frames[i].data();
    if (cfr.natom != natom) {
      nc_close(ncid);
      rtErr(ErrorKind::DIMENSION_MISMATCH, "Frame " + std::to_string(i + 1) + " has " +
            std::to_string(cfr.natom) + " atoms, but the trajectory has " +
            std::to_string(natom) + ".", "writeAmberNetcdfTrajectory");
    }
    for (int j = 0; j < natom; j++) {
      buffer[(3 * j)    ] = cfr.xcrd[j];
      buffer[(3 * j) + 1] = cfr.ycrd[j];
      buffer[(3 * j) + 2] = cfr.zcrd[j];
    }
    const size_t frame_idx = frame_offset + i;
    const size_t crd_start[3] = { frame_idx, 0, 0 };
    const size_t crd_count[3] = { 1, static_cast<size_t>(natom), 3 };
    checkNetcdfStatus(nc_put_vara_float(ncid, coords_id, crd_start, crd_count, buffer.data()),
                      file_name, "writing coordinates of frame " + std::to_string(frame_idx + 1));
    const float time_value = frame_idx;
    checkNetcdfStatus(nc_put_var1_float(ncid, time_id, &frame_idx, &time_value), file_name,
                      "writing time of frame " + std::to_string(frame_idx + 1));
    if (has_box) {
      const size_t box_start[2] = { frame_idx, 0 };
      const size_t box_count[2] = { 1, 3 };
      const double angles[3] = { cfr.boxdim[3] * radians_to_degrees,
                                 cfr.boxdim[4] * radians_to_degrees,
                                 cfr.boxdim[5] * radians_to_degrees };
      checkNetcdfStatus(nc_put_vara_double(ncid, lengths_id, box_start, box_count, cfr.boxdim),
                        file_name, "writing box lengths of frame " +
                        std::to_string(frame_idx + 1));
      checkNetcdfStatus(nc_put_vara_double(ncid, angles_id, box_start, box_count, angles),
                        file_name, "writing box angles of frame " +
                        std::to_string(frame_idx + 1));
    }
  }
  ncdfClose(ncid, file_name);
}

} // namespace trajectory
} // namespace mdscan
