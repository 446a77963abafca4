#include "copyright.h"
#include "FileManagement/file_listing.h"
#include "netcdf_util.h"

namespace mdscan {
namespace trajectory {

using diskutil::DrivePathType;
using diskutil::getDrivePathType;

//-------------------------------------------------------------------------------------------------
void checkNetcdfStatus(const int status, const std::string &file_name,
                       const std::string &activity, const ErrorKind kind) {
  if (status == NC_NOERR) {
    return;
  }

  // Some errors merit a fuller explanation than the library provides
  std::string errmsg;
  switch (status) {
  case NC_EEXIST:
    errmsg = "unable to overwrite existing file.";
    break;
  case NC_EPERM:
    errmsg = "user lacks write permissions.";
    break;
  case NC_ENOMEM:
    errmsg = "system out of memory.";
    break;
  case NC_ENFILE:
    errmsg = "too many files are open.";
    break;
  case NC_ENOTNC:
    errmsg = "the file is not in a NetCDF format.";
    break;
  case NC_EINVALCOORDS:
  case NC_EEDGE:
    errmsg = "index exceeds dimension bound.";
    break;
  default:
    errmsg = std::string(nc_strerror(status));
    break;
  }
  errmsg = "Problem encountered working with NetCDF file " + file_name + ": " + errmsg;
  if (activity.size() > 0) {
    errmsg += "  Activity: " + activity + ".";
  }
  rtErr(kind, errmsg, "checkNetcdfStatus");
}

//-------------------------------------------------------------------------------------------------
int ncdfCreate(const std::string &file_name, const PrintSituation expectation) {
  int ncid;
  switch (expectation) {
  case PrintSituation::UNKNOWN:
  case PrintSituation::OPEN_NEW:
    checkNetcdfStatus(nc_create(file_name.c_str(), (NC_NOCLOBBER | NC_64BIT_OFFSET), &ncid),
                      file_name, "creating file", ErrorKind::OPEN_ERROR);
    break;
  case PrintSituation::OVERWRITE:
    checkNetcdfStatus(nc_create(file_name.c_str(), (NC_CLOBBER | NC_64BIT_OFFSET), &ncid),
                      file_name, "creating file", ErrorKind::OPEN_ERROR);
    break;
  case PrintSituation::APPEND:
    switch (getDrivePathType(file_name)) {
    case DrivePathType::FILE:
      checkNetcdfStatus(nc_open(file_name.c_str(), NC_WRITE, &ncid), file_name,
                        "opening file to append", ErrorKind::OPEN_ERROR);
      break;
    case DrivePathType::DIRECTORY:
      rtErr(ErrorKind::OPEN_ERROR, "Unable to create NetCDF file " + file_name + ".  It is "
            "already a directory.", "ncdfCreate");
      break;
    case DrivePathType::REGEXP:
      checkNetcdfStatus(nc_create(file_name.c_str(), (NC_NOCLOBBER | NC_64BIT_OFFSET), &ncid),
                        file_name, "creating file", ErrorKind::OPEN_ERROR);
      break;
    }
    break;
  }
  return ncid;
}

//-------------------------------------------------------------------------------------------------
int ncdfOpen(const std::string &file_name, const int mode) {
  int ncid;
  checkNetcdfStatus(nc_open(file_name.c_str(), mode, &ncid), file_name, "opening file",
                    ErrorKind::OPEN_ERROR);
  return ncid;
}

//-------------------------------------------------------------------------------------------------
void ncdfClose(const int ncid, const std::string &file_name) {
  checkNetcdfStatus(nc_close(ncid), file_name, "closing file");
}

//-------------------------------------------------------------------------------------------------
int ncdfDefineDimension(const int ncid, const AncdfVariable cvar, const size_t dimension_length,
                        const std::string &file_name) {
  int result_id;
  checkNetcdfStatus(nc_def_dim(ncid, getAncdfVariableName(cvar).c_str(), dimension_length,
                               &result_id), file_name,
                    "defining dimension " + getAncdfVariableName(cvar));
  return result_id;
}

//-------------------------------------------------------------------------------------------------
int ncdfDefineVariable(const int ncid, const AncdfVariable cvar, const nc_type data_type,
                       const std::vector<int> &dimensions, const std::string &file_name) {
  int result_id;
  checkNetcdfStatus(nc_def_var(ncid, getAncdfVariableName(cvar).c_str(), data_type,
                               dimensions.size(), dimensions.data(), &result_id), file_name,
                    "defining variable " + getAncdfVariableName(cvar));
  return result_id;
}

//-------------------------------------------------------------------------------------------------
void ncdfPlaceAttributeText(const int ncid, const int variable_id,
                            const std::string &attribute_name, const std::string &attribute_value,
                            const std::string &file_name) {
  checkNetcdfStatus(nc_put_att_text(ncid, variable_id, attribute_name.c_str(),
                                    attribute_value.size(), attribute_value.c_str()), file_name,
                    "placing attribute " + attribute_name);
}

//-------------------------------------------------------------------------------------------------
void ncdfEndDefinitions(const int ncid, const std::string &file_name) {
  checkNetcdfStatus(nc_enddef(ncid), file_name, "ending definitions");
}

//-------------------------------------------------------------------------------------------------
bool ncdfHasVariable(const int ncid, const AncdfVariable cvar) {
  int var_id;
  return (nc_inq_varid(ncid, getAncdfVariableName(cvar).c_str(), &var_id) == NC_NOERR);
}

//-------------------------------------------------------------------------------------------------
size_t ncdfGetDimensionLength(const int ncid, const AncdfVariable cvar,
                              const std::string &file_name) {
  int dim_id;
  const std::string dim_name = getAncdfVariableName(cvar);
  checkNetcdfStatus(nc_inq_dimid(ncid, dim_name.c_str(), &dim_id), file_name,
                    "seeking dimension " + dim_name, ErrorKind::OPEN_ERROR);
  size_t result;
  checkNetcdfStatus(nc_inq_dimlen(ncid, dim_id, &result), file_name,
                    "reading the length of dimension " + dim_name, ErrorKind::OPEN_ERROR);
  return result;
}

//-------------------------------------------------------------------------------------------------
int ncdfGetVariableId(const int ncid, const AncdfVariable cvar, const std::string &file_name) {
  int var_id;
  const std::string var_name = getAncdfVariableName(cvar);
  checkNetcdfStatus(nc_inq_varid(ncid, var_name.c_str(), &var_id), file_name,
                    "seeking variable " + var_name, ErrorKind::OPEN_ERROR);
  return var_id;
}

} // namespace trajectory
} // namespace mdscan
