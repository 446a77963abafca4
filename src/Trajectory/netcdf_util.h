// -*-c++-*-
#ifndef MDSCAN_NETCDF_UTIL_H
#define MDSCAN_NETCDF_UTIL_H

#include <string>
#include <vector>
#include <netcdf.h>
#include "copyright.h"
#include "FileManagement/file_util.h"
#include "Reporting/error_format.h"
#include "trajectory_enumerators.h"

namespace mdscan {
namespace trajectory {

using diskutil::PrintSituation;
using errors::ErrorKind;

/// \brief Check the status of a NetCDF library call and raise an error, of the stated kind, if
///        it did not succeed.
///
/// \param status     The value returned by the NetCDF library call
/// \param file_name  Name of the file being worked on, for error reporting
/// \param activity   Description of the activity, for error reporting
/// \param kind       Kind of error to raise
void checkNetcdfStatus(int status, const std::string &file_name,
                       const std::string &activity = std::string(""),
                       ErrorKind kind = ErrorKind::GENERAL);

/// \brief Create a NetCDF file for writing, or open an existing one for appending.  Returns the
///        NetCDF identifier of the file.
///
/// \param file_name    Name of the file
/// \param expectation  Conditions under which to create the file
int ncdfCreate(const std::string &file_name, PrintSituation expectation);

/// \brief Open a NetCDF file for reading.  Returns the NetCDF identifier of the file, or raises
///        an OpenError.
///
/// \param file_name  Name of the file
/// \param mode       Mode in which to open the file
int ncdfOpen(const std::string &file_name, int mode = NC_NOWRITE);

/// \brief Close a NetCDF file.
///
/// \param ncid       NetCDF identifier of the file
/// \param file_name  Name of the file, for error reporting
void ncdfClose(int ncid, const std::string &file_name);

/// \brief Define a dimension in a NetCDF file, returning its identifier.
///
/// \param ncid              NetCDF identifier of the file
/// \param cvar              The Amber NetCDF dimension to define
/// \param dimension_length  Length of the dimension (NC_UNLIMITED for the frame dimension)
/// \param file_name         Name of the file, for error reporting
int ncdfDefineDimension(int ncid, AncdfVariable cvar, size_t dimension_length,
                        const std::string &file_name);

/// \brief Define a variable in a NetCDF file, returning its identifier.
///
/// \param ncid        NetCDF identifier of the file
/// \param cvar        The Amber NetCDF variable to define
/// \param data_type   NetCDF data type of the variable
/// \param dimensions  Identifiers of the dimensions of the variable, slowest-varying first
/// \param file_name   Name of the file, for error reporting
int ncdfDefineVariable(int ncid, AncdfVariable cvar, nc_type data_type,
                       const std::vector<int> &dimensions, const std::string &file_name);

/// \brief Place a text attribute on a variable, or globally on the file.
///
/// \param ncid             NetCDF identifier of the file
/// \param variable_id      Identifier of the variable (NC_GLOBAL for a global attribute)
/// \param attribute_name   Name of the attribute
/// \param attribute_value  Text of the attribute
/// \param file_name        Name of the file, for error reporting
void ncdfPlaceAttributeText(int ncid, int variable_id, const std::string &attribute_name,
                            const std::string &attribute_value, const std::string &file_name);

/// \brief End the definitions phase of a new NetCDF file.
///
/// \param ncid       NetCDF identifier of the file
/// \param file_name  Name of the file, for error reporting
void ncdfEndDefinitions(int ncid, const std::string &file_name);

/// \brief Detect whether a NetCDF file contains a particular variable.
///
/// \param ncid  NetCDF identifier of the file
/// \param cvar  The Amber NetCDF variable of interest
bool ncdfHasVariable(int ncid, AncdfVariable cvar);

/// \brief Get the length of a dimension in a NetCDF file.  Raises an OpenError if the dimension
///        is not present.
///
/// \param ncid       NetCDF identifier of the file
/// \param cvar       The Amber NetCDF dimension of interest
/// \param file_name  Name of the file, for error reporting
size_t ncdfGetDimensionLength(int ncid, AncdfVariable cvar, const std::string &file_name);

/// \brief Get the identifier of a variable in a NetCDF file.  Raises an OpenError if the
///        variable is not present.
///
/// \param ncid       NetCDF identifier of the file
/// \param cvar       The Amber NetCDF variable of interest
/// \param file_name  Name of the file, for error reporting
int ncdfGetVariableId(int ncid, AncdfVariable cvar, const std::string &file_name);

} // namespace trajectory
} // namespace mdscan

#endif
