#include "nc-validator/NetCdfReader.hpp"
#include "nc-validator/Logger.hpp"
#include "nc-validator/SchemaYaml.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <netcdf.h>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace ncvalidator {

namespace {

std::string nc_error_text(int status) {
  const char *msg = nc_strerror(status);
  return msg ? std::string(msg) : std::string("unknown netcdf error");
}

struct NcError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

void check(int status, const std::string &what) {
  if (status != NC_NOERR)
    throw NcError(what + ": " + nc_error_text(status));
}

// Closes the dataset on every exit path
class NcFileHandle {
public:
  explicit NcFileHandle(int ncid) : ncid_(ncid) {}
  ~NcFileHandle() {
    if (ncid_ >= 0)
      nc_close(ncid_);
  }
  NcFileHandle(const NcFileHandle &) = delete;
  NcFileHandle &operator=(const NcFileHandle &) = delete;

  int id() const { return ncid_; }

private:
  int ncid_;
};

DataType map_atomic_type(nc_type xtype) {
  switch (xtype) {
  case NC_BYTE:
    return DataType::Int8;
  case NC_UBYTE:
    return DataType::UInt8;
  case NC_CHAR:
    return DataType::Char;
  case NC_SHORT:
    return DataType::Int16;
  case NC_USHORT:
    return DataType::UInt16;
  case NC_INT:
    return DataType::Int32;
  case NC_UINT:
    return DataType::UInt32;
  case NC_INT64:
    return DataType::Int64;
  case NC_UINT64:
    return DataType::UInt64;
  case NC_FLOAT:
    return DataType::Float32;
  case NC_DOUBLE:
    return DataType::Float64;
  case NC_STRING:
    return DataType::String;
  default:
    return DataType::UserDefined;
  }
}

std::vector<std::string> read_attribute_names(int ncid, int varid,
                                              int natts) {
  std::vector<std::string> names;
  names.reserve(natts);
  for (int i = 0; i < natts; ++i) {
    char name[NC_MAX_NAME + 1];
    check(nc_inq_attname(ncid, varid, i, name), "nc_inq_attname");
    names.emplace_back(name);
  }
  return names;
}

VariableSchema read_variable(int ncid, int varid, std::string &var_name) {
  char name[NC_MAX_NAME + 1];
  nc_type xtype;
  int ndims = 0;
  int natts = 0;
  check(nc_inq_var(ncid, varid, name, &xtype, &ndims, nullptr, &natts),
        "nc_inq_var");
  var_name = name;

  std::vector<int> dimids(ndims);
  check(nc_inq_vardimid(ncid, varid, dimids.data()), "nc_inq_vardimid");

  VariableSchema var;
  var.datatype = map_atomic_type(xtype);
  if (var.datatype == DataType::UserDefined) {
    char type_name[NC_MAX_NAME + 1];
    check(nc_inq_user_type(ncid, xtype, type_name, nullptr, nullptr, nullptr,
                           nullptr),
          "nc_inq_user_type");
    var.type_name = type_name;
  }

  for (int dimid : dimids) {
    char dim_name[NC_MAX_NAME + 1];
    check(nc_inq_dimname(ncid, dimid, dim_name), "nc_inq_dimname");
    var.dimensions.emplace_back(dim_name);
  }
  var.attributes = read_attribute_names(ncid, varid, natts);
  return var;
}

DataFile read_schema(int ncid, const std::string &path) {
  DataFile file;
  file.source = path;

  int ngatts = 0;
  check(nc_inq_natts(ncid, &ngatts), "nc_inq_natts");
  file.global_attributes = read_attribute_names(ncid, NC_GLOBAL, ngatts);

  int ndims = 0;
  check(nc_inq_dimids(ncid, &ndims, nullptr, 1), "nc_inq_dimids");
  std::vector<int> dimids(ndims);
  check(nc_inq_dimids(ncid, &ndims, dimids.data(), 1), "nc_inq_dimids");
  std::sort(dimids.begin(), dimids.end());
  for (int dimid : dimids) {
    char name[NC_MAX_NAME + 1];
    size_t len = 0;
    check(nc_inq_dim(ncid, dimid, name, &len), "nc_inq_dim");
    file.dimensions.emplace_back(name, len);
  }

  int nvars = 0;
  check(nc_inq_varids(ncid, &nvars, nullptr), "nc_inq_varids");
  std::vector<int> varids(nvars);
  check(nc_inq_varids(ncid, &nvars, varids.data()), "nc_inq_varids");
  for (int varid : varids) {
    std::string name;
    VariableSchema var = read_variable(ncid, varid, name);
    file.variables.emplace_back(name, std::move(var));
  }
  return file;
}

} // namespace

OpenResult NetCdfReader::open(const std::string &path) {
  std::error_code ec;
  if (path.empty() || !std::filesystem::exists(path, ec)) {
    return OpenResult::failure(OpenErrorKind::FileNotFound, path,
                               ec ? ec.message() : "No such file");
  }

  int ncid = -1;
  int status = nc_open(path.c_str(), NC_NOWRITE, &ncid);
  if (status != NC_NOERR) {
    LOG_WARN("READER", "OPEN", "nc_open failed for {}: {}", path,
             nc_error_text(status));
    return OpenResult::failure(OpenErrorKind::FileUnreadable, path,
                               nc_error_text(status));
  }
  NcFileHandle handle(ncid);

  try {
    DataFile file = read_schema(handle.id(), path);
    LOG_DEBUG("READER", "OPEN",
              "Read {}: {} global attributes, {} dimensions, {} variables",
              path, file.global_attributes.size(), file.dimensions.size(),
              file.variables.size());
    return OpenResult::success(std::move(file));
  } catch (const NcError &e) {
    LOG_WARN("READER", "INQ", "Schema read failed for {}: {}", path,
             e.what());
    return OpenResult::failure(OpenErrorKind::FileUnreadable, path, e.what());
  }
}

OpenResult open_schema(const std::string &path) {
  std::string ext = std::filesystem::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (ext == ".yaml" || ext == ".yml")
    return SchemaYaml::load(path);
  return NetCdfReader::open(path);
}

} // namespace ncvalidator
