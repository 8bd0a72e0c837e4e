#pragma once

#include "types.hpp"
#include <string>

namespace ncvalidator {

class NetCdfReader {
public:
  // Read the root-group schema of a netCDF file. The file is closed
  // before returning; failures come back as OpenError, never as exceptions.
  static OpenResult open(const std::string &path);
};

// Dispatch on extension: .yaml/.yml -> SchemaYaml::load, else NetCdfReader
OpenResult open_schema(const std::string &path);

} // namespace ncvalidator
