#pragma once

#include "types.hpp"
#include <string>

namespace ncvalidator {

/// Text form of a DataFile schema, so templates can be written and reviewed
/// without a netCDF file:
///
///   global_attributes: [title, institution]
///   dimensions: {time: 0, depth: 10}
///   variables:
///     temperature:
///       type: float64
///       dimensions: [time, depth]
///       attributes: [units, long_name]
class SchemaYaml {
public:
  static OpenResult load(const std::string &yaml_path);
  static OpenResult parse(const std::string &yaml_text,
                          const std::string &source = "<string>");

  static std::string dump(const DataFile &file);
};

} // namespace ncvalidator
