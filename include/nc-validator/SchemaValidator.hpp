#pragma once

#include "types.hpp"

namespace ncvalidator {

class SchemaValidator {
public:
  // Compare the candidate's schema against the template's. Every
  // discrepancy is collected; nothing is printed and nothing is thrown.
  //
  // Missing global attributes are reported but leave the report valid.
  static ValidationReport validate(const DataFile &template_file,
                                   const DataFile &candidate);

  static std::string format_dimensions(const std::vector<std::string> &dims);
};

} // namespace ncvalidator
