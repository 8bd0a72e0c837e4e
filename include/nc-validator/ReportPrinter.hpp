#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace ncvalidator {

class ReportPrinter {
public:
  // "GlobalAttributeError:", "DimensionError:" or "VariableError:"
  static std::string label(DiscrepancyKind kind);

  // One diagnostic line, indented by nesting level, without newline
  static std::string format(const Discrepancy &discrepancy);

  // Discrepancies to err in discovery order, count summaries to out
  static void print(const ValidationReport &report, std::ostream &out,
                    std::ostream &err);

  static nlohmann::json to_json(const std::string &file,
                                const ValidationReport &report);

  // Entry for a candidate that could not be opened
  static nlohmann::json error_json(const std::string &file,
                                   const std::string &message);
};

} // namespace ncvalidator
