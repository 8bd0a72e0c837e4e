#include "nc-validator/ReportPrinter.hpp"

#include <fmt/format.h>

namespace ncvalidator {

std::string ReportPrinter::label(DiscrepancyKind kind) {
  switch (kind) {
  case DiscrepancyKind::MissingGlobalAttribute:
    return "GlobalAttributeError:";
  case DiscrepancyKind::MissingDimension:
    return "DimensionError:";
  default:
    return "VariableError:";
  }
}

static int indent_for(DiscrepancyKind kind) {
  switch (kind) {
  case DiscrepancyKind::DatatypeMismatch:
  case DiscrepancyKind::DimensionOrderMismatch:
    return 2;
  case DiscrepancyKind::MissingVariableAttribute:
    return 3;
  default:
    return 1;
  }
}

std::string ReportPrinter::format(const Discrepancy &discrepancy) {
  return std::string(indent_for(discrepancy.kind), ' ') +
         label(discrepancy.kind) + " " + discrepancy.detail;
}

void ReportPrinter::print(const ValidationReport &report, std::ostream &out,
                          std::ostream &err) {
  for (const auto &d : report.discrepancies) {
    err << format(d) << "\n";
  }
  err.flush();

  out << fmt::format("{}/{} required global attributes validated\n",
                     report.global_attributes_matched,
                     report.global_attributes_required);
  out << fmt::format("{}/{} required dimensions validated\n",
                     report.dimensions_matched, report.dimensions_required);
  out.flush();
}

nlohmann::json ReportPrinter::to_json(const std::string &file,
                                      const ValidationReport &report) {
  nlohmann::json j;
  j["file"] = file;
  j["valid"] = report.valid;
  j["global_attributes"] = {{"matched", report.global_attributes_matched},
                            {"required", report.global_attributes_required}};
  j["dimensions"] = {{"matched", report.dimensions_matched},
                     {"required", report.dimensions_required}};

  nlohmann::json items = nlohmann::json::array();
  for (const auto &d : report.discrepancies) {
    items.push_back({{"kind", discrepancy_kind_name(d.kind)},
                     {"subject", d.subject},
                     {"detail", d.detail}});
  }
  j["discrepancies"] = items;
  return j;
}

nlohmann::json ReportPrinter::error_json(const std::string &file,
                                         const std::string &message) {
  return {{"file", file}, {"valid", false}, {"error", message}};
}

} // namespace ncvalidator
