#include "nc-validator/SchemaValidator.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace ncvalidator {

static void add_discrepancy(ValidationReport &report, DiscrepancyKind kind,
                            std::vector<std::string> subject,
                            const std::string &detail, bool fails = true) {
  if (fails)
    report.valid = false;
  report.discrepancies.push_back({kind, std::move(subject), detail});
}

static bool contains(const std::vector<std::string> &names,
                     const std::string &name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

std::string
SchemaValidator::format_dimensions(const std::vector<std::string> &dims) {
  std::string out = "(";
  for (size_t i = 0; i < dims.size(); ++i) {
    if (i > 0)
      out += ", ";
    out += dims[i];
  }
  return out + ")";
}

static void check_variable(ValidationReport &report, const std::string &name,
                           const VariableSchema &expected,
                           const VariableSchema &actual) {
  if (expected.datatype != actual.datatype ||
      (expected.datatype == DataType::UserDefined &&
       expected.type_name != actual.type_name)) {
    // Candidate type first, template type second
    add_discrepancy(report, DiscrepancyKind::DatatypeMismatch, {name},
                    "Incorrect datatype for " + name + " (" +
                        actual.type_string() + "!=" + expected.type_string() +
                        ")");
  }

  if (expected.dimensions != actual.dimensions) {
    add_discrepancy(report, DiscrepancyKind::DimensionOrderMismatch, {name},
                    "Incorrect dimension for " + name + " (" +
                        SchemaValidator::format_dimensions(
                            expected.dimensions) +
                        "!=" +
                        SchemaValidator::format_dimensions(actual.dimensions) +
                        ")");
  }

  for (const auto &att : expected.attributes) {
    if (!contains(actual.attributes, att)) {
      add_discrepancy(report, DiscrepancyKind::MissingVariableAttribute,
                      {name, att},
                      "Missing attribute for " + name + ": " + att);
    }
  }
}

ValidationReport SchemaValidator::validate(const DataFile &template_file,
                                           const DataFile &candidate) {
  ValidationReport report;
  report.valid = true;

  // Global attributes: a miss is reported but does not invalidate the file
  for (const auto &att : template_file.global_attributes) {
    if (!candidate.has_global_attribute(att)) {
      add_discrepancy(report, DiscrepancyKind::MissingGlobalAttribute, {att},
                      "Missing global attribute: " + att, false);
      continue;
    }
    report.global_attributes_matched++;
  }
  report.global_attributes_required = template_file.global_attributes.size();

  for (const auto &dim : template_file.dimensions) {
    if (!candidate.has_dimension(dim.first)) {
      add_discrepancy(report, DiscrepancyKind::MissingDimension, {dim.first},
                      "Missing dimension: " + dim.first);
      continue;
    }
    report.dimensions_matched++;
  }
  report.dimensions_required = template_file.dimensions.size();

  for (const auto &[name, expected] : template_file.variables) {
    const VariableSchema *actual = candidate.find_variable(name);
    if (!actual) {
      add_discrepancy(report, DiscrepancyKind::MissingVariable, {name},
                      "Missing variable: " + name);
      continue;
    }
    check_variable(report, name, expected, *actual);
  }

  return report;
}

} // namespace ncvalidator
