#include "nc-validator/ValidationRunner.hpp"
#include "nc-validator/Logger.hpp"
#include "nc-validator/ReportPrinter.hpp"
#include "nc-validator/SchemaValidator.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <nlohmann/json.hpp>

namespace ncvalidator {

ValidationRunner::ValidationRunner(ValidatorConfig config, std::ostream &out,
                                   std::ostream &err, SchemaOpener opener)
    : config_(std::move(config)), out_(out), err_(err),
      opener_(std::move(opener)) {}

int ValidationRunner::run(const std::vector<std::string> &candidates) {
  results_.clear();
  report_entries_.clear();

  if (candidates.empty()) {
    err_ << "No NetCDF files specified for validation\n";
    err_.flush();
    return 1;
  }

  // Opened once and reused for every candidate
  OpenResult template_result = opener_(config_.template_path);
  if (!template_result.ok()) {
    err_ << "Failed to open template " << config_.template_path << ": "
         << template_result.error->message << "\n";
    err_.flush();
    LOG_ERROR("RUNNER", "TEMPLATE", "Cannot open template {}: {}",
              config_.template_path, template_result.error->message);
    return 1;
  }
  const DataFile &template_file = *template_result.file;
  LOG_INFO("RUNNER", "TEMPLATE", "Using template {} ({} variables)",
           config_.template_path, template_file.variables.size());

  for (const auto &candidate : candidates) {
    bool valid = validate_file(template_file, candidate);
    results_.emplace_back(candidate, valid);
    out_ << (valid ? "Valid file: " : "INVALID file: ") << candidate << "\n";
    out_.flush();
  }

  if (!config_.json_report.empty())
    write_json_report();

  return 0;
}

bool ValidationRunner::validate_file(const DataFile &template_file,
                                     const std::string &candidate) {
  std::error_code ec;
  if (candidate.empty() || !std::filesystem::exists(candidate, ec)) {
    err_ << "Invalid NetCDF file specified: " << candidate << "\n";
    err_.flush();
    report_entries_.push_back(ReportPrinter::error_json(
        candidate, ec ? ec.message() : std::string("No such file")));
    return false;
  }

  OpenResult opened = opener_(candidate);
  if (!opened.ok()) {
    err_ << "Failed to open " << candidate << ": " << opened.error->message
         << "\n";
    err_.flush();
    LOG_WARN("RUNNER", "OPEN", "Skipping {}: {}", candidate,
             opened.error->message);
    report_entries_.push_back(
        ReportPrinter::error_json(candidate, opened.error->message));
    return false;
  }

  out_ << "Validating file   : " << candidate << "\n";
  out_ << "Validating against: " << config_.template_path << "\n";
  out_.flush();

  ValidationReport report =
      SchemaValidator::validate(template_file, *opened.file);
  ReportPrinter::print(report, out_, err_);

  LOG_INFO("RUNNER", "VALIDATE", "{}: valid={} discrepancies={}", candidate,
           report.valid, report.discrepancies.size());

  report_entries_.push_back(ReportPrinter::to_json(candidate, report));
  return report.valid;
}

void ValidationRunner::write_json_report() const {
  nlohmann::json j = report_entries_;

  std::ofstream fout(config_.json_report);
  if (!fout) {
    err_ << "Failed to write JSON report: " << config_.json_report << "\n";
    LOG_ERROR("RUNNER", "JSON", "Cannot write {}", config_.json_report);
    return;
  }
  fout << j.dump(2) << "\n";
}

} // namespace ncvalidator
