#pragma once

#include "Config.hpp"
#include "NetCdfReader.hpp"
#include "types.hpp"
#include <functional>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace ncvalidator {

using SchemaOpener = std::function<OpenResult(const std::string &)>;

/// Validates candidate files one after another against a single template
/// and writes the human-readable result to the given streams.
class ValidationRunner {
public:
  ValidationRunner(ValidatorConfig config, std::ostream &out,
                   std::ostream &err, SchemaOpener opener = open_schema);

  // Exit status: 1 when no candidates were given or the template cannot be
  // opened, otherwise 0 whatever the per-file outcome.
  int run(const std::vector<std::string> &candidates);

  // Per-file verdicts of the last run(), in candidate order
  const std::vector<std::pair<std::string, bool>> &results() const {
    return results_;
  }

private:
  bool validate_file(const DataFile &template_file,
                     const std::string &candidate);
  void write_json_report() const;

  ValidatorConfig config_;
  std::ostream &out_;
  std::ostream &err_;
  SchemaOpener opener_;
  std::vector<std::pair<std::string, bool>> results_;
  // One JSON object per candidate, unreadable ones included
  std::vector<nlohmann::json> report_entries_;
};

} // namespace ncvalidator
