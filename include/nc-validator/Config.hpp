#pragma once

#include <stdexcept>
#include <string>

namespace ncvalidator {

inline constexpr const char *DEFAULT_TEMPLATE_PATH =
    "./templates/IOOS_Glider_NetCDF_v2.0.nc";

struct ValidatorConfig {
  std::string template_path = DEFAULT_TEMPLATE_PATH;
  std::string log_level = "warn";
  std::string log_file; // empty: console logging only
  std::string json_report; // empty: no JSON report
};

struct ConfigError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Read a YAML config file on top of the defaults. Throws ConfigError.
ValidatorConfig load_config(const std::string &yaml_path);
ValidatorConfig load_config(const std::string &yaml_path,
                            ValidatorConfig base);

} // namespace ncvalidator
