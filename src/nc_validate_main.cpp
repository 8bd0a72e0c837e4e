#include "nc-validator/Config.hpp"
#include "nc-validator/Logger.hpp"
#include "nc-validator/ValidationRunner.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace ncvalidator;

void print_usage(const char *prog) {
  std::cout << "Usage: " << prog << " [options] <file.nc> [file.nc ...]\n\n";
  std::cout << "Validate each NetCDF file against a NetCDF template.\n";
  std::cout << "Results go to stdout, discrepancies to stderr.\n\n";
  std::cout << "Options:\n";
  std::cout << "  -t, --template <path>  Template to validate against\n";
  std::cout << "                         (default: " << DEFAULT_TEMPLATE_PATH
            << ")\n";
  std::cout << "                         .yaml/.yml is read as a schema\n";
  std::cout << "  -c, --config <path>    YAML configuration file\n";
  std::cout << "  --json <path>          Also write all reports as JSON\n";
  std::cout << "  --log-level <level>    Log level (default: warn)\n";
  std::cout << "  --log-file <path>      Also log to this file (default: none)\n";
  std::cout << "  -h, --help             Show this help\n";
}

int main(int argc, char **argv) {
  std::optional<std::string> config_path;
  std::optional<std::string> template_path;
  std::optional<std::string> json_path;
  std::optional<std::string> log_level;
  std::optional<std::string> log_file;
  std::vector<std::string> nc_files;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    auto next_value = [&](std::optional<std::string> &target) {
      if (i + 1 >= argc) {
        std::cerr << "Error: " << arg << " requires a value\n";
        return false;
      }
      target = argv[++i];
      return true;
    };

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else if (arg == "-t" || arg == "--template") {
      if (!next_value(template_path)) {
        print_usage(argv[0]);
        return 1;
      }
    } else if (arg == "-c" || arg == "--config") {
      if (!next_value(config_path)) {
        print_usage(argv[0]);
        return 1;
      }
    } else if (arg == "--json") {
      if (!next_value(json_path)) {
        print_usage(argv[0]);
        return 1;
      }
    } else if (arg == "--log-level") {
      if (!next_value(log_level)) {
        print_usage(argv[0]);
        return 1;
      }
    } else if (arg == "--log-file") {
      if (!next_value(log_file)) {
        print_usage(argv[0]);
        return 1;
      }
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "Error: Unknown option " << arg << "\n";
      print_usage(argv[0]);
      return 1;
    } else {
      nc_files.push_back(arg);
    }
  }

  ValidatorConfig config;
  if (config_path) {
    try {
      config = load_config(*config_path);
    } catch (const ConfigError &e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }
  }
  if (template_path)
    config.template_path = *template_path;
  if (json_path)
    config.json_report = *json_path;
  if (log_level)
    config.log_level = *log_level;
  if (log_file)
    config.log_file = *log_file;

  ValidatorLogger::instance().init(config.log_file,
                                   parse_log_level(config.log_level));
  LOG_INFO("MAIN", "START", "Validating {} file(s) against {}",
           nc_files.size(), config.template_path);

  ValidationRunner runner(config, std::cout, std::cerr);
  int status = runner.run(nc_files);

  ValidatorLogger::instance().shutdown();
  return status;
}
