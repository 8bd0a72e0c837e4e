#include "nc-validator/Logger.hpp"

namespace ncvalidator {

ValidatorLogger &ValidatorLogger::instance() {
  static ValidatorLogger logger;
  return logger;
}

spdlog::level::level_enum parse_log_level(const std::string &level) {
  if (level == "trace")
    return spdlog::level::trace;
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "info")
    return spdlog::level::info;
  if (level == "error")
    return spdlog::level::err;
  if (level == "off")
    return spdlog::level::off;
  return spdlog::level::warn;
}

} // namespace ncvalidator
