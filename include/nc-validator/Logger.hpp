#pragma once
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace ncvalidator {

/// Process-wide diagnostic log tagged with a component and a file/step tag.
/// Logging before init() is a no-op.
class ValidatorLogger {
public:
  static ValidatorLogger &instance();

  // Console sink goes to stderr so stdout stays reserved for the report
  // An empty log_file means no file sink
  void init(const std::string &log_file = "",
            spdlog::level::level_enum level = spdlog::level::warn) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (logger_) {
      logger_->set_level(level);
      logger_->flush_on(level);
      return;
    }

    try {
      auto console_sink =
          std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console_sink->set_level(spdlog::level::warn);

      std::vector<spdlog::sink_ptr> sinks{console_sink};
      if (!log_file.empty()) {
        auto file_sink =
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 5, 3); // 5MB, 3 files
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
      }

      logger_ = std::make_shared<spdlog::logger>("nc_validate", sinks.begin(),
                                                 sinks.end());
      logger_->set_level(level);
      logger_->flush_on(level);

      if (!spdlog::get("nc_validate")) {
        spdlog::register_logger(logger_);
      }
    } catch (const spdlog::spdlog_ex &ex) {
      fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
    }
  }

  // Drops the logger so a later init() rebuilds the sinks (used by tests)
  void shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::drop("nc_validate");
    logger_.reset();
  }

  bool initialized() {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_ != nullptr;
  }

  template <typename... Args>
  void trace(const std::string &component, const std::string &tag,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, component, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &component, const std::string &tag,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, component, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &component, const std::string &tag,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, component, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &component, const std::string &tag,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, component, tag, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &component, const std::string &tag,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, component, tag, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  ValidatorLogger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &component,
           const std::string &tag, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_)
      return;

    // Format:  [component] [tag] message
    std::string prefix = fmt::format("[{}] [{}] ", component, tag);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  std::mutex mutex_;
};

spdlog::level::level_enum parse_log_level(const std::string &level);

// Convenience macros
#define LOG_TRACE(component, tag, ...)                                         \
  ncvalidator::ValidatorLogger::instance().trace(component, tag, __VA_ARGS__)
#define LOG_DEBUG(component, tag, ...)                                         \
  ncvalidator::ValidatorLogger::instance().debug(component, tag, __VA_ARGS__)
#define LOG_INFO(component, tag, ...)                                          \
  ncvalidator::ValidatorLogger::instance().info(component, tag, __VA_ARGS__)
#define LOG_WARN(component, tag, ...)                                          \
  ncvalidator::ValidatorLogger::instance().warn(component, tag, __VA_ARGS__)
#define LOG_ERROR(component, tag, ...)                                         \
  ncvalidator::ValidatorLogger::instance().error(component, tag, __VA_ARGS__)

} // namespace ncvalidator
