#pragma once
#include "scpi-driver/export.h"

#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace scpidrv {

/// Centralized logging with device name and operation context
class SCPI_DRIVER_API DriverLogger {
public:
  static DriverLogger &instance();

  // Initialize with file and console sinks
  void init(const std::string &log_file = "scpi_driver.log",
            spdlog::level::level_enum level = spdlog::level::debug) {
    std::lock_guard<std::mutex> lock(mutex_);

    // If already initialized, just update level
    if (logger_) {
      logger_->set_level(level);
      logger_->flush_on(level);
      return;
    }

    try {
      auto console_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_level(spdlog::level::info);

      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file, 1024 * 1024 * 10, 3); // 10MB, 3 files
      file_sink->set_level(spdlog::level::trace);

      std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
      logger_ = std::make_shared<spdlog::logger>("scpi_driver", sinks.begin(),
                                                 sinks.end());
      logger_->set_level(level);
      logger_->flush_on(level);

      if (!spdlog::get("scpi_driver")) {
        spdlog::register_logger(logger_);
      }
    } catch (const spdlog::spdlog_ex &ex) {
      fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
      logger_.reset();
    }
  }

  // Drop from the spdlog registry so a later init() recreates the sinks
  void shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::drop("scpi_driver");
    logger_.reset();
  }

  template <typename... Args>
  void trace(const std::string &device, const std::string &operation,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, device, operation, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &device, const std::string &operation,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, device, operation, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &device, const std::string &operation,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, device, operation, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &device, const std::string &operation,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, device, operation, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &device, const std::string &operation,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, device, operation, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &device,
           const std::string &operation, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_)
      return;

    // Format:  [device] [operation] message
    std::string prefix = fmt::format("[{}] [{}] ", device, operation);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

private:
  DriverLogger() = default;

  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
};

// Convenience macros
#define LOG_TRACE(device, op, ...)                                             \
  scpidrv::DriverLogger::instance().trace(device, op, __VA_ARGS__)
#define LOG_DEBUG(device, op, ...)                                             \
  scpidrv::DriverLogger::instance().debug(device, op, __VA_ARGS__)
#define LOG_INFO(device, op, ...)                                              \
  scpidrv::DriverLogger::instance().info(device, op, __VA_ARGS__)
#define LOG_WARN(device, op, ...)                                              \
  scpidrv::DriverLogger::instance().warn(device, op, __VA_ARGS__)
#define LOG_ERROR(device, op, ...)                                             \
  scpidrv::DriverLogger::instance().error(device, op, __VA_ARGS__)

} // namespace scpidrv
