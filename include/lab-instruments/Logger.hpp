#pragma once
#include "lab-instruments/export.h"

#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace labinst {

/// Process-wide logging with instrument and operation context.
/// Log calls before init() are dropped.
class LAB_INSTRUMENTS_API InstrumentLogger {
public:
  static InstrumentLogger &instance();

  // Console sink always, rotating file sink when log_file is non-empty
  void init(const std::string &log_file = "",
            spdlog::level::level_enum level = spdlog::level::info) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (logger_) {
      logger_->set_level(level);
      logger_->flush_on(level);
      return;
    }

    try {
      auto console_sink =
          std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console_sink->set_level(level);

      std::vector<spdlog::sink_ptr> sinks{console_sink};
      if (!log_file.empty()) {
        auto file_sink =
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 5, 3); // 5MB, 3 files
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
      }

      logger_ = std::make_shared<spdlog::logger>("lab-instruments",
                                                 sinks.begin(), sinks.end());
      logger_->set_level(level);
      logger_->flush_on(spdlog::level::warn);

      if (!spdlog::get("lab-instruments")) {
        spdlog::register_logger(logger_);
      }
    } catch (const spdlog::spdlog_ex &ex) {
      fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
      logger_.reset();
    }
  }

  void set_level(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
      logger_->set_level(level);
      for (auto &sink : logger_->sinks()) {
        sink->set_level(level);
      }
    }
  }

  bool initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_ != nullptr;
  }

  // Drop the logger so a later init() builds fresh sinks (used by tests)
  void shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
      logger_->flush();
    }
    spdlog::drop("lab-instruments");
    logger_.reset();
  }

  template <typename... Args>
  void trace(const std::string &instrument, const std::string &operation,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, instrument, operation, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &instrument, const std::string &operation,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, instrument, operation, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &instrument, const std::string &operation,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, instrument, operation, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &instrument, const std::string &operation,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, instrument, operation, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &instrument, const std::string &operation,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, instrument, operation, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  InstrumentLogger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &instrument,
           const std::string &operation, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_ || !logger_->should_log(level))
      return;

    // Format:  [instrument] [operation] message
    std::string prefix = fmt::format("[{}] [{}] ", instrument, operation);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
};

// Convenience macros
#define LOG_TRACE(instr, op, ...)                                              \
  labinst::InstrumentLogger::instance().trace(instr, op, __VA_ARGS__)
#define LOG_DEBUG(instr, op, ...)                                              \
  labinst::InstrumentLogger::instance().debug(instr, op, __VA_ARGS__)
#define LOG_INFO(instr, op, ...)                                               \
  labinst::InstrumentLogger::instance().info(instr, op, __VA_ARGS__)
#define LOG_WARN(instr, op, ...)                                               \
  labinst::InstrumentLogger::instance().warn(instr, op, __VA_ARGS__)
#define LOG_ERROR(instr, op, ...)                                              \
  labinst::InstrumentLogger::instance().error(instr, op, __VA_ARGS__)

/// Map a CLI level name ("trace", "debug", "info", "warn", "error", "off")
/// to an spdlog level. Unknown names map to info.
LAB_INSTRUMENTS_API spdlog::level::level_enum
parse_log_level(const std::string &level);

} // namespace labinst
