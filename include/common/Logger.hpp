#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace wapi::common {

/// Stream the process logger writes to. Tools that print results on stdout
/// log to stderr.
enum class LogTarget { Stdout, Stderr };

/// Thin wrapper over spdlog for structured logging.
/// Uses spdlog's default logger to avoid static destruction order issues.
/// Class abbreviation: N/A (static interface)
///
/// Usage:
///   Logger::init("debug");
///   Logger::get()->info("Querying {}", sObjectType);
///
/// Library components take an injected std::shared_ptr<spdlog::logger> and
/// fall back to Logger::get() when none is supplied.
class Logger {
 public:
  /// Initialize the global logger with the given level string.
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  /// Throws ConfigurationError for any other string.
  /// Calling init again changes the level; a different target replaces the sink.
  static void init(const std::string& sLevel, LogTarget ltTarget = LogTarget::Stdout);

  /// Get the shared spdlog logger instance.
  /// Returns spdlog's default logger (always valid).
  static std::shared_ptr<spdlog::logger> get();

  /// Return spLog when a sink was injected, otherwise the process logger.
  static std::shared_ptr<spdlog::logger> resolve(std::shared_ptr<spdlog::logger> spLog);

 private:
  static bool _bInitialized;
  static LogTarget _ltTarget;
};

}  // namespace wapi::common
