#include "common/Logger.hpp"

#include "common/Errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace wapi::common {

bool Logger::_bInitialized = false;
LogTarget Logger::_ltTarget = LogTarget::Stdout;

namespace {

// spdlog maps unknown names to "off"; a typo in WAPI_LOG_LEVEL must not
// silently disable logging.
spdlog::level::level_enum parseLevel(const std::string& sLevel) {
  const auto level = spdlog::level::from_str(sLevel);
  if (level == spdlog::level::off && sLevel != "off") {
    throw ConfigurationError("invalid_log_level", "Unknown log level: '" + sLevel + "'");
  }
  return level;
}

}  // namespace

void Logger::init(const std::string& sLevel, LogTarget ltTarget) {
  const auto level = parseLevel(sLevel);
  if (_bInitialized && ltTarget == _ltTarget) {
    spdlog::default_logger()->set_level(level);
    return;
  }
  if (_bInitialized) {
    spdlog::drop("wapi");
  }

  auto spLogger = ltTarget == LogTarget::Stderr ? spdlog::stderr_color_mt("wapi")
                                                : spdlog::stdout_color_mt("wapi");
  spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
  spLogger->set_level(level);
  spdlog::set_default_logger(spLogger);

  _bInitialized = true;
  _ltTarget = ltTarget;
  spLogger->debug("Logger initialized at level '{}'", sLevel);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  if (!_bInitialized) {
    init("info");
  }
  return spdlog::default_logger();
}

std::shared_ptr<spdlog::logger> Logger::resolve(std::shared_ptr<spdlog::logger> spLog) {
  return spLog ? spLog : get();
}

}  // namespace wapi::common
