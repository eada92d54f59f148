#include "nomat/core/logger.hpp"
#include "nomat/core/cvar.hpp"

namespace nomat::core {

std::shared_ptr<spdlog::logger> Logger::sLogger;

AUTO_CVAR_BOOL(log_verbose, "Log at debug level regardless of build type", false, CVarFlags::save);

void Logger::init(const std::string &pattern) {
  if (sLogger) {
    return; // Already initialized
  }

  auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  const auto logger = std::make_shared<spdlog::logger>("nomat", consoleSink);

  logger->set_pattern(pattern);

#ifdef DEBUG
  logger->set_level(spdlog::level::debug);
#else
  logger->set_level(log_verbose.get() ? spdlog::level::debug : spdlog::level::info);
#endif

  spdlog::register_logger(logger);
  sLogger = logger;

  info("Logger initialized");
}

void Logger::shutdown() {
  if (!sLogger) {
    return;
  }
  sLogger->flush();
  spdlog::drop(sLogger->name());
  sLogger.reset();
}

} // namespace nomat::core
