#include "Log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace Log {

static std::shared_ptr<spdlog::logger> s_Logger;
static bool s_Initialized = false;

void Init(const bool fileSink) {
  if (s_Initialized) {
    return;
  }

  std::vector<spdlog::sink_ptr> sinks;

  auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  consoleSink->set_pattern("%^[%T] %n: %v%$");
  sinks.push_back(consoleSink);

  if (fileSink) {
    auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        "lanerunner.log", true);
    file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %n: %v");
    sinks.push_back(file);
  }

  s_Logger = std::make_shared<spdlog::logger>("LANERUNNER", sinks.begin(),
                                              sinks.end());
  spdlog::register_logger(s_Logger);
  s_Initialized = true;

  s_Logger->set_level(spdlog::level::debug);
  s_Logger->flush_on(spdlog::level::warn);

  LOG_INFO("Logging initialized");
}

void Shutdown() {
  s_Logger.reset();
  s_Initialized = false;
  spdlog::shutdown();
}

void SetLevel(const spdlog::level::level_enum level) {
  GetLogger()->set_level(level);
}

std::shared_ptr<spdlog::logger> &GetLogger() {
  // Library code may log before the host calls Init (tests, tools).
  if (!s_Logger) {
    s_Logger = spdlog::default_logger();
  }
  return s_Logger;
}

} // namespace Log
