// -----------------------------------------------------------------------------
// logging.cpp — spdlog logger factories (see include/cuelink/logging.hpp)
// -----------------------------------------------------------------------------
#include "cuelink/logging.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace cuelink {

Logger make_logger(const std::string& name, spdlog::level::level_enum level) {
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto log  = std::make_shared<spdlog::logger>(name, std::move(sink));
  log->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
  log->set_level(level);
  log->flush_on(spdlog::level::warn);
  return log;
}

Logger null_logger() {
  static const Logger instance = [] {
    auto l = std::make_shared<spdlog::logger>("null", std::make_shared<spdlog::sinks::null_sink_mt>());
    l->set_level(spdlog::level::off);
    return l;
  }();
  return instance;
}

std::optional<spdlog::level::level_enum> parse_level(const std::string& s) {
  if (s == "trace")    return spdlog::level::trace;
  if (s == "debug")    return spdlog::level::debug;
  if (s == "info")     return spdlog::level::info;
  if (s == "warn")     return spdlog::level::warn;
  if (s == "error")    return spdlog::level::err;
  if (s == "critical") return spdlog::level::critical;
  if (s == "off")      return spdlog::level::off;
  return std::nullopt;
}

} // namespace cuelink
