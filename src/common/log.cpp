#include <memory>
#include <string>
#include <string_view>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include "common/log.hpp"

namespace asyncmb {

const std::shared_ptr<spdlog::logger> &Logger() {
  static const std::shared_ptr<spdlog::logger> logger = [] {
    auto registered = spdlog::get(kLoggerName);
    if (registered) {
      return registered;
    }
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_level(spdlog::level::warn);
    return created;
  }();
  return logger;
}

bool SetLogLevel(std::string_view level) {
  auto parsed = spdlog::level::from_str(std::string(level));
  // from_str maps unknown names to off, so only accept "off" when asked for it
  if (parsed == spdlog::level::off && level != "off") {
    return false;
  }
  Logger()->set_level(parsed);
  return true;
}

}  // namespace asyncmb
