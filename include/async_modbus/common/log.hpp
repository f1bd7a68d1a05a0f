#pragma once

#include <memory>
#include <string_view>
#include <spdlog/logger.h>

namespace asyncmb {

inline constexpr const char *kLoggerName = "async_modbus";

/**
 * @brief Library logger
 *
 * Returns the spdlog logger registered as "async_modbus", creating a stderr
 * colour logger on first use when the application has not registered one.
 */
[[nodiscard]] const std::shared_ptr<spdlog::logger> &Logger();

/**
 * @brief Set the library log level by name
 * @param level trace, debug, info, warn, error, critical or off
 * @return false if the name is not a known level
 */
bool SetLogLevel(std::string_view level);

}  // namespace asyncmb
