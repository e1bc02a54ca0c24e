#ifndef WASMBRIDGE_LOGGER_HPP
#define WASMBRIDGE_LOGGER_HPP

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace wasmbridge::base {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger object writing to the host's standard error stream
   */
  Logger createLogger(const std::string &tag);

  /**
   * Apply a verbosity level to every registered logger and to the loggers
   * created afterwards
   */
  void setLogLevel(spdlog::level::level_enum level);
}  // namespace wasmbridge::base

#endif  // WASMBRIDGE_LOGGER_HPP
