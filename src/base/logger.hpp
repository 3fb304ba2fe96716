#ifndef CHUNKSYNC_LOGGER_HPP
#define CHUNKSYNC_LOGGER_HPP

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

#include <string>

namespace csync::base {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @param basepath - optional file to write the log into, console when empty
   * @return logger object, the existing one if a logger with the same tag was created before
   */
  Logger createLogger(const std::string &tag, const std::string &basepath = "");

  /**
   * Switch every created logger to the given level and to the debug pattern
   * (milliseconds and thread id) when the level is debug or trace
   * @param level - new logging level
   */
  void setLoggingLevel(spdlog::level::level_enum level);
}  // namespace csync::base

#endif  // CHUNKSYNC_LOGGER_HPP
