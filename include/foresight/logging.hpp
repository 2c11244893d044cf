#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace foresight::log {

constexpr const char* LOGGER_NAME = "foresight";

/**
 * @brief Shared component logger
 *
 * Returns the logger installed by init(), or a colored stderr logger when the
 * library is used without the CLI (tests, embedding).
 */
std::shared_ptr<spdlog::logger> get();

/**
 * @brief Install the async console (stderr) + rotating file logger used by the CLI
 *
 * @param log_file Path of the rotating log file (parent directories are created)
 * @param level One of debug, info, warn, error
 */
void init(const std::string& log_file, const std::string& level);

void set_level(const std::string& level);

}  // namespace foresight::log
