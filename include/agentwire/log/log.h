#ifndef AGENTWIRE_LOG_H
#define AGENTWIRE_LOG_H

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace agentwire {

/**
 * Install the file logger as spdlog's default logger.
 *
 * Logs rotate per start: the previous agentwire.log becomes agentwire.0.log,
 * older files shift up by one and agentwire.{max_files-1}.log is removed.
 *
 * @param log_path log file path, default ~/.config/agentwire/log/agentwire.log
 * @param max_files number of rotated files kept
 * @param level trace|debug|info|warn|err|critical|off
 */
void init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "info");

std::shared_ptr<spdlog::logger> get_logger();

}  // namespace agentwire

#endif  // AGENTWIRE_LOG_H
