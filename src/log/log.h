#ifndef PIACP_LOG_H
#define PIACP_LOG_H

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace piacp {

/**
 * Initialise logging.
 *
 * Rotation happens once per start-up:
 * - the previous pi_acp.log becomes pi_acp.0.log
 * - older files shift down: pi_acp.0.log -> pi_acp.1.log -> ... -> pi_acp.9.log
 * - the oldest (pi_acp.9.log) is removed
 *
 * @param log_path log file (optional, default ~/.config/pi-acp/log/pi_acp.log)
 * @param max_files number of rotated files kept, default 10
 * @param level trace|debug|info|warn|err|critical|off
 * @param to_stderr also log to stderr (stdout stays untouched)
 */
void init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "info", bool to_stderr = false);

/**
 * Default logger
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace piacp

#endif  // PIACP_LOG_H
