#ifndef WCP_SERVER_LOGGING_HPP
#define WCP_SERVER_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace wcp_server
{

/**
 * @brief Get or create a named colored stdout logger
 *
 * Loggers are registered with spdlog, so asking twice for the same name
 * returns the same instance (with its level updated).
 *
 * Pattern: "2024-01-02 03:04:05.678 - name - info - message"
 */
std::shared_ptr<spdlog::logger> createLogger(const std::string& name,
                                             spdlog::level::level_enum level);

}  // namespace wcp_server

#endif  // WCP_SERVER_LOGGING_HPP
