#ifndef WCP_SERVER_SERVER_CONFIG_HPP
#define WCP_SERVER_SERVER_CONFIG_HPP

#include <optional>
#include <string>

#include <spdlog/common.h>

namespace wcp_server
{

/**
 * @brief Process configuration for the coverage planning service
 *
 * Resolved in three layers, later layers overriding earlier ones:
 *   1. Built-in defaults (below)
 *   2. Optional JSON file given by --config, with keys
 *      host, port, database_path, log_level, step_size
 *   3. Command-line flags --host, --port, --db, --log-level, --step
 */
struct ServerConfig
{
  std::string host{"127.0.0.1"};
  int port{8000};
  std::string databasePath{"coverage_planning.db"};
  spdlog::level::level_enum logLevel{spdlog::level::info};
  double stepSize{0.25};
};

/**
 * @brief Outcome of command-line parsing
 *
 * showHelp is set when --help was given; the caller prints usageText() and
 * exits without starting the server.
 */
struct CommandLine
{
  ServerConfig config;
  bool showHelp{false};
};

/**
 * @brief Build the configuration from argv
 *
 * @throws std::invalid_argument on an unknown flag, a flag without value, a
 *         malformed or out-of-range value, or an unreadable config file
 */
CommandLine parseCommandLine(int argc, const char* const* argv);

/**
 * @brief Overlay the keys present in a JSON config file onto config
 *
 * @throws std::invalid_argument if the file cannot be read, is not a JSON
 *         object, or holds a value of the wrong type
 */
void loadConfigFile(const std::string& path, ServerConfig& config);

/**
 * @brief Check ranges: port in [0, 65535], positive finite step, non-empty
 *        host and database path
 *
 * @throws std::invalid_argument describing the first invalid field
 */
void validate(const ServerConfig& config);

spdlog::level::level_enum parseLogLevel(const std::string& name);

std::string usageText(const std::string& programName);

}  // namespace wcp_server

#endif  // WCP_SERVER_SERVER_CONFIG_HPP
