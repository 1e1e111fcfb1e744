#include "wcp-server/src/ServerConfig.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>
#include <string_view>

#include <nlohmann/json.hpp>

namespace wcp_server
{

namespace
{

int parsePort(const std::string& text)
{
  std::size_t consumed = 0;
  int port = 0;
  try
  {
    port = std::stoi(text, &consumed);
  }
  catch (const std::exception&)
  {
    throw std::invalid_argument("Invalid port: " + text);
  }
  if (consumed != text.size())
  {
    throw std::invalid_argument("Invalid port: " + text);
  }
  return port;
}

double parseStep(const std::string& text)
{
  std::size_t consumed = 0;
  double step = 0.0;
  try
  {
    step = std::stod(text, &consumed);
  }
  catch (const std::exception&)
  {
    throw std::invalid_argument("Invalid step size: " + text);
  }
  if (consumed != text.size())
  {
    throw std::invalid_argument("Invalid step size: " + text);
  }
  return step;
}

}  // namespace

spdlog::level::level_enum parseLogLevel(const std::string& name)
{
  const auto level = spdlog::level::from_str(name);

  // from_str maps unknown names to off
  if (level == spdlog::level::off && name != "off")
  {
    throw std::invalid_argument("Unknown log level: " + name);
  }
  return level;
}

void loadConfigFile(const std::string& path, ServerConfig& config)
{
  std::ifstream file{path};
  if (!file)
  {
    throw std::invalid_argument("Cannot open config file: " + path);
  }

  nlohmann::json j;
  try
  {
    file >> j;
  }
  catch (const nlohmann::json::parse_error& e)
  {
    throw std::invalid_argument("Config file " + path + " is not valid JSON: " +
                                e.what());
  }

  if (!j.is_object())
  {
    throw std::invalid_argument("Config file " + path + " must hold a JSON object");
  }

  try
  {
    if (j.contains("host"))
    {
      config.host = j["host"].get<std::string>();
    }
    if (j.contains("port"))
    {
      config.port = j["port"].get<int>();
    }
    if (j.contains("database_path"))
    {
      config.databasePath = j["database_path"].get<std::string>();
    }
    if (j.contains("log_level"))
    {
      config.logLevel = parseLogLevel(j["log_level"].get<std::string>());
    }
    if (j.contains("step_size"))
    {
      config.stepSize = j["step_size"].get<double>();
    }
  }
  catch (const nlohmann::json::type_error& e)
  {
    throw std::invalid_argument("Config file " + path + ": " + e.what());
  }
}

void validate(const ServerConfig& config)
{
  if (config.host.empty())
  {
    throw std::invalid_argument("Host must not be empty");
  }
  if (config.port < 0 || config.port > 65535)
  {
    throw std::invalid_argument("Port out of range: " +
                                std::to_string(config.port));
  }
  if (config.databasePath.empty())
  {
    throw std::invalid_argument("Database path must not be empty");
  }
  if (!std::isfinite(config.stepSize) || config.stepSize <= 0.0)
  {
    throw std::invalid_argument("Step size must be positive");
  }
}

CommandLine parseCommandLine(int argc, const char* const* argv)
{
  CommandLine result;

  // The config file is applied first so that flags override it regardless of
  // their position on the command line
  for (int i = 1; i < argc; ++i)
  {
    if (std::string_view{argv[i]} == "--config")
    {
      if (i + 1 >= argc)
      {
        throw std::invalid_argument("Missing value for --config");
      }
      loadConfigFile(argv[i + 1], result.config);
    }
  }

  for (int i = 1; i < argc; ++i)
  {
    const std::string flag{argv[i]};

    if (flag == "--help" || flag == "-h")
    {
      result.showHelp = true;
      return result;
    }

    if (i + 1 >= argc)
    {
      throw std::invalid_argument("Missing value for " + flag);
    }
    const std::string value{argv[++i]};

    if (flag == "--config")
    {
      continue;
    }
    if (flag == "--host")
    {
      result.config.host = value;
    }
    else if (flag == "--port")
    {
      result.config.port = parsePort(value);
    }
    else if (flag == "--db")
    {
      result.config.databasePath = value;
    }
    else if (flag == "--log-level")
    {
      result.config.logLevel = parseLogLevel(value);
    }
    else if (flag == "--step")
    {
      result.config.stepSize = parseStep(value);
    }
    else
    {
      throw std::invalid_argument("Unknown option: " + flag);
    }
  }

  validate(result.config);
  return result;
}

std::string usageText(const std::string& programName)
{
  return "Usage: " + programName +
         " [options]\n"
         "  --config <file>     JSON config file (host, port, database_path,\n"
         "                      log_level, step_size)\n"
         "  --host <address>    Listen address (default: 127.0.0.1)\n"
         "  --port <port>       Listen port (default: 8000)\n"
         "  --db <path>         SQLite database file "
         "(default: coverage_planning.db)\n"
         "  --log-level <level> trace, debug, info, warn, error, critical, off "
         "(default: info)\n"
         "  --step <size>       Sweep step size (default: 0.25)\n"
         "  --help              Show this message\n";
}

}  // namespace wcp_server
