#include <csignal>
#include <exception>
#include <iostream>
#include <memory>

#include "wcp-plan/src/PathGenerator.hpp"
#include "wcp-server/src/CoveragePlanningService.hpp"
#include "wcp-server/src/HttpServer.hpp"
#include "wcp-server/src/Logging.hpp"
#include "wcp-server/src/ServerConfig.hpp"
#include "wcp-store/src/TrajectoryStore.hpp"

namespace
{

wcp_server::HttpServer* activeServer = nullptr;

void handleSignal(int /*signal*/)
{
  if (activeServer != nullptr)
  {
    activeServer->stop();
  }
}

}  // namespace

int main(int argc, char* argv[])
{
  wcp_server::CommandLine commandLine;
  try
  {
    commandLine = wcp_server::parseCommandLine(argc, argv);
  }
  catch (const std::invalid_argument& e)
  {
    std::cerr << "Error: " << e.what() << "\n\n"
              << wcp_server::usageText(argv[0]);
    return 1;
  }

  if (commandLine.showHelp)
  {
    std::cout << wcp_server::usageText(argv[0]);
    return 0;
  }

  const auto& config = commandLine.config;
  auto logger = wcp_server::createLogger("wcp", config.logLevel);

  try
  {
    logger->info("Application starting up...");

    auto store = std::make_shared<wcp_store::TrajectoryStore>(
      wcp_store::TrajectoryStore::Config{config.databasePath},
      wcp_server::createLogger("wcp-store", config.logLevel));
    logger->info("Database setup complete.");

    auto service = std::make_shared<wcp_server::CoveragePlanningService>(
      wcp_plan::PathGenerator{wcp_plan::PathGenerator::Config{config.stepSize}},
      store,
      logger);

    wcp_server::HttpServer server{service,
                                  wcp_server::createLogger("wcp-http",
                                                           config.logLevel)};
    if (!server.bind(config.host, config.port))
    {
      return 1;
    }

    activeServer = &server;
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    const bool clean = server.listen();
    activeServer = nullptr;

    logger->info("Application shutting down...");
    return clean ? 0 : 1;
  }
  catch (const std::exception& e)
  {
    logger->critical("Fatal error: {}", e.what());
    return 1;
  }
}
