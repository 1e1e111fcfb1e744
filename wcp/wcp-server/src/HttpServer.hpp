#ifndef WCP_SERVER_HTTP_SERVER_HPP
#define WCP_SERVER_HTTP_SERVER_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "wcp-server/src/CoveragePlanningService.hpp"

namespace httplib
{
class Server;
struct Request;
struct Response;
}  // namespace httplib

namespace wcp_server
{

/**
 * @brief HTTP front end of the coverage planning service
 *
 * Routes:
 *   POST /plan_coverage        -> 200 trajectory | 422 invalid body | 500
 *   GET  /get_trajectory/{id}  -> 200 trajectory | 404 unknown id |
 *                                 422 non-integer id | 500
 *
 * All bodies are JSON. Errors use {"detail": ...}; internal failures only
 * ever report "Internal server error", the cause is logged. Each routed
 * response carries an X-Process-Time header (seconds) and is logged.
 *
 * Requests are served concurrently by the httplib thread pool.
 */
class HttpServer
{
public:
  HttpServer(std::shared_ptr<CoveragePlanningService> service,
             std::shared_ptr<spdlog::logger> logger);

  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  /**
   * @brief Bind the listening socket
   * @return false if the address cannot be bound
   */
  bool bind(const std::string& host, int port);

  /**
   * @brief Bind to an ephemeral port chosen by the OS
   * @return The bound port, or a negative value on failure
   */
  int bindToAnyPort(const std::string& host);

  /**
   * @brief Serve requests on the bound socket until stop() is called
   * @return false if the server terminated abnormally
   */
  bool listen();

  /**
   * @brief Block until listen() has started accepting connections
   */
  void waitUntilReady() const;

  void stop();

  bool isRunning() const;

private:
  using Handler =
    std::function<void(const httplib::Request&, httplib::Response&)>;

  void registerRoutes();

  void handlePlanCoverage(const httplib::Request& req, httplib::Response& res);

  void handleGetTrajectory(const httplib::Request& req, httplib::Response& res);

  // Wraps a route handler with timing, logging and the internal-error fallback
  Handler instrument(Handler handler);

  std::shared_ptr<CoveragePlanningService> service_;
  std::shared_ptr<spdlog::logger> logger_;
  std::unique_ptr<httplib::Server> server_;
};

}  // namespace wcp_server

#endif  // WCP_SERVER_HTTP_SERVER_HPP
