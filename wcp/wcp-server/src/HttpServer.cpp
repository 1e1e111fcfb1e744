#include "wcp-server/src/HttpServer.hpp"

#include <exception>
#include <format>
#include <stdexcept>
#include <utility>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "wcp-server/src/RequestParser.hpp"
#include "wcp-store/src/JsonCodec.hpp"

namespace wcp_server
{

using json = nlohmann::json;

namespace
{

constexpr const char* kJsonContentType = "application/json";
constexpr const char* kInternalError = "Internal server error";
constexpr const char* kTrajectoryNotFound = "Trajectory not found";

void sendJson(httplib::Response& res, int status, const json& body)
{
  res.status = status;
  res.set_content(body.dump(), kJsonContentType);
}

void sendDetail(httplib::Response& res, int status, const std::string& detail)
{
  sendJson(res, status, json{{"detail", detail}});
}

}  // namespace

HttpServer::HttpServer(std::shared_ptr<CoveragePlanningService> service,
                       std::shared_ptr<spdlog::logger> logger)
  : service_{std::move(service)},
    logger_{std::move(logger)},
    server_{std::make_unique<httplib::Server>()}
{
  if (!service_)
  {
    throw std::invalid_argument("HttpServer: service is null");
  }
  registerRoutes();
}

HttpServer::~HttpServer()
{
  if (server_->is_running())
  {
    server_->stop();
  }
}

bool HttpServer::bind(const std::string& host, int port)
{
  if (!server_->bind_to_port(host, port))
  {
    logger_->error("Failed to bind {}:{}", host, port);
    return false;
  }
  logger_->info("Listening on http://{}:{}", host, port);
  return true;
}

int HttpServer::bindToAnyPort(const std::string& host)
{
  const int port = server_->bind_to_any_port(host);
  if (port < 0)
  {
    logger_->error("Failed to bind an ephemeral port on {}", host);
    return port;
  }
  logger_->info("Listening on http://{}:{}", host, port);
  return port;
}

bool HttpServer::listen()
{
  return server_->listen_after_bind();
}

void HttpServer::waitUntilReady() const
{
  server_->wait_until_ready();
}

void HttpServer::stop()
{
  server_->stop();
}

bool HttpServer::isRunning() const
{
  return server_->is_running();
}

void HttpServer::registerRoutes()
{
  server_->Post("/plan_coverage",
                instrument([this](const httplib::Request& req,
                                  httplib::Response& res)
                           { handlePlanCoverage(req, res); }));

  server_->Get(R"(/get_trajectory/([^/]+))",
               instrument([this](const httplib::Request& req,
                                 httplib::Response& res)
                          { handleGetTrajectory(req, res); }));

  // Unrouted requests (404, 405) keep their status with a JSON body
  server_->set_error_handler(
    [](const httplib::Request& /*req*/, httplib::Response& res)
    {
      if (res.body.empty())
      {
        sendDetail(res, res.status, httplib::status_message(res.status));
      }
    });

  // Last resort for anything a handler let escape
  server_->set_exception_handler(
    [this](const httplib::Request& req,
           httplib::Response& res,
           std::exception_ptr ep)
    {
      try
      {
        std::rethrow_exception(ep);
      }
      catch (const std::exception& e)
      {
        logger_->error("Unhandled error on {} {}: {}", req.method, req.path, e.what());
      }
      catch (...)
      {
        logger_->error("Unhandled non-standard error on {} {}", req.method, req.path);
      }
      sendDetail(res, 500, kInternalError);
    });
}

HttpServer::Handler HttpServer::instrument(Handler handler)
{
  return [this, handler = std::move(handler)](const httplib::Request& req,
                                              httplib::Response& res)
  {
    const auto start = std::chrono::steady_clock::now();

    try
    {
      handler(req, res);
    }
    catch (const std::exception& e)
    {
      logger_->error("Error handling {} {}: {}", req.method, req.path, e.what());
      sendDetail(res, 500, kInternalError);
    }

    const std::chrono::duration<double> elapsed =
      std::chrono::steady_clock::now() - start;
    res.set_header("X-Process-Time", std::format("{:.6f}", elapsed.count()));
    logger_->info("Request handled: {} {} - Processed in {:.4f}s",
                  req.method,
                  req.path,
                  elapsed.count());
  };
}

void HttpServer::handlePlanCoverage(const httplib::Request& req,
                                    httplib::Response& res)
{
  wcp_plan::PlanRequest request;
  try
  {
    request = parsePlanRequest(req.body);
  }
  catch (const ValidationError& e)
  {
    logger_->warn("Rejected plan request: {}", e.what());
    sendJson(res, 422, json{{"detail", e.toJson()}});
    return;
  }

  try
  {
    auto trajectory = service_->plan(request);
    sendJson(res, 200, wcp_store::trajectoryToJson(trajectory));
  }
  catch (const std::exception& e)
  {
    logger_->error("Error during coverage planning: {}", e.what());
    sendDetail(res, 500, kInternalError);
  }
}

void HttpServer::handleGetTrajectory(const httplib::Request& req,
                                     httplib::Response& res)
{
  int64_t id = 0;
  try
  {
    id = parseTrajectoryId(req.matches[1]);
  }
  catch (const ValidationError& e)
  {
    logger_->warn("Rejected trajectory lookup: {}", e.what());
    sendJson(res, 422, json{{"detail", e.toJson()}});
    return;
  }

  std::optional<wcp_store::Trajectory> trajectory;
  try
  {
    trajectory = service_->getTrajectory(id);
  }
  catch (const std::exception& e)
  {
    logger_->error("Error retrieving trajectory {}: {}", id, e.what());
    sendDetail(res, 500, kInternalError);
    return;
  }

  if (!trajectory)
  {
    sendDetail(res, 404, kTrajectoryNotFound);
    return;
  }

  sendJson(res, 200, wcp_store::trajectoryToJson(*trajectory));
}

}  // namespace wcp_server
