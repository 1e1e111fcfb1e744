#include "wcp-server/src/CoveragePlanningService.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace wcp_server
{

CoveragePlanningService::CoveragePlanningService(
  wcp_plan::PathGenerator generator,
  std::shared_ptr<wcp_store::TrajectoryStore> store,
  std::shared_ptr<spdlog::logger> logger)
  : generator_{std::move(generator)},
    store_{std::move(store)},
    logger_{std::move(logger)}
{
  if (!store_)
  {
    throw std::invalid_argument("CoveragePlanningService: store is null");
  }
}

wcp_store::Trajectory CoveragePlanningService::plan(
  const wcp_plan::PlanRequest& request)
{
  logger_->info(
    "Received request to plan coverage for {}x{} wall with {} obstacles.",
    request.wallWidth,
    request.wallHeight,
    request.obstacles.size());

  auto path = generator_.generate(request);

  const auto id = store_->insert(
    request.wallWidth, request.wallHeight, request.obstacles, path);

  auto stored = store_->getById(id);
  if (!stored)
  {
    throw std::runtime_error("Trajectory " + std::to_string(id) +
                             " missing immediately after insert");
  }

  logger_->info("Trajectory {} generated and saved successfully.", id);
  return std::move(*stored);
}

std::optional<wcp_store::Trajectory> CoveragePlanningService::getTrajectory(
  int64_t id) const
{
  return store_->getById(id);
}

}  // namespace wcp_server
