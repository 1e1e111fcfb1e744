#ifndef WCP_SERVER_COVERAGE_PLANNING_SERVICE_HPP
#define WCP_SERVER_COVERAGE_PLANNING_SERVICE_HPP

#include <cstdint>
#include <memory>
#include <optional>

#include <spdlog/spdlog.h>

#include "wcp-plan/src/PathGenerator.hpp"
#include "wcp-plan/src/PlanRequest.hpp"
#include "wcp-store/src/Trajectory.hpp"
#include "wcp-store/src/TrajectoryStore.hpp"

namespace wcp_server
{

/**
 * @brief Plans coverage paths and records them
 *
 * Transport-independent core of the HTTP endpoints. A plan request runs the
 * generator, persists inputs and path through the store, and returns the
 * stored trajectory. Lookups go straight to the store.
 *
 * Holds no per-request state; concurrent calls only share the store, which
 * opens a connection per operation.
 */
class CoveragePlanningService
{
public:
  CoveragePlanningService(wcp_plan::PathGenerator generator,
                          std::shared_ptr<wcp_store::TrajectoryStore> store,
                          std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Generate, persist and return a coverage trajectory
   *
   * The returned value is read back from the store, so id and createdAt are
   * exactly what later lookups will see.
   *
   * @throws std::runtime_error on storage failure
   */
  [[nodiscard]] wcp_store::Trajectory plan(const wcp_plan::PlanRequest& request);

  /**
   * @brief Fetch a stored trajectory; std::nullopt when the id is unknown
   * @throws std::runtime_error on storage failure
   */
  [[nodiscard]] std::optional<wcp_store::Trajectory> getTrajectory(
    int64_t id) const;

private:
  wcp_plan::PathGenerator generator_;
  std::shared_ptr<wcp_store::TrajectoryStore> store_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace wcp_server

#endif  // WCP_SERVER_COVERAGE_PLANNING_SERVICE_HPP
