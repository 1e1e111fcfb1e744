#ifndef WCP_STORE_TRAJECTORY_HPP
#define WCP_STORE_TRAJECTORY_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "wcp-plan/src/Obstacle.hpp"
#include "wcp-plan/src/PathPoint.hpp"
#include "wcp-transfer/src/TrajectoryRecord.hpp"

namespace wcp_store
{

using TrajectoryId = uint32_t;

/**
 * @brief Persisted result of one coverage planning operation
 *
 * Combines the request inputs (wall size, obstacle snapshot) with the
 * generated path. Created once by TrajectoryStore::insert and never modified
 * afterwards; id and createdAt are assigned by the store.
 */
struct Trajectory
{
  TrajectoryId id{0};
  double wallWidth{0.0};
  double wallHeight{0.0};
  std::vector<wcp_plan::Obstacle> obstacles;
  std::vector<wcp_plan::PathPoint> path;
  std::string createdAt;

  /**
   * @brief Rebuild a trajectory from its database record
   * @throws std::runtime_error if the obstacle or path text is malformed
   */
  static Trajectory fromRecord(const wcp_transfer::TrajectoryRecord& record);

  /**
   * @brief Serialize to a database record
   *
   * The record id is left for the ORM to assign; createdAt is copied as is.
   */
  [[nodiscard]] wcp_transfer::TrajectoryRecord toRecord() const;

  bool operator==(const Trajectory& other) const = default;
};

}  // namespace wcp_store

#endif  // WCP_STORE_TRAJECTORY_HPP
