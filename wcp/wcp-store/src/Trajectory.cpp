#include "wcp-store/src/Trajectory.hpp"

#include <nlohmann/json.hpp>

#include "wcp-store/src/JsonCodec.hpp"

namespace wcp_store
{

Trajectory Trajectory::fromRecord(const wcp_transfer::TrajectoryRecord& record)
{
  Trajectory trajectory;
  trajectory.id = static_cast<TrajectoryId>(record.id);
  trajectory.wallWidth = record.wall_width;
  trajectory.wallHeight = record.wall_height;
  trajectory.obstacles = obstaclesFromJson(parseJsonText(record.obstacles));
  trajectory.path = pathFromJson(parseJsonText(record.path));
  trajectory.createdAt = record.created_at;
  return trajectory;
}

wcp_transfer::TrajectoryRecord Trajectory::toRecord() const
{
  wcp_transfer::TrajectoryRecord record;
  record.wall_width = wallWidth;
  record.wall_height = wallHeight;
  record.obstacles = obstaclesToJson(obstacles).dump();
  record.path = pathToJson(path).dump();
  record.created_at = createdAt;
  return record;
}

}  // namespace wcp_store
