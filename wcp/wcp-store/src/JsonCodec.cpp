#include "wcp-store/src/JsonCodec.hpp"

#include <stdexcept>

#include "wcp-store/src/Trajectory.hpp"

namespace wcp_store
{

using json = nlohmann::json;

namespace
{

double numberAt(const json& object, const char* key)
{
  const auto& value = object.at(key);
  if (!value.is_number())
  {
    throw std::runtime_error(std::string{"expected a number for '"} + key + "'");
  }
  return value.get<double>();
}

}  // namespace

json obstacleToJson(const wcp_plan::Obstacle& obstacle)
{
  return json{{"x", obstacle.x()},
              {"y", obstacle.y()},
              {"width", obstacle.width()},
              {"height", obstacle.height()}};
}

json obstaclesToJson(const std::vector<wcp_plan::Obstacle>& obstacles)
{
  json array = json::array();
  for (const auto& obstacle : obstacles)
  {
    array.push_back(obstacleToJson(obstacle));
  }
  return array;
}

std::vector<wcp_plan::Obstacle> obstaclesFromJson(const json& array)
{
  if (!array.is_array())
  {
    throw std::runtime_error("Obstacle list is not a JSON array");
  }

  std::vector<wcp_plan::Obstacle> obstacles;
  obstacles.reserve(array.size());

  try
  {
    for (const auto& item : array)
    {
      obstacles.emplace_back(numberAt(item, "x"),
                             numberAt(item, "y"),
                             numberAt(item, "width"),
                             numberAt(item, "height"));
    }
  }
  catch (const nlohmann::json::exception& e)
  {
    throw std::runtime_error(std::string{"Malformed obstacle: "} + e.what());
  }

  return obstacles;
}

json pathToJson(const std::vector<wcp_plan::PathPoint>& path)
{
  json array = json::array();
  for (const auto& point : path)
  {
    array.push_back(json::array({point.x(), point.y()}));
  }
  return array;
}

std::vector<wcp_plan::PathPoint> pathFromJson(const json& array)
{
  if (!array.is_array())
  {
    throw std::runtime_error("Path is not a JSON array");
  }

  std::vector<wcp_plan::PathPoint> path;
  path.reserve(array.size());

  for (const auto& item : array)
  {
    if (!item.is_array() || item.size() != 2 || !item[0].is_number() ||
        !item[1].is_number())
    {
      throw std::runtime_error("Malformed path point: " + item.dump());
    }
    path.emplace_back(item[0].get<double>(), item[1].get<double>());
  }

  return path;
}

json trajectoryToJson(const Trajectory& trajectory)
{
  return json{{"id", trajectory.id},
              {"wall_width", trajectory.wallWidth},
              {"wall_height", trajectory.wallHeight},
              {"obstacles", obstaclesToJson(trajectory.obstacles)},
              {"path", pathToJson(trajectory.path)},
              {"created_at", trajectory.createdAt}};
}

json parseJsonText(const std::string& text)
{
  try
  {
    return json::parse(text);
  }
  catch (const nlohmann::json::parse_error& e)
  {
    throw std::runtime_error(std::string{"Stored JSON is malformed: "} + e.what());
  }
}

}  // namespace wcp_store
