#ifndef WCP_STORE_JSON_CODEC_HPP
#define WCP_STORE_JSON_CODEC_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "wcp-plan/src/Obstacle.hpp"
#include "wcp-plan/src/PathPoint.hpp"

namespace wcp_store
{

struct Trajectory;

/**
 * JSON conversions shared by the database text columns and the HTTP
 * responses.
 *
 *   obstacle:   {"x": 4.0, "y": 4.0, "width": 2.0, "height": 2.0}
 *   path:       [[0.0, 0.0], [0.25, 0.0], ...]
 *   trajectory: {"id", "wall_width", "wall_height", "obstacles", "path",
 *                "created_at"}
 *
 * Doubles are written with round-trip precision, so decode(encode(v))
 * reproduces every value exactly. Decoders throw std::runtime_error on
 * malformed input.
 */

nlohmann::json obstacleToJson(const wcp_plan::Obstacle& obstacle);

nlohmann::json obstaclesToJson(const std::vector<wcp_plan::Obstacle>& obstacles);

std::vector<wcp_plan::Obstacle> obstaclesFromJson(const nlohmann::json& array);

nlohmann::json pathToJson(const std::vector<wcp_plan::PathPoint>& path);

std::vector<wcp_plan::PathPoint> pathFromJson(const nlohmann::json& array);

nlohmann::json trajectoryToJson(const Trajectory& trajectory);

/**
 * @brief Parse stored JSON text
 * @throws std::runtime_error on a syntax error
 */
nlohmann::json parseJsonText(const std::string& text);

}  // namespace wcp_store

#endif  // WCP_STORE_JSON_CODEC_HPP
