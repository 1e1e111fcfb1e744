#include "wcp-plan/src/Obstacle.hpp"

namespace wcp_plan
{

Obstacle::Obstacle(double x, double y, double width, double height)
  : x_{x},
    y_{y},
    width_{width},
    height_{height},
    bounds_{Eigen::Vector2d{x, y}, Eigen::Vector2d{x + width, y + height}}
{
}

}  // namespace wcp_plan
