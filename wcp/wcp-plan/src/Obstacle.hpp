#ifndef WCP_PLAN_OBSTACLE_HPP
#define WCP_PLAN_OBSTACLE_HPP

#include <Eigen/Geometry>

namespace wcp_plan
{

/**
 * @brief Axis-aligned rectangular obstacle on the wall
 *
 * Defined by its bottom-left corner (x, y) and its extent (width, height).
 * The rectangle is closed: points on any edge are inside it. Immutable once
 * constructed.
 *
 * An obstacle with a negative width or height spans an empty box and
 * contains no point. Obstacles are not clipped to the wall.
 */
class Obstacle
{
public:
  Obstacle(double x, double y, double width, double height);

  double x() const
  {
    return x_;
  }

  double y() const
  {
    return y_;
  }

  double width() const
  {
    return width_;
  }

  double height() const
  {
    return height_;
  }

  /**
   * @brief Closed bounds [x, x + width] x [y, y + height]
   */
  const Eigen::AlignedBox2d& bounds() const
  {
    return bounds_;
  }

  /**
   * @brief Containment test, inclusive on every edge
   */
  [[nodiscard]] bool contains(const Eigen::Vector2d& point) const
  {
    return bounds_.contains(point);
  }

  bool operator==(const Obstacle& other) const
  {
    return x_ == other.x_ && y_ == other.y_ && width_ == other.width_ &&
           height_ == other.height_;
  }

private:
  double x_;
  double y_;
  double width_;
  double height_;
  Eigen::AlignedBox2d bounds_;
};

}  // namespace wcp_plan

#endif  // WCP_PLAN_OBSTACLE_HPP
