#ifndef WCP_PLAN_PATH_POINT_HPP
#define WCP_PLAN_PATH_POINT_HPP

#include <format>

#include <Eigen/Dense>

namespace wcp_plan
{

/**
 * @brief A sampled point of a coverage path, in wall units
 *
 * Origin is the bottom-left corner of the wall. Inherits Eigen::Vector2d so
 * path points keep full Eigen arithmetic and can be passed wherever a vector
 * is expected.
 */
struct PathPoint final : Eigen::Vector2d
{
  PathPoint() : Eigen::Vector2d{0.0, 0.0}
  {
  }

  PathPoint(double x, double y) : Eigen::Vector2d{x, y}
  {
  }

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  PathPoint(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector2d{other}
  {
  }

  template <typename OtherDerived>
  PathPoint& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    this->Eigen::Vector2d::operator=(other);
    return *this;
  }
};

}  // namespace wcp_plan

// Formatter specialization for std::format support
// Format: "(x, y)" with an optional precision, e.g. "{:.2}"
template <>
struct std::formatter<wcp_plan::PathPoint>
{
  int precision = 3;

  constexpr auto parse(std::format_parse_context& ctx)
  {
    auto it = ctx.begin();
    auto end = ctx.end();

    if (it != end && *it == '.')
    {
      ++it;
      precision = 0;
      while (it != end && *it >= '0' && *it <= '9')
      {
        precision = precision * 10 + (*it - '0');
        ++it;
      }
    }

    return it;
  }

  auto format(const wcp_plan::PathPoint& point, std::format_context& ctx) const
  {
    return std::format_to(
      ctx.out(), "({:.{}f}, {:.{}f})", point.x(), precision, point.y(), precision);
  }
};

#endif  // WCP_PLAN_PATH_POINT_HPP
