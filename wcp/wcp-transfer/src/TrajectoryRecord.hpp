#ifndef WCP_TRANSFER_TRAJECTORY_RECORD_HPP
#define WCP_TRANSFER_TRAJECTORY_RECORD_HPP

#include <limits>
#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace wcp_transfer
{

/**
 * @brief Database record for one coverage planning result
 *
 * Wall dimensions are stored as scalar columns. The obstacle list and the
 * generated path are only ever read back whole, so they are kept as JSON
 * text rather than normalized into child tables:
 *   - obstacles: [{"x":..,"y":..,"width":..,"height":..}, ...]
 *   - path:      [[x, y], ...] in visiting order
 *
 * created_at is assigned on insertion as UTC "YYYY-MM-DD HH:MM:SS".
 */
struct TrajectoryRecord : public cpp_sqlite::BaseTransferObject
{
  double wall_width{std::numeric_limits<double>::quiet_NaN()};
  double wall_height{std::numeric_limits<double>::quiet_NaN()};
  std::string obstacles;
  std::string path;
  std::string created_at;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(TrajectoryRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (wall_width, wall_height, obstacles, path, created_at));

}  // namespace wcp_transfer

#endif  // WCP_TRANSFER_TRAJECTORY_RECORD_HPP
