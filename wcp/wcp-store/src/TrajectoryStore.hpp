#ifndef WCP_STORE_TRAJECTORY_STORE_HPP
#define WCP_STORE_TRAJECTORY_STORE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>
#include <spdlog/spdlog.h>

#include "wcp-plan/src/Obstacle.hpp"
#include "wcp-plan/src/PathPoint.hpp"
#include "wcp-store/src/Trajectory.hpp"

namespace wcp_store
{

/**
 * @brief Durable table of coverage planning results backed by SQLite
 *
 * Each trajectory is a single row (see wcp_transfer::TrajectoryRecord), so a
 * reader never observes a partially written result. Identifiers are assigned
 * by the database on insertion, increase monotonically and are never handed
 * out again, even after a row is deleted by another process.
 *
 * The store holds no open connection between calls: every operation opens
 * its own cpp_sqlite::Database and releases it on return, including when an
 * exception propagates. Concurrent calls from several threads are therefore
 * independent and rely on SQLite's own locking.
 */
class TrajectoryStore
{
public:
  struct Config
  {
    std::string databasePath;  // Path to SQLite database file
  };

  /**
   * @brief Construct the store and create the trajectory table if needed
   *
   * A table left by an earlier version without an AUTOINCREMENT key is
   * rebuilt in place, keeping its rows and ids.
   *
   * @param config Storage location
   * @param logger Logger for store operations
   * @throws std::runtime_error if the database cannot be opened or created
   */
  TrajectoryStore(Config config, std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Persist a new trajectory
   *
   * Stamps the current UTC time as created_at and writes the row in a single
   * transaction.
   *
   * @return Identifier assigned to the new trajectory
   * @throws std::runtime_error if the database cannot be opened or the row
   *         cannot be written
   */
  [[nodiscard]] TrajectoryId insert(double wallWidth,
                                    double wallHeight,
                                    const std::vector<wcp_plan::Obstacle>& obstacles,
                                    const std::vector<wcp_plan::PathPoint>& path);

  /**
   * @brief Look up a trajectory by identifier
   *
   * Obstacles and path are returned with the same order and values that
   * were inserted. Reading never modifies the row.
   *
   * @param id Identifier returned by insert(); values that can never be
   *        assigned (zero, negative, out of range) are reported as absent
   * @return The trajectory, or std::nullopt if no row has this id
   * @throws std::runtime_error if the database cannot be opened or the stored
   *         row is corrupt
   */
  [[nodiscard]] std::optional<Trajectory> getById(int64_t id) const;

  const Config& getConfig() const
  {
    return config_;
  }

  /**
   * @brief Current UTC time formatted as "YYYY-MM-DD HH:MM:SS"
   */
  static std::string currentTimestamp();

private:
  std::unique_ptr<cpp_sqlite::Database> openDatabase(bool allowWrite) const;

  Config config_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace wcp_store

#endif  // WCP_STORE_TRAJECTORY_STORE_HPP
