// Boustrophedon coverage path generation

#ifndef WCP_PLAN_PATH_GENERATOR_HPP
#define WCP_PLAN_PATH_GENERATOR_HPP

#include <cstddef>
#include <vector>

#include "wcp-plan/src/Obstacle.hpp"
#include "wcp-plan/src/PathPoint.hpp"
#include "wcp-plan/src/PlanRequest.hpp"

namespace wcp_plan
{

/**
 * @brief Generates back-and-forth (boustrophedon) coverage paths over a
 * rectangular wall
 *
 * The wall [0, wallWidth] x [0, wallHeight] is sampled on a square grid of
 * pitch stepSize starting at the origin. Rows are visited bottom to top; the
 * first row sweeps in increasing x, and each following row reverses
 * direction, starting from the column where the previous row ended.
 *
 * A sample that falls inside any obstacle (boundary included) is dropped.
 * Nothing is emitted in its place, so obstacles leave gaps in the path rather
 * than detours around them.
 *
 * Cost is O(rows * columns * obstacles): every sample is tested against
 * every obstacle with no spatial pruning, which limits this to small walls
 * and obstacle counts. Grids larger than Config::maxSamples are refused
 * before any sampling starts.
 *
 * Stateless apart from its configuration; safe to share across threads.
 */
class PathGenerator
{
public:
  struct Config
  {
    double stepSize{0.25};                         // Grid pitch in wall units
    std::size_t maxSamples{std::size_t{1} << 26};  // Largest rows * columns
  };

  /**
   * @brief Construct a generator with the default 0.25 step
   */
  PathGenerator();

  /**
   * @brief Construct a generator with a custom step
   * @throws std::invalid_argument if stepSize is not positive and finite, or
   *         maxSamples is zero
   */
  explicit PathGenerator(const Config& config);

  /**
   * @brief Generate the coverage path for a wall and its obstacles
   *
   * When wallWidth (or wallHeight) is smaller than one step, each row (or
   * the single row) still contains the boundary sample at the origin side.
   *
   * @param wallWidth Wall extent along x
   * @param wallHeight Wall extent along y
   * @param obstacles Rectangles whose samples are excluded
   * @return Path points in visiting order
   * @throws std::length_error if the sampling grid exceeds maxSamples
   */
  [[nodiscard]] std::vector<PathPoint> generate(
    double wallWidth,
    double wallHeight,
    const std::vector<Obstacle>& obstacles) const;

  [[nodiscard]] std::vector<PathPoint> generate(
    const PlanRequest& request) const;

  double getStepSize() const
  {
    return stepSize_;
  }

  std::size_t getMaxSamples() const
  {
    return maxSamples_;
  }

private:
  bool isBlocked(const Eigen::Vector2d& point,
                 const std::vector<Obstacle>& obstacles) const;

  // Number of grid samples in [0, extent]
  std::size_t sampleCount(double extent) const;

  double stepSize_;
  std::size_t maxSamples_;
};

}  // namespace wcp_plan

#endif  // WCP_PLAN_PATH_GENERATOR_HPP
