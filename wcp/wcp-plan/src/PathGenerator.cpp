#include "wcp-plan/src/PathGenerator.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace wcp_plan
{

PathGenerator::PathGenerator() : PathGenerator{Config{}}
{
}

PathGenerator::PathGenerator(const Config& config)
  : stepSize_{config.stepSize}, maxSamples_{config.maxSamples}
{
  if (!std::isfinite(stepSize_) || stepSize_ <= 0.0)
  {
    throw std::invalid_argument("PathGenerator: step size must be positive, got " +
                                std::to_string(stepSize_));
  }
  if (maxSamples_ == 0)
  {
    throw std::invalid_argument("PathGenerator: sample limit must be positive");
  }
}

std::vector<PathPoint> PathGenerator::generate(
  double wallWidth,
  double wallHeight,
  const std::vector<Obstacle>& obstacles) const
{
  std::vector<PathPoint> path;

  const std::size_t rows = sampleCount(wallHeight);
  const std::size_t columns = sampleCount(wallWidth);
  if (rows == 0 || columns == 0)
  {
    return path;
  }

  if (rows > maxSamples_ / columns)
  {
    throw std::length_error("PathGenerator: " + std::to_string(rows) + " x " +
                            std::to_string(columns) +
                            " sampling grid exceeds the limit of " +
                            std::to_string(maxSamples_) + " samples");
  }

  path.reserve(rows * columns);

  for (std::size_t row = 0; row < rows; ++row)
  {
    const double y = static_cast<double>(row) * stepSize_;
    const bool increasing = (row % 2) == 0;

    for (std::size_t i = 0; i < columns; ++i)
    {
      const std::size_t column = increasing ? i : columns - 1 - i;
      const PathPoint point{static_cast<double>(column) * stepSize_, y};

      if (!isBlocked(point, obstacles))
      {
        path.push_back(point);
      }
    }
  }

  path.shrink_to_fit();
  return path;
}

std::vector<PathPoint> PathGenerator::generate(const PlanRequest& request) const
{
  return generate(request.wallWidth, request.wallHeight, request.obstacles);
}

bool PathGenerator::isBlocked(const Eigen::Vector2d& point,
                              const std::vector<Obstacle>& obstacles) const
{
  return std::any_of(obstacles.begin(),
                     obstacles.end(),
                     [&point](const Obstacle& obstacle)
                     { return obstacle.contains(point); });
}

std::size_t PathGenerator::sampleCount(double extent) const
{
  // Negative and non-finite extents hold no sample; 0 holds the origin only
  if (!std::isfinite(extent) || extent < 0.0)
  {
    return 0;
  }

  // The ratio must fit a sample count before it is converted
  const double ratio = extent / stepSize_;
  if (ratio >= static_cast<double>(maxSamples_))
  {
    throw std::length_error("PathGenerator: extent " + std::to_string(extent) +
                            " needs more than " + std::to_string(maxSamples_) +
                            " samples");
  }

  // Samples sit at index * step. Start from the floor estimate and correct
  // it so that the last sample is the largest one still <= extent.
  auto count = static_cast<std::size_t>(std::floor(ratio)) + 1;
  while (count > 1 && static_cast<double>(count - 1) * stepSize_ > extent)
  {
    --count;
  }
  while (static_cast<double>(count) * stepSize_ <= extent)
  {
    ++count;
  }
  return count;
}

}  // namespace wcp_plan
