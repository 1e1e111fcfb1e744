// Purpose: Measure how coverage path generation scales with wall area and
// obstacle count. Every sample is tested against every obstacle, so cost
// grows with (width / step) * (height / step) * obstacles.

#include <benchmark/benchmark.h>

#include <random>
#include <vector>

#include "wcp-plan/src/Obstacle.hpp"
#include "wcp-plan/src/PathGenerator.hpp"

using namespace wcp_plan;

namespace
{

std::vector<Obstacle> generateRandomObstacles(std::size_t count,
                                              double wallSize,
                                              std::mt19937& rng)
{
  std::uniform_real_distribution<double> posDist{0.0, wallSize};
  std::uniform_real_distribution<double> sizeDist{0.1, wallSize / 10.0};

  std::vector<Obstacle> obstacles;
  obstacles.reserve(count);
  for (std::size_t i = 0; i < count; ++i)
  {
    obstacles.emplace_back(posDist(rng), posDist(rng), sizeDist(rng), sizeDist(rng));
  }
  return obstacles;
}

}  // namespace

/**
 * @brief Generation cost against wall edge length, no obstacles
 *
 * Isolates the sweep itself. Expect quadratic growth in the edge length.
 */
static void BM_PathGenerator_WallSize(benchmark::State& state)
{
  const auto wallSize = static_cast<double>(state.range(0));
  PathGenerator generator;

  for (auto _ : state)
  {
    auto path = generator.generate(wallSize, wallSize, {});
    benchmark::DoNotOptimize(path.data());
  }

  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_PathGenerator_WallSize)
  ->RangeMultiplier(2)
  ->Range(8, 256)
  ->Complexity(benchmark::oNSquared);

/**
 * @brief Generation cost against obstacle count on a fixed 50 x 50 wall
 *
 * Expect linear growth in the obstacle count.
 */
static void BM_PathGenerator_ObstacleCount(benchmark::State& state)
{
  std::mt19937 rng{42};
  constexpr double kWallSize = 50.0;
  auto obstacles = generateRandomObstacles(
    static_cast<std::size_t>(state.range(0)), kWallSize, rng);
  PathGenerator generator;

  for (auto _ : state)
  {
    auto path = generator.generate(kWallSize, kWallSize, obstacles);
    benchmark::DoNotOptimize(path.data());
  }

  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_PathGenerator_ObstacleCount)
  ->RangeMultiplier(4)
  ->Range(1, 256)
  ->Complexity(benchmark::oN);

BENCHMARK_MAIN();
