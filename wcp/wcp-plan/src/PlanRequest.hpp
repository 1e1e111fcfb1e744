#ifndef WCP_PLAN_PLAN_REQUEST_HPP
#define WCP_PLAN_PLAN_REQUEST_HPP

#include <vector>

#include "wcp-plan/src/Obstacle.hpp"

namespace wcp_plan
{

/**
 * @brief Inputs of one coverage planning operation
 *
 * Wall dimensions are expected to be positive; the HTTP layer rejects
 * anything else before a request reaches the generator. Obstacle order has
 * no effect on the generated path.
 */
struct PlanRequest
{
  double wallWidth{0.0};
  double wallHeight{0.0};
  std::vector<Obstacle> obstacles;
};

}  // namespace wcp_plan

#endif  // WCP_PLAN_PLAN_REQUEST_HPP
