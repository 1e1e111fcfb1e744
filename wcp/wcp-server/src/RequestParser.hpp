#ifndef WCP_SERVER_REQUEST_PARSER_HPP
#define WCP_SERVER_REQUEST_PARSER_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "wcp-plan/src/PlanRequest.hpp"

namespace wcp_server
{

/**
 * @brief One rejected input field
 *
 * loc is the path to the field, starting with where it came from, e.g.
 * ["body", "obstacles", 0, "x"] or ["path", "trajectory_id"].
 */
struct FieldError
{
  nlohmann::json loc;
  std::string msg;
  std::string type;
};

/**
 * @brief Request input that failed validation; carries every field error
 */
class ValidationError : public std::runtime_error
{
public:
  explicit ValidationError(std::vector<FieldError> errors);

  const std::vector<FieldError>& errors() const
  {
    return errors_;
  }

  /**
   * @brief Error list as [{"loc": [...], "msg": "...", "type": "..."}]
   */
  [[nodiscard]] nlohmann::json toJson() const;

private:
  std::vector<FieldError> errors_;
};

/**
 * @brief Parse and validate a POST /plan_coverage body
 *
 * wall_width and wall_height must be numbers greater than 0. obstacles is
 * optional (empty when absent); each entry needs numeric x, y, width and
 * height. Integers are accepted as numbers, booleans are not. Unknown keys
 * are ignored.
 *
 * @throws ValidationError listing every invalid field
 */
wcp_plan::PlanRequest parsePlanRequest(const std::string& body);

/**
 * @brief Parse the {id} segment of GET /get_trajectory/{id}
 *
 * Integers beyond the int64 range saturate; they can never match a stored
 * trajectory either way.
 *
 * @throws ValidationError if the text is not a base-10 integer
 */
int64_t parseTrajectoryId(const std::string& text);

}  // namespace wcp_server

#endif  // WCP_SERVER_REQUEST_PARSER_HPP
