#include "wcp-server/src/RequestParser.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <optional>
#include <system_error>
#include <utility>

namespace wcp_server
{

using json = nlohmann::json;

namespace
{

constexpr const char* kMissing = "Field required";

std::string summarize(const std::vector<FieldError>& errors)
{
  std::string message = "Request validation failed:";
  for (const auto& error : errors)
  {
    message += " " + error.loc.dump() + " " + error.msg + ";";
  }
  return message;
}

/**
 * Read a required numeric field of object at loc + key, recording an error
 * and returning nullopt when it is missing or not a finite number.
 */
std::optional<double> readNumber(const json& object,
                                 const std::string& key,
                                 const json& loc,
                                 std::vector<FieldError>& errors)
{
  json fieldLoc = loc;
  fieldLoc.push_back(key);

  auto it = object.find(key);
  if (it == object.end())
  {
    errors.push_back({fieldLoc, kMissing, "missing"});
    return std::nullopt;
  }
  if (!it->is_number())
  {
    errors.push_back({fieldLoc, "Input should be a valid number", "float_type"});
    return std::nullopt;
  }

  const double value = it->get<double>();
  if (!std::isfinite(value))
  {
    errors.push_back({fieldLoc, "Input should be a finite number", "finite_number"});
    return std::nullopt;
  }
  return value;
}

std::optional<double> readPositive(const json& object,
                                   const std::string& key,
                                   const json& loc,
                                   std::vector<FieldError>& errors)
{
  auto value = readNumber(object, key, loc, errors);
  if (value && *value <= 0.0)
  {
    json fieldLoc = loc;
    fieldLoc.push_back(key);
    errors.push_back({fieldLoc, "Input should be greater than 0", "greater_than"});
    return std::nullopt;
  }
  return value;
}

[[noreturn]] void reject(json loc, std::string msg, std::string type)
{
  std::vector<FieldError> errors;
  errors.push_back(FieldError{std::move(loc), std::move(msg), std::move(type)});
  throw ValidationError{std::move(errors)};
}

}  // namespace

ValidationError::ValidationError(std::vector<FieldError> errors)
  : std::runtime_error{summarize(errors)}, errors_{std::move(errors)}
{
}

json ValidationError::toJson() const
{
  json detail = json::array();
  for (const auto& error : errors_)
  {
    detail.push_back({{"loc", error.loc}, {"msg", error.msg}, {"type", error.type}});
  }
  return detail;
}

wcp_plan::PlanRequest parsePlanRequest(const std::string& body)
{
  const json bodyLoc = json::array({"body"});

  json root = json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (root.is_discarded())
  {
    reject(bodyLoc, "JSON decode error", "json_invalid");
  }
  if (!root.is_object())
  {
    reject(bodyLoc,
           "Input should be a valid dictionary or object",
           "model_attributes_type");
  }

  std::vector<FieldError> errors;
  wcp_plan::PlanRequest request;

  auto wallWidth = readPositive(root, "wall_width", bodyLoc, errors);
  auto wallHeight = readPositive(root, "wall_height", bodyLoc, errors);

  auto obstaclesIt = root.find("obstacles");
  if (obstaclesIt != root.end())
  {
    json listLoc = bodyLoc;
    listLoc.push_back("obstacles");

    if (!obstaclesIt->is_array())
    {
      errors.push_back({listLoc, "Input should be a valid list", "list_type"});
    }
    else
    {
      for (std::size_t i = 0; i < obstaclesIt->size(); ++i)
      {
        const auto& item = (*obstaclesIt)[i];
        json itemLoc = listLoc;
        itemLoc.push_back(i);

        if (!item.is_object())
        {
          errors.push_back({itemLoc,
                            "Input should be a valid dictionary or object",
                            "model_type"});
          continue;
        }

        auto x = readNumber(item, "x", itemLoc, errors);
        auto y = readNumber(item, "y", itemLoc, errors);
        auto width = readNumber(item, "width", itemLoc, errors);
        auto height = readNumber(item, "height", itemLoc, errors);

        if (x && y && width && height)
        {
          request.obstacles.emplace_back(*x, *y, *width, *height);
        }
      }
    }
  }

  if (!errors.empty())
  {
    throw ValidationError{std::move(errors)};
  }

  request.wallWidth = *wallWidth;
  request.wallHeight = *wallHeight;
  return request;
}

int64_t parseTrajectoryId(const std::string& text)
{
  const char* begin = text.data();
  const char* end = text.data() + text.size();

  // Accept an optional leading '+', which from_chars does not
  if (begin != end && *begin == '+')
  {
    ++begin;
    if (begin != end && *begin == '-')
    {
      begin = end;
    }
  }

  int64_t id = 0;
  auto [ptr, ec] = std::from_chars(begin, end, id);

  if (begin == end || ptr != end ||
      (ec != std::errc{} && ec != std::errc::result_out_of_range))
  {
    reject(json::array({"path", "trajectory_id"}),
           "Input should be a valid integer, unable to parse string as an "
           "integer",
           "int_parsing");
  }

  if (ec == std::errc::result_out_of_range)
  {
    return text.front() == '-' ? std::numeric_limits<int64_t>::min()
                               : std::numeric_limits<int64_t>::max();
  }
  return id;
}

}  // namespace wcp_server
