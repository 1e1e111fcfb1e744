#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

#include "wcp-store/src/JsonCodec.hpp"
#include "wcp-store/src/Trajectory.hpp"

namespace wcp_store
{
namespace test
{

using json = nlohmann::json;
using wcp_plan::Obstacle;
using wcp_plan::PathPoint;

Trajectory makeTrajectory()
{
  Trajectory trajectory;
  trajectory.id = 7;
  trajectory.wallWidth = 10.0;
  trajectory.wallHeight = 5.5;
  trajectory.obstacles = {Obstacle{4.0, 4.0, 2.0, 2.0}};
  trajectory.path = {{0.0, 0.0}, {0.25, 0.0}, {0.5, 0.0}};
  trajectory.createdAt = "2024-01-02 03:04:05";
  return trajectory;
}

// ========== Record Conversion ==========

TEST(TrajectoryTest, ToRecord_SerializesObstaclesAndPathAsJsonText)
{
  auto record = makeTrajectory().toRecord();

  EXPECT_DOUBLE_EQ(record.wall_width, 10.0);
  EXPECT_DOUBLE_EQ(record.wall_height, 5.5);
  EXPECT_EQ(record.created_at, "2024-01-02 03:04:05");

  auto obstacles = json::parse(record.obstacles);
  ASSERT_TRUE(obstacles.is_array());
  ASSERT_EQ(obstacles.size(), 1u);
  EXPECT_DOUBLE_EQ(obstacles[0]["x"].get<double>(), 4.0);
  EXPECT_DOUBLE_EQ(obstacles[0]["height"].get<double>(), 2.0);

  auto path = json::parse(record.path);
  ASSERT_EQ(path.size(), 3u);
  EXPECT_EQ(path[1], json::array({0.25, 0.0}));
}

TEST(TrajectoryTest, FromRecord_RestoresDomainValues)
{
  auto original = makeTrajectory();
  auto record = original.toRecord();
  record.id = 7;

  auto restored = Trajectory::fromRecord(record);

  EXPECT_EQ(restored, original);
}

TEST(TrajectoryTest, FromRecord_CorruptPath_Throws)
{
  auto record = makeTrajectory().toRecord();
  record.path = "[[0.0, 0.0], [0.25]";

  EXPECT_THROW(Trajectory::fromRecord(record), std::runtime_error);
}

// ========== JSON Codec ==========

TEST(JsonCodecTest, ObstaclesFromJson_AcceptsIntegers)
{
  auto obstacles = obstaclesFromJson(
    json::parse(R"([{"x": 1, "y": 2, "width": 3, "height": 4}])"));

  ASSERT_EQ(obstacles.size(), 1u);
  EXPECT_EQ(obstacles[0], (Obstacle{1.0, 2.0, 3.0, 4.0}));
}

TEST(JsonCodecTest, ObstaclesFromJson_MissingField_Throws)
{
  EXPECT_THROW(
    obstaclesFromJson(json::parse(R"([{"x": 1, "y": 2, "width": 3}])")),
    std::runtime_error);
  EXPECT_THROW(obstaclesFromJson(json::parse(R"({"x": 1})")),
               std::runtime_error);
  EXPECT_THROW(obstaclesFromJson(
                 json::parse(R"([{"x": "1", "y": 2, "width": 3, "height": 4}])")),
               std::runtime_error);
}

TEST(JsonCodecTest, PathFromJson_RejectsMalformedPoints)
{
  EXPECT_THROW(pathFromJson(json::parse("[[1.0]]")), std::runtime_error);
  EXPECT_THROW(pathFromJson(json::parse(R"([["a", 1.0]])")), std::runtime_error);
  EXPECT_THROW(pathFromJson(json::parse("{}")), std::runtime_error);
}

TEST(JsonCodecTest, TrajectoryToJson_HasResponseShape)
{
  auto body = trajectoryToJson(makeTrajectory());

  EXPECT_EQ(body["id"].get<int>(), 7);
  EXPECT_DOUBLE_EQ(body["wall_width"].get<double>(), 10.0);
  EXPECT_DOUBLE_EQ(body["wall_height"].get<double>(), 5.5);
  EXPECT_EQ(body["obstacles"].size(), 1u);
  EXPECT_EQ(body["path"].size(), 3u);
  EXPECT_EQ(body["created_at"].get<std::string>(), "2024-01-02 03:04:05");
}

TEST(JsonCodecTest, ParseJsonText_SyntaxError_Throws)
{
  EXPECT_THROW(parseJsonText("[1, 2"), std::runtime_error);
}

}  // namespace test
}  // namespace wcp_store
