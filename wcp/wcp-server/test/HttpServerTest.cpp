#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include "wcp-server/src/HttpServer.hpp"

namespace wcp_server
{
namespace test
{

using json = nlohmann::json;
using wcp_plan::PathGenerator;
using wcp_store::TrajectoryStore;

/**
 * Runs a real server on an ephemeral loopback port and talks to it with an
 * httplib client.
 */
class HttpServerTest : public ::testing::Test
{
protected:
  // Unique per test so parallel test processes never share a file
  static std::string testName()
  {
    return ::testing::UnitTest::GetInstance()->current_test_info()->name();
  }

  void SetUp() override
  {
    auto nullSink = std::make_shared<spdlog::sinks::null_sink_mt>();
    logger_ = std::make_shared<spdlog::logger>("http_server_test", nullSink);

    testDbPath_ = std::filesystem::temp_directory_path() /
                  (std::string{"http_server_test_"} + testName() + ".db");
    if (std::filesystem::exists(testDbPath_))
    {
      std::filesystem::remove(testDbPath_);
    }

    auto store = std::make_shared<TrajectoryStore>(
      TrajectoryStore::Config{testDbPath_.string()}, logger_);
    auto service =
      std::make_shared<CoveragePlanningService>(PathGenerator{}, store, logger_);
    server_ = std::make_unique<HttpServer>(service, logger_);

    port_ = server_->bindToAnyPort("127.0.0.1");
    ASSERT_GT(port_, 0);

    serverThread_ = std::thread{[this] { (void)server_->listen(); }};
    server_->waitUntilReady();

    client_ = std::make_unique<httplib::Client>("127.0.0.1", port_);
  }

  void TearDown() override
  {
    client_.reset();
    if (server_)
    {
      server_->stop();
    }
    if (serverThread_.joinable())
    {
      serverThread_.join();
    }
    server_.reset();

    if (std::filesystem::exists(testDbPath_))
    {
      std::filesystem::remove_all(testDbPath_);
    }
  }

  httplib::Result postPlan(const std::string& body)
  {
    return client_->Post("/plan_coverage", body, "application/json");
  }

  std::shared_ptr<spdlog::logger> logger_;
  std::filesystem::path testDbPath_;
  std::unique_ptr<HttpServer> server_;
  std::thread serverThread_;
  std::unique_ptr<httplib::Client> client_;
  int port_{-1};
};

// ========== POST /plan_coverage ==========

TEST_F(HttpServerTest, PlanCoverage_ReturnsTrajectory)
{
  auto res = postPlan(R"({
    "wall_width": 10.0,
    "wall_height": 10.0,
    "obstacles": [{"x": 4.0, "y": 4.0, "width": 2.0, "height": 2.0}]
  })");

  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_TRUE(res->has_header("X-Process-Time"));
  EXPECT_NE(res->get_header_value("Content-Type").find("application/json"),
            std::string::npos);

  auto body = json::parse(res->body);
  EXPECT_GT(body["id"].get<int64_t>(), 0);
  EXPECT_DOUBLE_EQ(body["wall_width"].get<double>(), 10.0);
  EXPECT_DOUBLE_EQ(body["wall_height"].get<double>(), 10.0);
  ASSERT_EQ(body["obstacles"].size(), 1u);
  EXPECT_DOUBLE_EQ(body["obstacles"][0]["width"].get<double>(), 2.0);
  EXPECT_EQ(body["path"].size(), 41u * 41u - 9u * 9u);
  EXPECT_TRUE(body["created_at"].is_string());
}

TEST_F(HttpServerTest, PlanCoverage_InvalidBody_Returns422)
{
  auto res = postPlan(R"({"wall_width": 0, "wall_height": 5})");

  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 422);
  EXPECT_TRUE(res->has_header("X-Process-Time"));

  auto body = json::parse(res->body);
  ASSERT_TRUE(body["detail"].is_array());
  ASSERT_EQ(body["detail"].size(), 1u);
  EXPECT_EQ(body["detail"][0]["loc"], json::array({"body", "wall_width"}));
}

TEST_F(HttpServerTest, PlanCoverage_MalformedJson_Returns422)
{
  auto res = postPlan("not json");

  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 422);
  EXPECT_EQ(json::parse(res->body)["detail"][0]["type"], "json_invalid");
}

TEST_F(HttpServerTest, PlanCoverage_StorageFailure_Returns500)
{
  std::filesystem::remove(testDbPath_);
  std::filesystem::create_directory(testDbPath_);

  auto res = postPlan(R"({"wall_width": 1, "wall_height": 1})");

  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 500);
  EXPECT_EQ(json::parse(res->body), json({{"detail", "Internal server error"}}));
}

TEST_F(HttpServerTest, PlanCoverage_WallTooLargeToSample_Returns500)
{
  // Fails fast instead of tying up the worker; the timeout bounds a regression
  client_->set_read_timeout(10, 0);

  auto res = postPlan(R"({"wall_width": 1e20, "wall_height": 1})");

  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 500);
  EXPECT_EQ(json::parse(res->body), json({{"detail", "Internal server error"}}));

  // Nothing was stored, so the server still answers normally afterwards
  auto next = postPlan(R"({"wall_width": 1, "wall_height": 1})");
  ASSERT_TRUE(next);
  EXPECT_EQ(next->status, 200);
}

// ========== GET /get_trajectory/{id} ==========

TEST_F(HttpServerTest, GetTrajectory_AfterPlan_ReturnsSameBody)
{
  auto planned = postPlan(R"({"wall_width": 5, "wall_height": 5})");
  ASSERT_TRUE(planned);
  ASSERT_EQ(planned->status, 200);
  auto plannedBody = json::parse(planned->body);

  auto res = client_->Get("/get_trajectory/" +
                          std::to_string(plannedBody["id"].get<int64_t>()));

  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_TRUE(res->has_header("X-Process-Time"));
  auto body = json::parse(res->body);
  EXPECT_EQ(body, plannedBody);
  EXPECT_DOUBLE_EQ(body["wall_width"].get<double>(), 5.0);
}

TEST_F(HttpServerTest, GetTrajectory_UnknownId_Returns404)
{
  auto res = client_->Get("/get_trajectory/99999");

  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 404);
  EXPECT_EQ(json::parse(res->body), json({{"detail", "Trajectory not found"}}));
}

TEST_F(HttpServerTest, GetTrajectory_NonIntegerId_Returns422)
{
  auto res = client_->Get("/get_trajectory/abc");

  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 422);
  EXPECT_EQ(json::parse(res->body)["detail"][0]["loc"],
            json::array({"path", "trajectory_id"}));
}

// ========== Unrouted ==========

TEST_F(HttpServerTest, UnknownRoute_Returns404Json)
{
  auto res = client_->Get("/does_not_exist");

  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 404);
  EXPECT_TRUE(json::parse(res->body).contains("detail"));
}

}  // namespace test
}  // namespace wcp_server
