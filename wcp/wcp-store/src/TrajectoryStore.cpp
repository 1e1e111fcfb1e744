#include "wcp-store/src/TrajectoryStore.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <sqlite3.h>
#include <cpp_sqlite/src/cpp_sqlite/DBDataAccessObject.hpp>

#include "wcp-transfer/src/TrajectoryRecord.hpp"

namespace wcp_store
{

namespace
{

constexpr std::string_view kPrimaryKey = "PRIMARY KEY";
constexpr std::string_view kAutoincrement = "AUTOINCREMENT";

void execute(sqlite3& db, const std::string& sql)
{
  char* errMsg = nullptr;
  const int rc = sqlite3_exec(&db, sql.c_str(), nullptr, nullptr, &errMsg);
  if (rc != SQLITE_OK)
  {
    std::string message = errMsg != nullptr ? errMsg : sqlite3_errstr(rc);
    sqlite3_free(errMsg);
    throw std::runtime_error("TrajectoryStore: " + message + " in: " + sql);
  }
}

// CREATE TABLE statement of table as recorded in sqlite_master
std::string tableDefinition(sqlite3& db, const std::string& table)
{
  sqlite3_stmt* rawPtr = nullptr;
  const int rc = sqlite3_prepare_v2(
    &db,
    "SELECT sql FROM sqlite_master WHERE type = 'table' AND name = ?;",
    -1,
    &rawPtr,
    nullptr);
  if (rc != SQLITE_OK)
  {
    throw std::runtime_error(std::string{"TrajectoryStore: "} +
                             sqlite3_errmsg(&db));
  }
  cpp_sqlite::PreparedSQLStmt stmt{rawPtr, sqlite3_finalize};

  sqlite3_bind_text(stmt.get(), 1, table.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW)
  {
    throw std::runtime_error("TrajectoryStore: table " + table + " not found");
  }

  const auto* text = sqlite3_column_text(stmt.get(), 0);
  return text != nullptr ? reinterpret_cast<const char*>(text) : "";
}

std::string toUpper(std::string text)
{
  std::transform(text.begin(),
                 text.end(),
                 text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return text;
}

/**
 * Rebuild table with an AUTOINCREMENT primary key unless it already has one.
 *
 * A plain INTEGER PRIMARY KEY hands the largest rowid out again once that
 * row is deleted. AUTOINCREMENT keeps the high-water mark in sqlite_sequence,
 * so ids stay unique even after rows are removed outside this store. Column
 * definitions are taken verbatim from the existing table and rows are copied
 * with their ids.
 */
void requireAutoincrementIds(cpp_sqlite::Database& database,
                             const std::string& table)
{
  sqlite3& db = database.getRawDB();
  std::string definition = tableDefinition(db, table);
  const std::string upper = toUpper(definition);

  if (upper.find(kAutoincrement) != std::string::npos)
  {
    return;
  }

  const auto columns = upper.find('(');
  const auto key = upper.find(kPrimaryKey);
  if (columns == std::string::npos || key == std::string::npos || key < columns)
  {
    throw std::runtime_error("TrajectoryStore: table " + table +
                             " has no primary key column");
  }

  definition.insert(key + kPrimaryKey.size(),
                    " " + std::string{kAutoincrement});

  const std::string staging = table + "_rebuild";
  database.withTransaction(
    [&db, &definition, &table, &staging, columns]()
    {
      execute(db, "CREATE TABLE " + staging + " " + definition.substr(columns) + ";");
      execute(db, "INSERT INTO " + staging + " SELECT * FROM " + table + ";");
      execute(db, "DROP TABLE " + table + ";");
      execute(db, "ALTER TABLE " + staging + " RENAME TO " + table + ";");
    });
}

}  // namespace

TrajectoryStore::TrajectoryStore(Config config,
                                 std::shared_ptr<spdlog::logger> logger)
  : config_{std::move(config)}, logger_{std::move(logger)}
{
  if (config_.databasePath.empty())
  {
    throw std::runtime_error("TrajectoryStore: database path is empty");
  }

  // Creating the DAO creates the table
  auto database = openDatabase(true);
  auto& dao = database->getDAO<wcp_transfer::TrajectoryRecord>();
  requireAutoincrementIds(*database, dao.getTableName());

  logger_->info("Trajectory store ready: {}", config_.databasePath);
}

TrajectoryId TrajectoryStore::insert(
  double wallWidth,
  double wallHeight,
  const std::vector<wcp_plan::Obstacle>& obstacles,
  const std::vector<wcp_plan::PathPoint>& path)
{
  Trajectory trajectory;
  trajectory.wallWidth = wallWidth;
  trajectory.wallHeight = wallHeight;
  trajectory.obstacles = obstacles;
  trajectory.path = path;
  trajectory.createdAt = currentTimestamp();

  auto record = trajectory.toRecord();

  auto database = openDatabase(true);
  auto& dao = database->getDAO<wcp_transfer::TrajectoryRecord>();
  database->withTransaction([&dao, &record]() { dao.insert(record); });

  if (record.id == 0)
  {
    throw std::runtime_error("TrajectoryStore: insert did not assign an id");
  }

  const auto id = static_cast<TrajectoryId>(record.id);
  logger_->debug("Inserted trajectory {} ({} obstacles, {} path points)",
                 id,
                 obstacles.size(),
                 path.size());
  return id;
}

std::optional<Trajectory> TrajectoryStore::getById(int64_t id) const
{
  if (id <= 0 || id > std::numeric_limits<TrajectoryId>::max())
  {
    return std::nullopt;
  }

  auto database = openDatabase(false);
  auto& dao = database->getDAO<wcp_transfer::TrajectoryRecord>();
  auto record = dao.selectById(static_cast<TrajectoryId>(id));

  if (!record.has_value())
  {
    logger_->debug("Trajectory {} not found", id);
    return std::nullopt;
  }

  return Trajectory::fromRecord(*record);
}

std::string TrajectoryStore::currentTimestamp()
{
  const auto now =
    std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
  return std::format("{:%Y-%m-%d %H:%M:%S}", now);
}

std::unique_ptr<cpp_sqlite::Database> TrajectoryStore::openDatabase(
  bool allowWrite) const
{
  logger_->debug("Opening database: {}", config_.databasePath);
  return std::make_unique<cpp_sqlite::Database>(config_.databasePath,
                                                allowWrite);
}

}  // namespace wcp_store
