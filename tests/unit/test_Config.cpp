#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "test_helpers.hpp"

#include <cstdlib>
#include <nlohmann/json.hpp>

using namespace stratus::config;
using namespace stratus::test;
using namespace std::chrono_literals;

class ConfigTest : public ::testing::Test {
protected:
    TempDir dir{"stratus-config"};

    std::string write(const std::string& yaml) const {
        const auto path = dir / "config.yaml";
        writeFile(path, yaml);
        return path.string();
    }

    void TearDown() override { ::unsetenv("STRATUS_DB_PASSWORD"); }
};

TEST_F(ConfigTest, ReadsEverySection) {
    const auto cfg = loadConfig(write(R"(
tasks:
  max_workers: 8
  completed_buffer_size: 16
  stop_grace_period_ms: 250
transfer:
  chunk_size: 1048576
  max_retries: 6
  retry_base_delay_ms: 10
  session_ttl_hours: 2
bridge:
  callback_deadline_ms: 1500
remote_events:
  enabled: false
  poll_interval_ms: 100
database:
  backend: postgres
  host: db.internal
  port: 6543
  password: hunter2
paths:
  drives_file: /tmp/drives.json
ignore:
  patterns: ["*.tmp", "build/"]
logging:
  log_dir: /tmp/stratus-logs
  levels:
    console_log_level: debug
    subsystem_levels:
      bridge: trace
)"));

    EXPECT_EQ(cfg.tasks.max_workers, 8u);
    EXPECT_EQ(cfg.tasks.completed_buffer_size, 16u);
    EXPECT_EQ(cfg.tasks.stop_grace_period, 250ms);
    EXPECT_EQ(cfg.transfer.chunk_size, 1048576u);
    EXPECT_EQ(cfg.transfer.max_retries, 6u);
    EXPECT_EQ(cfg.transfer.retry_base_delay, 10ms);
    EXPECT_EQ(cfg.transfer.retry_max_delay, 30000ms);
    EXPECT_EQ(cfg.transfer.session_ttl, 2h);
    EXPECT_EQ(cfg.bridge.callback_deadline, 1500ms);
    EXPECT_FALSE(cfg.remote_events.enabled);
    EXPECT_EQ(cfg.remote_events.poll_interval, 100ms);
    EXPECT_EQ(cfg.remote_events.max_retries, 5u);
    EXPECT_EQ(cfg.database.backend, "postgres");
    EXPECT_EQ(cfg.database.host, "db.internal");
    EXPECT_EQ(cfg.database.port, 6543);
    EXPECT_EQ(cfg.database.password, "hunter2");
    EXPECT_EQ(cfg.paths.drives_file, "/tmp/drives.json");
    EXPECT_EQ(cfg.paths.staging_dir, "/var/lib/stratus/staging");
    EXPECT_EQ(cfg.ignore.patterns, (std::vector<std::string>{"*.tmp", "build/"}));
    EXPECT_EQ(cfg.logging.log_dir, "/tmp/stratus-logs");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.bridge, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.db, spdlog::level::err);
}

TEST_F(ConfigTest, MissingSectionsKeepDefaults) {
    const auto cfg = loadConfig(write("tasks:\n  max_workers: 2\n"));
    EXPECT_EQ(cfg.tasks.max_workers, 2u);
    EXPECT_EQ(cfg.tasks.completed_buffer_size, 100u);
    EXPECT_EQ(cfg.transfer.chunk_size, DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(cfg.bridge.callback_deadline, 30000ms);
    EXPECT_TRUE(cfg.remote_events.enabled);
    EXPECT_EQ(cfg.database.backend, "memory");
}

TEST_F(ConfigTest, PasswordFallsBackToEnvironment) {
    ::setenv("STRATUS_DB_PASSWORD", "from-env", 1);
    EXPECT_EQ(loadConfig(write("database:\n  backend: postgres\n")).database.password, "from-env");
    EXPECT_EQ(loadConfig(write("database:\n  password: inline\n")).database.password, "inline");
}

TEST_F(ConfigTest, RejectsZeroSizedBuffers) {
    EXPECT_THROW(loadConfig(write("tasks:\n  completed_buffer_size: 0\n")), std::invalid_argument);
    EXPECT_THROW(loadConfig(write("transfer:\n  chunk_size: 0\n")), std::invalid_argument);
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_ANY_THROW(loadConfig((dir / "absent.yaml").string()));
}

TEST_F(ConfigTest, DumpOmitsPasswordAndReadsBack) {
    Config cfg;
    cfg.database.password = "hunter2";
    cfg.tasks.max_workers = 3;
    cfg.ignore.patterns = {"*.o"};

    const auto text = dumpConfig(cfg);
    EXPECT_EQ(text.find("hunter2"), std::string::npos);

    const auto back = nlohmann::json::parse(text).get<Config>();
    EXPECT_EQ(back.tasks.max_workers, 3u);
    EXPECT_EQ(back.ignore.patterns, std::vector<std::string>{"*.o"});
    EXPECT_TRUE(back.database.password.empty());
    EXPECT_EQ(back.logging.levels.file_log_level, cfg.logging.levels.file_log_level);
}
