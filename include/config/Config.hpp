#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace stratus::config {

constexpr static uintmax_t DEFAULT_CHUNK_SIZE = 8 * 1024 * 1024; // 8 MiB

struct TaskManagerConfig {
    unsigned int max_workers = 4;
    size_t completed_buffer_size = 100;
    std::chrono::milliseconds stop_grace_period{5000};
};

struct TransferConfig {
    uintmax_t chunk_size = DEFAULT_CHUNK_SIZE;
    unsigned int max_retries = 3;
    std::chrono::milliseconds retry_base_delay{1000};
    std::chrono::milliseconds retry_max_delay{30000};
    std::chrono::seconds request_timeout{60};
    std::chrono::hours session_ttl{24};
    std::chrono::seconds progress_window{10};
    std::chrono::minutes session_sweep_interval{60};
};

struct BridgeConfig {
    std::chrono::milliseconds callback_deadline{30000};
};

struct RemoteEventsConfig {
    bool enabled = true;
    unsigned int max_retries = 5;
    std::chrono::milliseconds initial_backoff{1000};
    std::chrono::milliseconds max_backoff{32000};
    std::chrono::milliseconds poll_interval{5000};
};

struct DatabaseConfig {
    std::string backend = "memory"; // memory | postgres
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "stratus";
    std::string user = "stratus";
    std::string password;
    unsigned int pool_size = 4;
};

struct PathsConfig {
    std::filesystem::path drives_file = "/var/lib/stratus/drives.json";
    std::filesystem::path staging_dir = "/var/lib/stratus/staging";
};

struct IgnoreConfig {
    std::vector<std::string> patterns;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum stratus  = spdlog::level::info;  // startup/shutdown
    spdlog::level::level_enum drive    = spdlog::level::info;  // drive lifecycle
    spdlog::level::level_enum mount    = spdlog::level::info;
    spdlog::level::level_enum bridge   = spdlog::level::warn;  // only deadline misses and failures
    spdlog::level::level_enum tasks    = spdlog::level::info;
    spdlog::level::level_enum transfer = spdlog::level::warn;  // retries, checksum mismatches
    spdlog::level::level_enum storage  = spdlog::level::warn;  // backend I/O issues
    spdlog::level::level_enum crypto   = spdlog::level::warn;
    spdlog::level::level_enum db       = spdlog::level::err;   // unreachable DB, failed tx
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/stratus";
    LogLevelsConfig levels;
};

struct Config {
    TaskManagerConfig tasks;
    TransferConfig transfer;
    BridgeConfig bridge;
    RemoteEventsConfig remote_events;
    DatabaseConfig database;
    PathsConfig paths;
    IgnoreConfig ignore;
    LoggingConfig logging;
};

Config loadConfig(const std::string& path);
std::string dumpConfig(const Config& cfg);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const TaskManagerConfig& c);
void from_json(const nlohmann::json& j, TaskManagerConfig& c);
void to_json(nlohmann::json& j, const TransferConfig& c);
void from_json(const nlohmann::json& j, TransferConfig& c);
void to_json(nlohmann::json& j, const BridgeConfig& c);
void from_json(const nlohmann::json& j, BridgeConfig& c);
void to_json(nlohmann::json& j, const RemoteEventsConfig& c);
void from_json(const nlohmann::json& j, RemoteEventsConfig& c);
void to_json(nlohmann::json& j, const DatabaseConfig& c);
void from_json(const nlohmann::json& j, DatabaseConfig& c);
void to_json(nlohmann::json& j, const PathsConfig& c);
void from_json(const nlohmann::json& j, PathsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);

} // namespace stratus::config
