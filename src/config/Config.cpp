#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace stratus::config {

Config loadConfig(const std::string& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path);

    if (auto node = root["tasks"]) YAML::convert<TaskManagerConfig>::decode(node, cfg.tasks);
    if (auto node = root["transfer"]) YAML::convert<TransferConfig>::decode(node, cfg.transfer);
    if (auto node = root["bridge"]) YAML::convert<BridgeConfig>::decode(node, cfg.bridge);
    if (auto node = root["remote_events"]) YAML::convert<RemoteEventsConfig>::decode(node, cfg.remote_events);
    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["paths"]) YAML::convert<PathsConfig>::decode(node, cfg.paths);
    if (auto node = root["ignore"]) YAML::convert<IgnoreConfig>::decode(node, cfg.ignore);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    if (cfg.database.password.empty())
        if (const char* pass = std::getenv("STRATUS_DB_PASSWORD")) cfg.database.password = pass;

    if (cfg.tasks.completed_buffer_size == 0)
        throw std::invalid_argument("tasks.completed_buffer_size must be greater than zero");
    if (cfg.transfer.chunk_size == 0)
        throw std::invalid_argument("transfer.chunk_size must be greater than zero");

    return cfg;
}

std::string dumpConfig(const Config& cfg) {
    nlohmann::json j = cfg;
    j["database"].erase("password");
    return j.dump(2);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"tasks", c.tasks},
        {"transfer", c.transfer},
        {"bridge", c.bridge},
        {"remote_events", c.remote_events},
        {"database", c.database},
        {"paths", c.paths},
        {"ignore", c.ignore.patterns},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    j.at("tasks").get_to(c.tasks);
    j.at("transfer").get_to(c.transfer);
    j.at("bridge").get_to(c.bridge);
    j.at("remote_events").get_to(c.remote_events);
    j.at("database").get_to(c.database);
    j.at("paths").get_to(c.paths);
    c.ignore.patterns = j.value("ignore", std::vector<std::string>{});
    j.at("logging").get_to(c.logging);
}

void to_json(nlohmann::json& j, const TaskManagerConfig& c) {
    j = {
        {"max_workers", c.max_workers},
        {"completed_buffer_size", c.completed_buffer_size},
        {"stop_grace_period_ms", c.stop_grace_period.count()}
    };
}

void from_json(const nlohmann::json& j, TaskManagerConfig& c) {
    c.max_workers = j.value("max_workers", 4u);
    c.completed_buffer_size = j.value("completed_buffer_size", static_cast<size_t>(100));
    c.stop_grace_period = std::chrono::milliseconds(j.value("stop_grace_period_ms", 5000));
}

void to_json(nlohmann::json& j, const TransferConfig& c) {
    j = {
        {"chunk_size", c.chunk_size},
        {"max_retries", c.max_retries},
        {"retry_base_delay_ms", c.retry_base_delay.count()},
        {"retry_max_delay_ms", c.retry_max_delay.count()},
        {"request_timeout_s", c.request_timeout.count()},
        {"session_ttl_hours", c.session_ttl.count()},
        {"progress_window_s", c.progress_window.count()},
        {"session_sweep_interval_minutes", c.session_sweep_interval.count()}
    };
}

void from_json(const nlohmann::json& j, TransferConfig& c) {
    c.chunk_size = j.value("chunk_size", DEFAULT_CHUNK_SIZE);
    c.max_retries = j.value("max_retries", 3u);
    c.retry_base_delay = std::chrono::milliseconds(j.value("retry_base_delay_ms", 1000));
    c.retry_max_delay = std::chrono::milliseconds(j.value("retry_max_delay_ms", 30000));
    c.request_timeout = std::chrono::seconds(j.value("request_timeout_s", 60));
    c.session_ttl = std::chrono::hours(j.value("session_ttl_hours", 24));
    c.progress_window = std::chrono::seconds(j.value("progress_window_s", 10));
    c.session_sweep_interval = std::chrono::minutes(j.value("session_sweep_interval_minutes", 60));
}

void to_json(nlohmann::json& j, const BridgeConfig& c) {
    j = {{"callback_deadline_ms", c.callback_deadline.count()}};
}

void from_json(const nlohmann::json& j, BridgeConfig& c) {
    c.callback_deadline = std::chrono::milliseconds(j.value("callback_deadline_ms", 30000));
}

void to_json(nlohmann::json& j, const RemoteEventsConfig& c) {
    j = {
        {"enabled", c.enabled},
        {"max_retries", c.max_retries},
        {"initial_backoff_ms", c.initial_backoff.count()},
        {"max_backoff_ms", c.max_backoff.count()},
        {"poll_interval_ms", c.poll_interval.count()}
    };
}

void from_json(const nlohmann::json& j, RemoteEventsConfig& c) {
    c.enabled = j.value("enabled", true);
    c.max_retries = j.value("max_retries", 5u);
    c.initial_backoff = std::chrono::milliseconds(j.value("initial_backoff_ms", 1000));
    c.max_backoff = std::chrono::milliseconds(j.value("max_backoff_ms", 32000));
    c.poll_interval = std::chrono::milliseconds(j.value("poll_interval_ms", 5000));
}

void to_json(nlohmann::json& j, const DatabaseConfig& c) {
    j = {
        {"backend", c.backend},
        {"host", c.host},
        {"port", c.port},
        {"name", c.name},
        {"user", c.user},
        {"password", c.password},
        {"pool_size", c.pool_size}
    };
}

void from_json(const nlohmann::json& j, DatabaseConfig& c) {
    c.backend = j.value("backend", "memory");
    c.host = j.value("host", "localhost");
    c.port = j.value("port", static_cast<uint16_t>(5432));
    c.name = j.value("name", "stratus");
    c.user = j.value("user", "stratus");
    c.password = j.value("password", "");
    c.pool_size = j.value("pool_size", 4u);
}

void to_json(nlohmann::json& j, const PathsConfig& c) {
    j = {
        {"drives_file", c.drives_file.string()},
        {"staging_dir", c.staging_dir.string()}
    };
}

void from_json(const nlohmann::json& j, PathsConfig& c) {
    c.drives_file = j.value("drives_file", "/var/lib/stratus/drives.json");
    c.staging_dir = j.value("staging_dir", "/var/lib/stratus/staging");
}

static std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"stratus", levelName(c.stratus)},
        {"drive", levelName(c.drive)},
        {"mount", levelName(c.mount)},
        {"bridge", levelName(c.bridge)},
        {"tasks", levelName(c.tasks)},
        {"transfer", levelName(c.transfer)},
        {"storage", levelName(c.storage)},
        {"crypto", levelName(c.crypto)},
        {"db", levelName(c.db)}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.stratus = spdlog::level::from_str(j.value("stratus", "info"));
    c.drive = spdlog::level::from_str(j.value("drive", "info"));
    c.mount = spdlog::level::from_str(j.value("mount", "info"));
    c.bridge = spdlog::level::from_str(j.value("bridge", "warning"));
    c.tasks = spdlog::level::from_str(j.value("tasks", "info"));
    c.transfer = spdlog::level::from_str(j.value("transfer", "warning"));
    c.storage = spdlog::level::from_str(j.value("storage", "warning"));
    c.crypto = spdlog::level::from_str(j.value("crypto", "warning"));
    c.db = spdlog::level::from_str(j.value("db", "error"));
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = spdlog::level::from_str(j.value("console_log_level", "info"));
    c.file_log_level = spdlog::level::from_str(j.value("file_log_level", "warning"));
    if (j.contains("subsystem_levels")) j.at("subsystem_levels").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    c.log_dir = j.value("log_dir", "/var/log/stratus");
    if (j.contains("levels")) j.at("levels").get_to(c.levels);
}

} // namespace stratus::config
