#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace stratus::config;

template<>
struct convert<TaskManagerConfig> {
    static Node encode(const TaskManagerConfig& rhs) {
        Node node;
        node["max_workers"] = rhs.max_workers;
        node["completed_buffer_size"] = rhs.completed_buffer_size;
        node["stop_grace_period_ms"] = rhs.stop_grace_period.count();
        return node;
    }

    static bool decode(const Node& node, TaskManagerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_workers = node["max_workers"].as<unsigned int>(4);
        rhs.completed_buffer_size = node["completed_buffer_size"].as<size_t>(100);
        rhs.stop_grace_period = std::chrono::milliseconds(node["stop_grace_period_ms"].as<long>(5000));
        return true;
    }
};

template<>
struct convert<TransferConfig> {
    static Node encode(const TransferConfig& rhs) {
        Node node;
        node["chunk_size"] = rhs.chunk_size;
        node["max_retries"] = rhs.max_retries;
        node["retry_base_delay_ms"] = rhs.retry_base_delay.count();
        node["retry_max_delay_ms"] = rhs.retry_max_delay.count();
        node["request_timeout_s"] = rhs.request_timeout.count();
        node["session_ttl_hours"] = rhs.session_ttl.count();
        node["progress_window_s"] = rhs.progress_window.count();
        node["session_sweep_interval_minutes"] = rhs.session_sweep_interval.count();
        return node;
    }

    static bool decode(const Node& node, TransferConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.chunk_size = node["chunk_size"].as<uintmax_t>(DEFAULT_CHUNK_SIZE);
        rhs.max_retries = node["max_retries"].as<unsigned int>(3);
        rhs.retry_base_delay = std::chrono::milliseconds(node["retry_base_delay_ms"].as<long>(1000));
        rhs.retry_max_delay = std::chrono::milliseconds(node["retry_max_delay_ms"].as<long>(30000));
        rhs.request_timeout = std::chrono::seconds(node["request_timeout_s"].as<long>(60));
        rhs.session_ttl = std::chrono::hours(node["session_ttl_hours"].as<long>(24));
        rhs.progress_window = std::chrono::seconds(node["progress_window_s"].as<long>(10));
        rhs.session_sweep_interval = std::chrono::minutes(node["session_sweep_interval_minutes"].as<long>(60));
        return true;
    }
};

template<>
struct convert<BridgeConfig> {
    static Node encode(const BridgeConfig& rhs) {
        Node node;
        node["callback_deadline_ms"] = rhs.callback_deadline.count();
        return node;
    }

    static bool decode(const Node& node, BridgeConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.callback_deadline = std::chrono::milliseconds(node["callback_deadline_ms"].as<long>(30000));
        return true;
    }
};

template<>
struct convert<RemoteEventsConfig> {
    static Node encode(const RemoteEventsConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["max_retries"] = rhs.max_retries;
        node["initial_backoff_ms"] = rhs.initial_backoff.count();
        node["max_backoff_ms"] = rhs.max_backoff.count();
        node["poll_interval_ms"] = rhs.poll_interval.count();
        return node;
    }

    static bool decode(const Node& node, RemoteEventsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(true);
        rhs.max_retries = node["max_retries"].as<unsigned int>(5);
        rhs.initial_backoff = std::chrono::milliseconds(node["initial_backoff_ms"].as<long>(1000));
        rhs.max_backoff = std::chrono::milliseconds(node["max_backoff_ms"].as<long>(32000));
        rhs.poll_interval = std::chrono::milliseconds(node["poll_interval_ms"].as<long>(5000));
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["backend"] = rhs.backend;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["pool_size"] = rhs.pool_size;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.backend = node["backend"].as<std::string>("memory");
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("stratus");
        rhs.user = node["user"].as<std::string>("stratus");
        rhs.password = node["password"].as<std::string>("");
        rhs.pool_size = node["pool_size"].as<unsigned int>(4);
        return true;
    }
};

template<>
struct convert<PathsConfig> {
    static Node encode(const PathsConfig& rhs) {
        Node node;
        node["drives_file"] = rhs.drives_file.string();
        node["staging_dir"] = rhs.staging_dir.string();
        return node;
    }

    static bool decode(const Node& node, PathsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.drives_file = node["drives_file"].as<std::string>("/var/lib/stratus/drives.json");
        rhs.staging_dir = node["staging_dir"].as<std::string>("/var/lib/stratus/staging");
        return true;
    }
};

template<>
struct convert<IgnoreConfig> {
    static Node encode(const IgnoreConfig& rhs) {
        Node node;
        node["patterns"] = rhs.patterns;
        return node;
    }

    static bool decode(const Node& node, IgnoreConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.patterns = node["patterns"].as<std::vector<std::string>>(std::vector<std::string>{});
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["stratus"]  = to_std_string(spdlog::level::to_string_view(rhs.stratus));
        node["drive"]    = to_std_string(spdlog::level::to_string_view(rhs.drive));
        node["mount"]    = to_std_string(spdlog::level::to_string_view(rhs.mount));
        node["bridge"]   = to_std_string(spdlog::level::to_string_view(rhs.bridge));
        node["tasks"]    = to_std_string(spdlog::level::to_string_view(rhs.tasks));
        node["transfer"] = to_std_string(spdlog::level::to_string_view(rhs.transfer));
        node["storage"]  = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["crypto"]   = to_std_string(spdlog::level::to_string_view(rhs.crypto));
        node["db"]       = to_std_string(spdlog::level::to_string_view(rhs.db));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.stratus = spdlog::level::from_str(node["stratus"].as<std::string>("info"));
        rhs.drive = spdlog::level::from_str(node["drive"].as<std::string>("info"));
        rhs.mount = spdlog::level::from_str(node["mount"].as<std::string>("info"));
        rhs.bridge = spdlog::level::from_str(node["bridge"].as<std::string>("warning"));
        rhs.tasks = spdlog::level::from_str(node["tasks"].as<std::string>("info"));
        rhs.transfer = spdlog::level::from_str(node["transfer"].as<std::string>("warning"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warning"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warning"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("error"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = convert<SubsystemLogLevelsConfig>::encode(rhs.subsystem_levels);
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warning"));
        if (const auto sub = node["subsystem_levels"])
            convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = convert<LogLevelsConfig>::encode(rhs.levels);
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/stratus");
        if (const auto levels = node["levels"]) convert<LogLevelsConfig>::decode(levels, rhs.levels);
        return true;
    }
};

}
