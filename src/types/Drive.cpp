#include "types/Drive.hpp"

#include <stdexcept>

namespace stratus::types {

std::string to_string(const BackendType type) {
    switch (type) {
        case BackendType::Local: return "local";
        case BackendType::S3: return "s3";
    }
    return "unknown";
}

BackendType backendTypeFromString(const std::string& str) {
    if (str == "local") return BackendType::Local;
    if (str == "s3") return BackendType::S3;
    throw std::invalid_argument("Unknown backend type: " + str);
}

std::string to_string(const DriveHealth health) {
    switch (health) {
        case DriveHealth::Active: return "active";
        case DriveHealth::Syncing: return "syncing";
        case DriveHealth::Paused: return "paused";
        case DriveHealth::Error: return "error";
        case DriveHealth::CredentialExpired: return "credential_expired";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const BackendConfig& b) {
    j = {
        {"type", to_string(b.type)},
        {"root", b.root.string()},
        {"endpoint", b.endpoint},
        {"bucket", b.bucket},
        {"region", b.region},
        {"access_key", b.access_key},
        {"secret_key", b.secret_key}
    };
}

void from_json(const nlohmann::json& j, BackendConfig& b) {
    b.type = backendTypeFromString(j.value("type", "local"));
    b.root = j.value("root", "");
    b.endpoint = j.value("endpoint", "");
    b.bucket = j.value("bucket", "");
    b.region = j.value("region", "us-east-1");
    b.access_key = j.value("access_key", "");
    b.secret_key = j.value("secret_key", "");
}

void to_json(nlohmann::json& j, const Credentials& c) {
    j = {
        {"access_token", c.access_token},
        {"refresh_token", c.refresh_token},
        {"expires_at", c.expires_at}
    };
}

void from_json(const nlohmann::json& j, Credentials& c) {
    c.access_token = j.value("access_token", "");
    c.refresh_token = j.value("refresh_token", "");
    c.expires_at = j.value("expires_at", static_cast<std::time_t>(0));
}

void to_json(nlohmann::json& j, const DriveConfig& d) {
    j = {
        {"id", d.id},
        {"name", d.name},
        {"backend", d.backend},
        {"remote_path", d.remote_path.string()},
        {"sync_path", d.sync_path.string()},
        {"credentials", d.credentials},
        {"encryption_key_path", d.encryption_key_path.string()},
        {"ignore_patterns", d.ignore_patterns},
        {"enabled", d.enabled},
        {"extra", d.extra}
    };
}

void from_json(const nlohmann::json& j, DriveConfig& d) {
    d.id = j.at("id").get<std::string>();
    d.name = j.value("name", "");
    if (j.contains("backend")) j.at("backend").get_to(d.backend);
    d.remote_path = j.value("remote_path", "/");
    d.sync_path = j.at("sync_path").get<std::string>();
    if (j.contains("credentials")) j.at("credentials").get_to(d.credentials);
    d.encryption_key_path = j.value("encryption_key_path", "");
    d.ignore_patterns = j.value("ignore_patterns", std::vector<std::string>{});
    d.enabled = j.value("enabled", true);
    d.extra = j.value("extra", nlohmann::json::object());
}

}
