#pragma once

#include <ctime>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace stratus::types {

using DriveId = std::string;

enum class BackendType { Local, S3 };

std::string to_string(BackendType type);
BackendType backendTypeFromString(const std::string& str);

struct BackendConfig {
    BackendType type{BackendType::Local};
    std::filesystem::path root;         // Local
    std::string endpoint, bucket;       // S3
    std::string region = "us-east-1";
    std::string access_key, secret_key;
};

struct Credentials {
    std::string access_token;
    std::string refresh_token;
    std::time_t expires_at{0};          // 0 = never expires

    [[nodiscard]] bool isExpired(std::time_t now = std::time(nullptr)) const {
        return expires_at != 0 && expires_at <= now;
    }
};

struct DriveConfig {
    DriveId id;
    std::string name;
    BackendConfig backend;
    std::filesystem::path remote_path = "/";
    std::filesystem::path sync_path;
    Credentials credentials;
    std::filesystem::path encryption_key_path;
    std::vector<std::string> ignore_patterns;
    bool enabled = true;
    nlohmann::json extra = nlohmann::json::object();
};

// Ordered by severity, most severe last.
enum class DriveHealth { Active, Syncing, Paused, Error, CredentialExpired };

std::string to_string(DriveHealth health);

inline int severity(const DriveHealth h) { return static_cast<int>(h); }

inline DriveHealth mostSevere(const DriveHealth a, const DriveHealth b) {
    return severity(a) >= severity(b) ? a : b;
}

void to_json(nlohmann::json& j, const BackendConfig& b);
void from_json(const nlohmann::json& j, BackendConfig& b);
void to_json(nlohmann::json& j, const Credentials& c);
void from_json(const nlohmann::json& j, Credentials& c);
void to_json(nlohmann::json& j, const DriveConfig& d);
void from_json(const nlohmann::json& j, DriveConfig& d);

}
