#pragma once

#include "types/Drive.hpp"
#include "util/timestamp.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace stratus::types {

// One row per synchronized path. local_path is relative to the drive's sync root.
struct FileRecord {
    DriveId drive_id;
    std::filesystem::path local_path;
    std::string remote_id;
    bool is_folder = false;
    std::string etag;
    uintmax_t size = 0;
    std::string permissions;
    bool shared = false;
    util::Timestamp created_at{};
    util::Timestamp updated_at{};
    nlohmann::json metadata = nlohmann::json::object();
    nlohmann::json props = nlohmann::json::object();
};

void to_json(nlohmann::json& j, const FileRecord& r);
void from_json(const nlohmann::json& j, FileRecord& r);

}
