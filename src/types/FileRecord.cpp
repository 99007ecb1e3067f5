#include "types/FileRecord.hpp"

using namespace stratus::util;

namespace stratus::types {

void to_json(nlohmann::json& j, const FileRecord& r) {
    j = {
        {"drive_id", r.drive_id},
        {"local_path", r.local_path.string()},
        {"remote_id", r.remote_id},
        {"is_folder", r.is_folder},
        {"etag", r.etag},
        {"size", r.size},
        {"permissions", r.permissions},
        {"shared", r.shared},
        {"created_at", toMicros(r.created_at)},
        {"updated_at", toMicros(r.updated_at)},
        {"metadata", r.metadata},
        {"props", r.props}
    };
}

void from_json(const nlohmann::json& j, FileRecord& r) {
    r.drive_id = j.at("drive_id").get<std::string>();
    r.local_path = j.at("local_path").get<std::string>();
    r.remote_id = j.value("remote_id", "");
    r.is_folder = j.value("is_folder", false);
    r.etag = j.value("etag", "");
    r.size = j.value("size", static_cast<uintmax_t>(0));
    r.permissions = j.value("permissions", "");
    r.shared = j.value("shared", false);
    r.created_at = fromMicros(j.value("created_at", static_cast<int64_t>(0)));
    r.updated_at = fromMicros(j.value("updated_at", static_cast<int64_t>(0)));
    r.metadata = j.value("metadata", nlohmann::json::object());
    r.props = j.value("props", nlohmann::json::object());
}

}
