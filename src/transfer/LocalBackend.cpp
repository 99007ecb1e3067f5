#include "transfer/LocalBackend.hpp"
#include "crypto/Hash.hpp"
#include "crypto/util/uuid.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace stratus::transfer;
using namespace stratus::crypto;

namespace {

constexpr auto MANIFEST = "manifest.json";
constexpr auto PART_PREFIX = "part-";

void writeFileAtomically(const fs::path& target, const std::vector<uint8_t>& data) {
    const auto tmp = fs::path(target).concat(".tmp");
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to open for writing: " + tmp.string());
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!out) throw std::runtime_error("Failed to write: " + tmp.string());
    }
    fs::rename(tmp, target);
}

void writeJson(const fs::path& target, const nlohmann::json& j) {
    const auto text = j.dump(2);
    writeFileAtomically(target, {text.begin(), text.end()});
}

nlohmann::json readJson(const fs::path& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Failed to open: " + path.string());
    return nlohmann::json::parse(in);
}

}

LocalBackend::LocalBackend(fs::path root) : root_(std::move(root)) {
    if (root_.empty()) throw std::invalid_argument("LocalBackend requires a root directory");
    fs::create_directories(root_ / INTERNAL_DIR / "uploads");
    fs::create_directories(root_ / INTERNAL_DIR / "meta");
}

fs::path LocalBackend::normalize(const fs::path& remotePath) {
    const auto rel = remotePath.lexically_normal().relative_path();
    if (rel.empty() || *rel.begin() == ".." || *rel.begin() == INTERNAL_DIR)
        throw std::invalid_argument("Invalid remote path: " + remotePath.string());
    return rel;
}

fs::path LocalBackend::objectPath(const fs::path& remotePath) const { return root_ / normalize(remotePath); }

fs::path LocalBackend::sidecarPath(const fs::path& remotePath) const {
    return (root_ / INTERNAL_DIR / "meta" / normalize(remotePath)).concat(".json");
}

fs::path LocalBackend::sessionDir(const std::string& token) const {
    if (token.empty() || token.find('/') != std::string::npos || token.find("..") != std::string::npos)
        throw BackendError("Malformed session token: " + token, false);
    return root_ / INTERNAL_DIR / "uploads" / token;
}

SessionHandle LocalBackend::openSession(const fs::path& remotePath, const uintmax_t totalSize, const Attributes& attributes) {
    SessionHandle handle;
    handle.token = util::uuid4_hex();
    handle.remote_path = fs::path("/") / normalize(remotePath);
    handle.total_size = totalSize;
    handle.attributes = attributes;
    if (const auto it = attributes.find(attr::CHUNK_SIZE); it != attributes.end())
        handle.chunk_size = std::stoull(it->second);

    const auto dir = sessionDir(handle.token);
    fs::create_directories(dir);
    writeJson(dir / MANIFEST, {
        {"remote_path", handle.remote_path.string()},
        {"total_size", totalSize},
        {"chunk_size", handle.chunk_size},
        {"attributes", attributes}
    });

    log::Registry::storage()->debug("[LocalBackend] Opened session {} for {}", handle.token, handle.remote_path.string());
    return handle;
}

std::string LocalBackend::writeChunk(SessionHandle& session, const uintmax_t offset, const std::vector<uint8_t>& data) {
    const auto dir = sessionDir(session.token);
    if (!fs::exists(dir / MANIFEST)) throw BackendError("Unknown upload session: " + session.token, false);
    if (offset + data.size() > session.total_size)
        throw BackendError("Chunk exceeds declared object size", false);

    writeFileAtomically(dir / (PART_PREFIX + std::to_string(offset)), data);

    auto tag = Hash::blake2b(data);
    session.acknowledged[offset] = tag;
    return tag;
}

RemoteObject LocalBackend::finalize(SessionHandle& session) {
    const auto dir = sessionDir(session.token);
    if (!fs::exists(dir / MANIFEST)) throw BackendError("Unknown upload session: " + session.token, false);

    std::map<uintmax_t, fs::path> parts;
    for (const auto& entry : fs::directory_iterator(dir)) {
        const auto name = entry.path().filename().string();
        if (name.starts_with(PART_PREFIX) && !name.ends_with(".tmp"))
            parts.emplace(std::stoull(name.substr(std::string(PART_PREFIX).size())), entry.path());
    }

    const auto target = objectPath(session.remote_path);
    fs::create_directories(target.parent_path());
    const auto assembling = fs::path(target).concat(".assembling");

    {
        std::ofstream out(assembling, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to open for writing: " + assembling.string());

        uintmax_t expected = 0;
        for (const auto& [offset, part] : parts) {
            if (offset != expected) {
                out.close();
                fs::remove(assembling);
                throw BackendError(fmt::format("Missing bytes at offset {} in session {}", expected, session.token), false);
            }
            std::ifstream in(part, std::ios::binary);
            out << in.rdbuf();
            expected += fs::file_size(part);
        }

        if (expected != session.total_size) {
            out.close();
            fs::remove(assembling);
            throw BackendError(fmt::format("Session {} holds {} of {} bytes", session.token, expected, session.total_size), false);
        }
    }

    fs::rename(assembling, target);
    writeSidecar(session.remote_path, session.attributes);
    fs::remove_all(dir);

    log::Registry::storage()->debug("[LocalBackend] Finalized {} ({} bytes)", session.remote_path.string(), session.total_size);
    return describe(session.remote_path);
}

std::optional<SessionHandle> LocalBackend::resume(const std::string& token) {
    const auto dir = sessionDir(token);
    if (!fs::exists(dir / MANIFEST)) return std::nullopt;

    const auto manifest = readJson(dir / MANIFEST);

    SessionHandle handle;
    handle.token = token;
    handle.remote_path = manifest.at("remote_path").get<std::string>();
    handle.total_size = manifest.at("total_size").get<uintmax_t>();
    handle.chunk_size = manifest.value("chunk_size", static_cast<uintmax_t>(0));
    handle.attributes = manifest.value("attributes", Attributes{});

    for (const auto& entry : fs::directory_iterator(dir)) {
        const auto name = entry.path().filename().string();
        if (!name.starts_with(PART_PREFIX) || name.ends_with(".tmp")) continue;

        std::ifstream in(entry.path(), std::ios::binary);
        const std::vector<uint8_t> bytes{std::istreambuf_iterator(in), std::istreambuf_iterator<char>()};
        handle.acknowledged[std::stoull(name.substr(std::string(PART_PREFIX).size()))] = Hash::blake2b(bytes);
    }

    return handle;
}

void LocalBackend::abort(const SessionHandle& session) {
    std::error_code ec;
    fs::remove_all(sessionDir(session.token), ec);
    if (ec) log::Registry::storage()->warn("[LocalBackend] Failed to discard session {}: {}", session.token, ec.message());
}

std::vector<uint8_t> LocalBackend::readChunk(const fs::path& remotePath, const uintmax_t offset, const uintmax_t length) {
    const auto path = objectPath(remotePath);
    std::ifstream in(path, std::ios::binary);
    if (!in) throw BackendError("No such object: " + remotePath.string(), false);

    const auto size = fs::file_size(path);
    if (offset > size) throw BackendError("Read past end of " + remotePath.string(), false);

    std::vector<uint8_t> out(std::min(length, size - offset));
    in.seekg(static_cast<std::streamoff>(offset));
    in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
    if (static_cast<size_t>(in.gcount()) != out.size())
        throw BackendError("Short read from " + remotePath.string(), true);
    return out;
}

std::optional<RemoteObject> LocalBackend::stat(const fs::path& remotePath) {
    if (!fs::is_regular_file(objectPath(remotePath))) return std::nullopt;
    return describe(remotePath);
}

bool LocalBackend::remove(const fs::path& remotePath) {
    std::error_code ec;
    const bool removed = fs::remove(objectPath(remotePath), ec);
    fs::remove(sidecarPath(remotePath), ec);
    return removed;
}

std::vector<RemoteObject> LocalBackend::list(const fs::path& prefix) {
    std::vector<RemoteObject> out;
    const auto base = prefix.empty() || prefix == "/" ? root_ : objectPath(prefix);
    if (!fs::is_directory(base)) return out;

    for (auto it = fs::recursive_directory_iterator(base); it != fs::recursive_directory_iterator(); ++it) {
        if (it->is_directory() && it->path().filename() == INTERNAL_DIR) {
            it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file()) continue;
        out.push_back(describe(fs::path("/") / fs::relative(it->path(), root_)));
    }
    return out;
}

RemoteObject LocalBackend::copy(const fs::path& from, const fs::path& to) {
    const auto src = objectPath(from);
    if (!fs::is_regular_file(src)) throw BackendError("copy source does not exist: " + from.string(), false);

    const auto dst = objectPath(to);
    fs::create_directories(dst.parent_path());
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing);

    const auto srcObj = describe(from);
    writeSidecar(to, srcObj.attributes);
    return describe(to);
}

RemoteObject LocalBackend::move(const fs::path& from, const fs::path& to) {
    const auto src = objectPath(from);
    if (!fs::is_regular_file(src)) throw BackendError("move source does not exist: " + from.string(), false);

    const auto srcObj = describe(from);
    const auto dst = objectPath(to);
    fs::create_directories(dst.parent_path());
    fs::rename(src, dst);

    std::error_code ec;
    fs::remove(sidecarPath(from), ec);
    writeSidecar(to, srcObj.attributes);
    return describe(to);
}

void LocalBackend::writeSidecar(const fs::path& remotePath, const Attributes& attributes) {
    std::scoped_lock lock(sidecarMutex_);
    const auto path = sidecarPath(remotePath);
    fs::create_directories(path.parent_path());
    writeJson(path, {{"attributes", attributes}});
}

RemoteObject LocalBackend::describe(const fs::path& remotePath) {
    RemoteObject obj;
    const auto rel = normalize(remotePath);
    obj.path = fs::path("/") / rel;
    obj.remote_id = rel.generic_string();
    obj.size = fs::file_size(root_ / rel);
    obj.etag = Hash::blake2b(root_ / rel);

    // Objects placed in the directory by hand have no sidecar.
    const auto sidecar = sidecarPath(remotePath);
    if (fs::exists(sidecar)) {
        std::scoped_lock lock(sidecarMutex_);
        obj.attributes = readJson(sidecar).value("attributes", Attributes{});
    }
    return obj;
}
