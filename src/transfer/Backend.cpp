#include "transfer/Backend.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace stratus::transfer;

RemoteObject Backend::copy(const fs::path& from, const fs::path& to) {
    const auto src = stat(from);
    if (!src) throw BackendError("copy source does not exist: " + from.string(), false);

    uintmax_t stride = preferredChunkSize(src->size == 0 ? 1 : src->size);
    if (const auto it = src->attributes.find(attr::CHUNK_SIZE); it != src->attributes.end())
        stride = std::stoull(it->second);

    auto attrs = src->attributes;
    attrs[attr::CHUNK_SIZE] = std::to_string(stride);

    auto session = openSession(to, src->size, attrs);
    try {
        uintmax_t offset = 0;
        do {
            const auto len = std::min(stride, src->size - offset);
            const auto bytes = readChunk(from, offset, len);
            session.acknowledged[offset] = writeChunk(session, offset, bytes);
            offset += len;
        } while (offset < src->size);

        return finalize(session);
    } catch (const std::exception& e) {
        log::Registry::storage()->warn("[Backend] Copy {} -> {} failed, aborting session: {}",
                                       from.string(), to.string(), e.what());
        abort(session);
        throw;
    }
}

RemoteObject Backend::move(const fs::path& from, const fs::path& to) {
    auto obj = copy(from, to);
    if (!remove(from))
        log::Registry::storage()->warn("[Backend] Move left source behind: {}", from.string());
    return obj;
}
