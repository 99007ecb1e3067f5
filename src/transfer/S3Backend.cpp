#include "transfer/S3Backend.hpp"
#include "util/curlWrappers.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cstring>
#include <regex>
#include <sstream>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace stratus::transfer;
using namespace stratus::util;

namespace {

constexpr auto META_PREFIX = "x-amz-meta-";
constexpr auto UNSIGNED_PAYLOAD = "UNSIGNED-PAYLOAD";

std::string stripQuotes(std::string s) {
    s.erase(std::remove(s.begin(), s.end(), '"'), s.end());
    return s;
}

struct ReadCursor {
    const std::vector<uint8_t>* data;
    size_t pos = 0;
};

size_t readFromVector(char* out, const size_t size, const size_t nmemb, void* userdata) {
    auto* cur = static_cast<ReadCursor*>(userdata);
    const size_t toCopy = std::min(size * nmemb, cur->data->size() - cur->pos);
    std::memcpy(out, cur->data->data() + cur->pos, toCopy);
    cur->pos += toCopy;
    return toCopy;
}

size_t appendToVector(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::vector<uint8_t>*>(userdata);
    out->insert(out->end(), ptr, ptr + size * nmemb);
    return size * nmemb;
}

}

S3Backend::S3Backend(S3Credentials creds, std::string bucket, fs::path prefix, const std::chrono::seconds requestTimeout)
    : creds_(std::move(creds)), bucket_(std::move(bucket)), prefix_(std::move(prefix)), requestTimeout_(requestTimeout) {
    if (creds_.endpoint.empty()) throw std::invalid_argument("S3Backend requires an endpoint");
    if (bucket_.empty()) throw std::invalid_argument("S3Backend requires a bucket");
    while (creds_.endpoint.ends_with('/')) creds_.endpoint.pop_back();
    ensureCurlGlobalInit();
}

S3Backend::~S3Backend() = default;

uintmax_t S3Backend::preferredChunkSize(const uintmax_t requested) const { return std::max(requested, MIN_PART_SIZE); }

fs::path S3Backend::keyFor(const fs::path& remotePath) const {
    const auto rel = remotePath.lexically_normal().relative_path();
    if (rel.empty()) throw std::invalid_argument("Invalid remote path: " + remotePath.string());
    return prefix_.empty() ? rel : prefix_.relative_path() / rel;
}

std::map<std::string, std::string> S3Backend::buildHeaderMap(const std::string& payloadHash, const Attributes& metadata) const {
    std::map<std::string, std::string> hdrs{
        {"host", creds_.endpoint.substr(creds_.endpoint.find("//") + 2)},
        {"x-amz-content-sha256", payloadHash},
        {"x-amz-date", getCurrentTimestamp()}
    };
    for (const auto& [k, v] : metadata) hdrs.emplace(k, v);
    return hdrs;
}

std::pair<std::string, std::string> S3Backend::constructPaths(CURL* curl, const fs::path& key, const std::string& query) const {
    const auto escapedKey = escapeKeyPreserveSlashes(curl, key);
    const auto canonicalPath = "/" + bucket_ + "/" + escapedKey;
    const auto url = creds_.endpoint + canonicalPath + query;
    return {canonicalPath + query, url};
}

void S3Backend::makeSigHeaders(HeaderList& out, const std::string& method, const std::string& canonical,
                               const std::string& payloadHash, const Attributes& metadata) const {
    const auto base = buildHeaderMap(payloadHash, metadata);
    out.add("Authorization: " + buildAuthorizationHeader(creds_, method, canonical, base, payloadHash));
    for (const auto& [k, v] : base) out.add(k + ": " + v);
}

void S3Backend::fail(const std::string& op, const HttpResponse& resp) {
    log::Registry::storage()->error("[S3Backend] {} failed: CURL={} HTTP={} Response:\n{}", op, static_cast<int>(resp.curl),
                                    resp.http, resp.body);
    throw BackendError(fmt::format("S3 {} failed (HTTP {}, curl {})", op, resp.http, static_cast<int>(resp.curl)),
                       resp.transient());
}

uint32_t S3Backend::partNumberFor(const SessionHandle& session, const uintmax_t offset) {
    if (session.chunk_size == 0) throw BackendError("S3 session has no chunk size", false);
    if (offset % session.chunk_size != 0) throw BackendError("S3 chunk offset is not aligned to the part size", false);
    return static_cast<uint32_t>(offset / session.chunk_size) + 1;
}

std::string S3Backend::encodeToken(const fs::path& key, const std::string& uploadId, const SessionHandle& session) {
    return nlohmann::json{
        {"key", key.generic_string()},
        {"upload_id", uploadId},
        {"remote_path", session.remote_path.generic_string()},
        {"total_size", session.total_size},
        {"chunk_size", session.chunk_size},
        {"attributes", session.attributes}
    }.dump();
}

SessionHandle S3Backend::openSession(const fs::path& remotePath, const uintmax_t totalSize, const Attributes& attributes) {
    SessionHandle session;
    session.remote_path = remotePath;
    session.total_size = totalSize;
    session.attributes = attributes;
    if (const auto it = attributes.find(attr::CHUNK_SIZE); it != attributes.end()) session.chunk_size = std::stoull(it->second);
    if (session.chunk_size == 0) throw std::invalid_argument("S3 sessions require a chunk-size attribute");

    Attributes metaHeaders;
    for (const auto& [k, v] : attributes) metaHeaders[META_PREFIX + k] = v;

    const auto key = keyFor(remotePath);
    const CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, key, "?uploads");

    HeaderList hdrs;
    makeSigHeaders(hdrs, "POST", canonical, UNSIGNED_PAYLOAD, metaHeaders);

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.list);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(0));
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(requestTimeout_.count()));
    });

    if (!resp.ok()) fail("initiateMultipartUpload", resp);

    std::smatch m;
    static const std::regex re(R"(<UploadId>([^<]+)</UploadId>)");
    if (!std::regex_search(resp.body, m, re)) {
        log::Registry::storage()->error("[S3Backend] Unable to parse UploadId from response: {}", resp.body);
        throw BackendError("S3 initiateMultipartUpload returned no UploadId", false);
    }

    session.token = encodeToken(key, m[1].str(), session);
    return session;
}

std::string S3Backend::writeChunk(SessionHandle& session, const uintmax_t offset, const std::vector<uint8_t>& data) {
    const auto token = nlohmann::json::parse(session.token);
    const fs::path key = token.at("key").get<std::string>();
    const auto uploadId = token.at("upload_id").get<std::string>();
    const auto partNumber = partNumberFor(session, offset);

    const CurlEasy tmpHandle;
    const auto query = "?partNumber=" + std::to_string(partNumber) + "&uploadId=" + uploadId;
    const auto [canonical, url] = constructPaths(tmpHandle, key, query);

    HeaderList hdrs;
    hdrs.add("Content-Type: application/octet-stream");
    makeSigHeaders(hdrs, "PUT", canonical, sha256Hex({data.begin(), data.end()}));

    ReadCursor cursor{&data};
    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.list);
        curl_easy_setopt(h, CURLOPT_READFUNCTION, readFromVector);
        curl_easy_setopt(h, CURLOPT_READDATA, &cursor);
        curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(data.size()));
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(requestTimeout_.count()));
    });

    if (!resp.ok()) fail(fmt::format("uploadPart {}", partNumber), resp);

    std::string etag;
    if (!extractETag(resp.hdr, etag)) throw BackendError("S3 uploadPart response carried no ETag", true);

    session.acknowledged[offset] = etag;
    return etag;
}

RemoteObject S3Backend::finalize(SessionHandle& session) {
    const auto token = nlohmann::json::parse(session.token);
    const fs::path key = token.at("key").get<std::string>();
    const auto uploadId = token.at("upload_id").get<std::string>();

    std::map<int, std::string> etags;
    for (const auto& [offset, tag] : session.acknowledged) etags[static_cast<int>(partNumberFor(session, offset))] = tag;
    if (etags.empty()) throw BackendError("S3 finalize called with no acknowledged parts", false);

    const CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, key, "?uploadId=" + uploadId);

    const auto body = composeMultiPartUploadXMLBody(etags);
    HeaderList hdrs;
    hdrs.add("Content-Type: application/xml");
    makeSigHeaders(hdrs, "POST", canonical, sha256Hex(body));

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "POST");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.list);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(requestTimeout_.count()));
    });

    // CompleteMultipartUpload can report an error inside a 200 body.
    if (!resp.ok() || resp.body.find("<Error>") != std::string::npos) fail("completeMultipartUpload", resp);

    auto obj = stat(session.remote_path);
    if (!obj) throw BackendError("S3 object missing after completeMultipartUpload", true);
    return *obj;
}

std::optional<SessionHandle> S3Backend::resume(const std::string& tokenStr) {
    const auto token = nlohmann::json::parse(tokenStr);
    const fs::path key = token.at("key").get<std::string>();
    const auto uploadId = token.at("upload_id").get<std::string>();

    SessionHandle session;
    session.token = tokenStr;
    session.remote_path = token.at("remote_path").get<std::string>();
    session.total_size = token.at("total_size").get<uintmax_t>();
    session.chunk_size = token.at("chunk_size").get<uintmax_t>();
    session.attributes = token.value("attributes", Attributes{});

    std::string marker;
    bool truncated = true;
    while (truncated) {
        const CurlEasy tmpHandle;
        std::string query = "?";
        if (!marker.empty()) query += "part-number-marker=" + marker + "&";
        query += "uploadId=" + uploadId;
        const auto [canonical, url] = constructPaths(tmpHandle, key, query);

        HeaderList hdrs;
        makeSigHeaders(hdrs, "GET", canonical, UNSIGNED_PAYLOAD);

        const auto resp = performCurl([&](CURL* h) {
            curl_easy_setopt(h, CURLOPT_URL, url.c_str());
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.list);
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
            curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(requestTimeout_.count()));
        });

        if (resp.http == 404) return std::nullopt;  // NoSuchUpload
        if (!resp.ok()) fail("listParts", resp);

        const auto page = parseListPartsResult(resp.body);
        if (!page) {
            log::Registry::storage()->error("[S3Backend] Unable to parse ListParts response: {}", resp.body);
            throw BackendError("S3 listParts returned an unreadable body", true);
        }
        for (const auto& [partNumber, etag] : page->etags)
            session.acknowledged[(static_cast<uintmax_t>(partNumber) - 1) * session.chunk_size] = etag;

        marker = page->next_marker;
        truncated = !marker.empty();
    }

    return session;
}

void S3Backend::abort(const SessionHandle& session) {
    const auto token = nlohmann::json::parse(session.token);
    const fs::path key = token.at("key").get<std::string>();

    const CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, key, "?uploadId=" + token.at("upload_id").get<std::string>());

    HeaderList hdrs;
    makeSigHeaders(hdrs, "DELETE", canonical, sha256Hex(""));

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.list);
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(requestTimeout_.count()));
    });

    if (!resp.ok() && resp.http != 404)
        log::Registry::storage()->warn("[S3Backend] abortMultipartUpload for {} failed: CURL={} HTTP={}",
                                       key.string(), static_cast<int>(resp.curl), resp.http);
}

std::vector<uint8_t> S3Backend::readChunk(const fs::path& remotePath, const uintmax_t offset, const uintmax_t length) {
    std::vector<uint8_t> out;
    if (length == 0) return out;

    const CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, keyFor(remotePath));

    HeaderList hdrs;
    hdrs.add(fmt::format("Range: bytes={}-{}", offset, offset + length - 1));
    makeSigHeaders(hdrs, "GET", canonical, UNSIGNED_PAYLOAD);

    out.reserve(length);
    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.list);
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, appendToVector);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &out);
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(requestTimeout_.count()));
    });

    if (!resp.ok()) fail("ranged GET " + remotePath.string(), resp);
    return out;
}

std::optional<RemoteObject> S3Backend::stat(const fs::path& remotePath) {
    const auto key = keyFor(remotePath);
    const CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, key);

    HeaderList hdrs;
    makeSigHeaders(hdrs, "HEAD", canonical, UNSIGNED_PAYLOAD);

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.list);
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(requestTimeout_.count()));
    });

    if (resp.http == 404) return std::nullopt;
    if (!resp.ok()) fail("HEAD " + remotePath.string(), resp);

    const auto headers = parseResponseHeaders(resp.hdr);

    RemoteObject obj;
    obj.path = remotePath;
    obj.remote_id = key.generic_string();
    if (const auto it = headers.find("etag"); it != headers.end()) obj.etag = stripQuotes(it->second);
    if (const auto it = headers.find("content-length"); it != headers.end()) obj.size = std::stoull(it->second);

    const std::string metaPrefix = META_PREFIX;
    for (const auto& [k, v] : headers)
        if (k.starts_with(metaPrefix)) obj.attributes[k.substr(metaPrefix.size())] = v;

    return obj;
}

bool S3Backend::remove(const fs::path& remotePath) {
    const CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, keyFor(remotePath));

    HeaderList hdrs;
    makeSigHeaders(hdrs, "DELETE", canonical, sha256Hex(""));

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.list);
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(requestTimeout_.count()));
    });

    if (resp.http == 404) return false;
    if (!resp.ok()) fail("deleteObject " + remotePath.string(), resp);
    return true;
}

std::vector<RemoteObject> S3Backend::list(const fs::path& prefix) {
    std::vector<RemoteObject> out;
    std::string continuationToken;
    bool moreResults = true;

    const auto fullPrefix = prefix.empty() || prefix == "/" ? prefix_.relative_path() : keyFor(prefix);
    const auto strip = prefix_.relative_path().generic_string();

    while (moreResults) {
        const CurlEasy curl;

        std::ostringstream query;
        query << "?";
        if (!continuationToken.empty()) {
            char* escapedToken = curl_easy_escape(curl, continuationToken.c_str(), static_cast<int>(continuationToken.size()));
            if (!escapedToken) throw std::runtime_error("curl_easy_escape failed");
            query << "continuation-token=" << escapedToken << "&";
            curl_free(escapedToken);
        }
        query << "list-type=2";
        if (!fullPrefix.empty()) {
            const auto value = fullPrefix.generic_string() + "/";
            char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
            if (!escaped) throw std::runtime_error("curl_easy_escape failed");
            query << "&prefix=" << escaped;
            curl_free(escaped);
        }

        const auto canonical = "/" + bucket_ + query.str();
        const auto url = creds_.endpoint + canonical;

        HeaderList hdrs;
        makeSigHeaders(hdrs, "GET", canonical, UNSIGNED_PAYLOAD);

        const auto resp = performCurl([&](CURL* h) {
            curl_easy_setopt(h, CURLOPT_URL, url.c_str());
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.list);
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
            curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(requestTimeout_.count()));
        });

        if (!resp.ok()) fail("listObjects", resp);

        const auto page = parseListBucketResult(resp.body);
        if (!page) {
            log::Registry::storage()->error("[S3Backend] Unable to parse ListBucketResult: {}", resp.body);
            throw BackendError("S3 listObjects returned an unreadable body", true);
        }
        for (auto entry : page->entries) {
            RemoteObject obj;
            obj.remote_id = entry.key;
            if (!strip.empty() && entry.key.starts_with(strip)) entry.key = entry.key.substr(strip.size());
            obj.path = fs::path("/") / fs::path(entry.key).relative_path();
            obj.etag = std::move(entry.etag);
            obj.size = entry.size;
            out.push_back(std::move(obj));
        }

        continuationToken = page->continuation_token;
        moreResults = !continuationToken.empty();
    }

    return out;
}

RemoteObject S3Backend::copy(const fs::path& from, const fs::path& to) {
    const CurlEasy curl;
    const auto [canonical, url] = constructPaths(curl, keyFor(to));

    std::ostringstream source;
    source << "/" << bucket_ << "/" << escapeKeyPreserveSlashes(curl, keyFor(from));

    HeaderList hdrs;
    makeSigHeaders(hdrs, "PUT", canonical, UNSIGNED_PAYLOAD,
                   {{"x-amz-copy-source", source.str()}, {"x-amz-metadata-directive", "COPY"}});

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.list);
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(requestTimeout_.count()));
    });

    if (!resp.ok() || resp.body.find("<Error>") != std::string::npos) fail("copyObject", resp);

    auto obj = stat(to);
    if (!obj) throw BackendError("S3 object missing after copy", true);
    return *obj;
}
