#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <curl/curl.h>

namespace stratus::util {

struct S3Credentials {
    std::string endpoint;               // https://host[:port]
    std::string region = "us-east-1";
    std::string access_key;
    std::string secret_key;
};

std::string sha256Hex(const std::string& data);
std::string hmacSha256Raw(const std::string& key, const std::string& data);
std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data);
std::string escapeKeyPreserveSlashes(CURL* curl, const std::filesystem::path& p);
std::string composeMultiPartUploadXMLBody(const std::map<int, std::string>& etags);
size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);
[[nodiscard]] bool extractETag(const std::string& respHdr, std::string& etagOut);
std::map<std::string, std::string> parseResponseHeaders(const std::string& rawHeaders);
std::string buildAuthorizationHeader(const S3Credentials& creds,
                                     const std::string& method, const std::string& fullPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash);
void trimInPlace(std::string& s);

struct S3ListEntry {
    std::string key;
    std::string etag;   // quotes stripped
    uintmax_t size = 0;
};

struct S3ListPage {
    std::vector<S3ListEntry> entries;
    std::string continuation_token;   // empty unless truncated
};

struct S3PartsPage {
    std::map<uint32_t, std::string> etags;   // part number -> etag
    std::string next_marker;                 // empty unless truncated
};

// ListObjectsV2 and ListParts response bodies. nullopt when the body is not the expected document.
std::optional<S3ListPage> parseListBucketResult(const std::string& xml);
std::optional<S3PartsPage> parseListPartsResult(const std::string& xml);

void ensureCurlGlobalInit();

/** Build a curl_slist from stable heap-stored strings */
struct HeaderList {
    std::vector<std::string> store; // owns the memory
    curl_slist* list = nullptr;

    HeaderList() = default;
    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;
    ~HeaderList() { if (list) curl_slist_free_all(list); }

    void add(const std::string& h) {
        store.push_back(h);
        list = curl_slist_append(list, store.back().c_str());
    }
};

}
