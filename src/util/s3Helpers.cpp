#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"

#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <pugixml.hpp>
#include <algorithm>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace stratus::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

static std::string hex(const unsigned char* bytes, const size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; ++i) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    return oss.str();
}

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return hex(hash, SHA256_DIGEST_LENGTH);
}

std::string hmacSha256Raw(const std::string& key, const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, nullptr);
    return {reinterpret_cast<char*>(digest), SHA256_DIGEST_LENGTH};
}

std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data) {
    unsigned char sig[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), rawKey.data(), static_cast<int>(rawKey.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), sig, nullptr);
    return hex(sig, SHA256_DIGEST_LENGTH);
}

std::string escapeKeyPreserveSlashes(CURL* curl, const std::filesystem::path& p) {
    std::ostringstream out;
    bool first = true;
    for (const auto& part : p.relative_path()) {
        if (!first) out << '/';
        first = false;

        const std::string seg = part.string();
        char* esc = curl_easy_escape(curl, seg.c_str(), static_cast<int>(seg.length()));
        if (!esc) throw std::runtime_error("escape failed");
        out << esc;
        curl_free(esc);
    }
    return out.str();
}

std::string composeMultiPartUploadXMLBody(const std::map<int, std::string>& etags) {
    std::ostringstream xml;
    xml << "<CompleteMultipartUpload>";
    for (const auto& [partNumber, etag] : etags)
        xml << "<Part><PartNumber>" << partNumber << "</PartNumber><ETag>" << etag << "</ETag></Part>";
    xml << "</CompleteMultipartUpload>";
    return xml.str();
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

bool extractETag(const std::string& respHdr, std::string& etagOut) {
    const auto headers = parseResponseHeaders(respHdr);
    const auto it = headers.find("etag");
    if (it == headers.end()) return false;
    etagOut = it->second;
    return !etagOut.empty();
}

// Keys are lowercased; the last occurrence wins (redirects emit several header blocks).
std::map<std::string, std::string> parseResponseHeaders(const std::string& rawHeaders) {
    std::map<std::string, std::string> out;
    std::istringstream headerStream(rawHeaders);
    std::string line;
    while (std::getline(headerStream, line)) {
        const auto pos = line.find(':');
        if (pos == std::string::npos) continue;
        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);
        trimInPlace(key);
        trimInPlace(value);
        std::ranges::transform(key, key.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        out[key] = value;
    }
    return out;
}

std::string buildAuthorizationHeader(const S3Credentials& creds,
                                     const std::string& method,
                                     const std::string& fullPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash) {
    std::string canonicalPath, canonicalQuery;

    if (const auto qpos = fullPath.find('?'); qpos == std::string::npos) canonicalPath = fullPath;
    else {
        canonicalPath = fullPath.substr(0, qpos);
        canonicalQuery = fullPath.substr(qpos + 1);
        if (canonicalQuery.find('=') == std::string::npos) canonicalQuery += "=";  // ?uploads
    }

    const std::string service = "s3";
    const std::string algorithm = "AWS4-HMAC-SHA256";
    const std::string amzDate = headers.at("x-amz-date");
    const std::string dateStamp = amzDate.substr(0, 8);

    std::string canonicalHeaders, signedHeaders;
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        canonicalHeaders += it->first + ":" + it->second + "\n";
        signedHeaders += it->first;
        if (std::next(it) != headers.end()) signedHeaders += ";";
    }

    std::ostringstream canonicalRequest;
    canonicalRequest << method << "\n"
                     << canonicalPath << "\n"
                     << canonicalQuery << "\n"
                     << canonicalHeaders << "\n"
                     << signedHeaders << "\n"
                     << payloadHash;

    const std::string credentialScope = dateStamp + "/" + creds.region + "/" + service + "/aws4_request";
    std::ostringstream stringToSign;
    stringToSign << algorithm << "\n"
                 << amzDate << "\n"
                 << credentialScope << "\n"
                 << sha256Hex(canonicalRequest.str());

    const std::string kDate    = hmacSha256Raw("AWS4" + creds.secret_key, dateStamp);
    const std::string kRegion  = hmacSha256Raw(kDate, creds.region);
    const std::string kService = hmacSha256Raw(kRegion, service);
    const std::string kSigning = hmacSha256Raw(kService, "aws4_request");

    const std::string signature = hmacSha256HexFromRaw(kSigning, stringToSign.str());

    std::ostringstream authHeader;
    authHeader << algorithm << " "
               << "Credential=" << creds.access_key << "/" << credentialScope << ", "
               << "SignedHeaders=" << signedHeaders << ", "
               << "Signature=" << signature;
    return authHeader.str();
}

void trimInPlace(std::string& s) {
    s.erase(s.begin(), std::ranges::find_if(s, [](const unsigned char ch) { return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](const unsigned char ch) { return !std::isspace(ch); }).base(),
            s.end());
}

static std::string unquote(std::string s) {
    s.erase(std::remove(s.begin(), s.end(), '"'), s.end());
    return s;
}

static bool isTruncated(const pugi::xml_node& root) {
    return std::string_view(root.child("IsTruncated").text().as_string()) == "true";
}

std::optional<S3ListPage> parseListBucketResult(const std::string& xml) {
    pugi::xml_document doc;
    if (!doc.load_string(xml.c_str())) return std::nullopt;

    const pugi::xml_node root = doc.child("ListBucketResult");
    if (!root) return std::nullopt;

    S3ListPage page;
    for (const pugi::xml_node content : root.children("Contents")) {
        const auto keyNode = content.child("Key");
        const auto sizeNode = content.child("Size");
        if (!keyNode || !sizeNode) continue;

        S3ListEntry entry;
        entry.key = keyNode.text().as_string();
        entry.etag = unquote(content.child("ETag").text().as_string());
        entry.size = sizeNode.text().as_ullong();
        page.entries.push_back(std::move(entry));
    }

    if (isTruncated(root)) page.continuation_token = root.child("NextContinuationToken").text().as_string();
    return page;
}

std::optional<S3PartsPage> parseListPartsResult(const std::string& xml) {
    pugi::xml_document doc;
    if (!doc.load_string(xml.c_str())) return std::nullopt;

    const pugi::xml_node root = doc.child("ListPartsResult");
    if (!root) return std::nullopt;

    S3PartsPage page;
    for (const pugi::xml_node part : root.children("Part")) {
        const auto number = part.child("PartNumber").text().as_uint();
        if (number == 0) continue;
        page.etags[number] = part.child("ETag").text().as_string();
    }

    if (isTruncated(root)) page.next_marker = root.child("NextPartNumberMarker").text().as_string();
    return page;
}

}
