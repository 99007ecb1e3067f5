#pragma once

#include "s3Helpers.hpp"

#include <curl/curl.h>
#include <stdexcept>
#include <string>

namespace stratus::util {

class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
    }
    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;
    ~CurlEasy() { curl_easy_cleanup(h_); }

    operator CURL*() const { return h_; }

private:
    CURL* h_;
};

struct HttpResponse {
    CURLcode curl = CURLE_OK;
    long     http = 0;
    std::string body;
    std::string hdr;

    [[nodiscard]] bool ok() const { return curl == CURLE_OK && http / 100 == 2; }
    // Network failures, throttling and 5xx are worth another attempt.
    [[nodiscard]] bool transient() const { return curl != CURLE_OK || http == 429 || http / 100 == 5; }
};

template <class SetupFn>
HttpResponse performCurl(SetupFn&& setup) {
    CurlEasy h;
    std::string bodyBuf, hdrBuf;

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &bodyBuf);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &hdrBuf);

    setup(static_cast<CURL*>(h));

    HttpResponse r;
    r.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);
    r.body.swap(bodyBuf);
    r.hdr.swap(hdrBuf);
    return r;
}

}
