#pragma once

#include <curl/curl.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace mfsync::util {

void ensureCurlGlobalInit();
size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);

class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
    }
    ~CurlEasy() { curl_easy_cleanup(h_); }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    operator CURL*()       { return h_; }
    operator const CURL*() const { return h_; }

private:
    CURL* h_;
};

class SList {
public:
    SList() = default;
    SList(const SList&) = delete;
    SList& operator=(const SList&) = delete;

    void add(std::string s) {
        store_.push_back(std::move(s));
        head_ = curl_slist_append(head_, store_.back().c_str());
    }
    ~SList() { curl_slist_free_all(head_); }
    curl_slist* get() const { return head_; }

private:
    std::vector<std::string> store_;
    curl_slist*              head_ = nullptr;
};

// Owns a multipart form bound to one easy handle.
class Mime {
public:
    explicit Mime(CURL* h) : mime_(curl_mime_init(h)) {
        if (!mime_) throw std::runtime_error("curl_mime_init failed");
    }
    ~Mime() { curl_mime_free(mime_); }

    Mime(const Mime&) = delete;
    Mime& operator=(const Mime&) = delete;

    curl_mimepart* addPart() { return curl_mime_addpart(mime_); }
    curl_mime* get() const { return mime_; }

private:
    curl_mime* mime_;
};

struct HttpResponse {
    CURLcode curl  = CURLE_OK;
    long     http  = 0;
    std::string body;
    std::string hdr;
    std::string error;
    bool ok() const { return curl == CURLE_OK && http / 100 == 2; }
};

template <class SetupFn>
static HttpResponse performCurl(SetupFn&& setup) {
    ensureCurlGlobalInit();

    CurlEasy h;                    // RAII handle
    std::string bodyBuf, hdrBuf;
    char errBuf[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA,  &bodyBuf);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &hdrBuf);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errBuf);

    setup(h);                      // caller-specific tweaks

    HttpResponse r;
    r.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);
    r.body.swap(bodyBuf);
    r.hdr.swap(hdrBuf);
    if (r.curl != CURLE_OK) r.error = errBuf[0] ? errBuf : curl_easy_strerror(r.curl);
    return r;
}

std::string escape(const std::string& s);

}
