#include "util/curlWrappers.hpp"

#include <mutex>

namespace mfsync::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* buf = static_cast<std::string*>(userdata);
    buf->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string escape(const std::string& s) {
    ensureCurlGlobalInit();
    CurlEasy h;
    char* esc = curl_easy_escape(h, s.c_str(), static_cast<int>(s.length()));
    if (!esc) throw std::runtime_error("escape failed");
    std::string out(esc);
    curl_free(esc);
    return out;
}

}
