#pragma once

#include <curl/curl.h>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace hs::util {

inline void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

inline size_t writeToString(char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 1L);
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
    ~SList() { curl_slist_free_all(head_); }

    void add(std::string s) {
        store_.push_back(std::move(s));
        head_ = curl_slist_append(head_, store_.back().c_str());
    }
    curl_slist* get() const { return head_; }

private:
    std::vector<std::string> store_;
    curl_slist*              head_ = nullptr;
};

struct HttpResponse {
    CURLcode curl  = CURLE_OK;
    long     http  = 0;
    std::string body;
};

template <class SetupFn>
HttpResponse performCurl(SetupFn&& setup) {
    ensureCurlGlobalInit();

    CurlEasy h;
    std::string bodyBuf;

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA,  &bodyBuf);

    setup(h);                      // caller-specific tweaks

    HttpResponse r;
    r.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);
    r.body.swap(bodyBuf);
    return r;
}

}
