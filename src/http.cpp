#include "http.hpp"

#include <curl/curl.h>
#include <iostream>

namespace engram {

void http_init() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        std::cerr << "[http] libcurl init failed: " << curl_easy_strerror(rc) << "\n";
    }
}

void http_cleanup() {
    curl_global_cleanup();
}

static size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

// Owns one easy handle and its header list.
class EasyHandle {
public:
    EasyHandle() : curl_(curl_easy_init()) {}
    ~EasyHandle() {
        if (headers_) curl_slist_free_all(headers_);
        if (curl_) curl_easy_cleanup(curl_);
    }
    EasyHandle(const EasyHandle&) = delete;
    EasyHandle& operator=(const EasyHandle&) = delete;

    CURL* get() const { return curl_; }

    void set_headers(const std::vector<Header>& headers) {
        for (const auto& [name, value] : headers) {
            std::string line = name + ": " + value;
            headers_ = curl_slist_append(headers_, line.c_str());
        }
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
    }

private:
    CURL* curl_;
    curl_slist* headers_ = nullptr;
};

CurlHttpClient::CurlHttpClient(long connect_timeout_seconds, std::string user_agent)
    : connect_timeout_seconds_(connect_timeout_seconds)
    , user_agent_(std::move(user_agent))
{}

HttpResponse CurlHttpClient::post(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    HttpResponse response;
    EasyHandle h;
    if (!h.get()) {
        std::cerr << "[http] Could not allocate a curl handle\n";
        return response;
    }

    h.set_headers(headers);
    curl_easy_setopt(h.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(h.get(), CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(h.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h.get(), CURLOPT_CONNECTTIMEOUT, connect_timeout_seconds_);
    curl_easy_setopt(h.get(), CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(h.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(h.get(), CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(h.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &response.body);

    CURLcode rc = curl_easy_perform(h.get());
    if (rc != CURLE_OK) {
        std::cerr << "[http] POST " << url << ": " << curl_easy_strerror(rc) << "\n";
        response.body.clear();
        return response;
    }
    curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

} // namespace engram
