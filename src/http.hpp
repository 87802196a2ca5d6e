#pragma once
#include <string>
#include <utility>
#include <vector>

namespace engram {

// Process-wide libcurl setup. Call once before the first request and once
// at shutdown.
void http_init();
void http_cleanup();

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;   // 0 = no response (DNS, connect, timeout)
    std::string body;
};

// Outbound POST used by the remote embedders. Injectable for tests.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 30) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(long connect_timeout_seconds = 10,
                            std::string user_agent = "engram/0.1");

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30) override;

private:
    long connect_timeout_seconds_;
    std::string user_agent_;
};

} // namespace engram
