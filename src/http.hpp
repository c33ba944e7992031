#pragma once
#include <string>
#include <vector>
#include <utility>

namespace strata {

using Header = std::pair<std::string, std::string>;

// status_code == 0 means the request never produced an HTTP response
// (bad URL, DNS, connect, TLS or timeout); error then says which.
struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::string error;

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 120) = 0;
};

// POSIX sockets + OpenSSL. One connection per request, Connection: close.
class SocketHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120) override;
};

} // namespace strata
