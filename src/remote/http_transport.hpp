#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace remote {

struct HttpResponse {
    long status{0};
    std::string body;
    // Header names are lower-cased; values are trimmed.
    std::vector<std::pair<std::string, std::string>> headers;
    // Non-empty when no HTTP response was received (DNS, connect, timeout, TLS).
    std::string transport_error;

    bool transport_failed() const noexcept { return !transport_error.empty(); }
    bool success() const noexcept { return !transport_failed() && status >= 200 && status < 300; }

    // Case-insensitive lookup; nullptr when absent.
    const std::string* header(std::string_view name) const noexcept;
};

// Minimal HTTP client seam. Implementations must be safe to call from
// several threads at once.
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    virtual HttpResponse get(const std::string& url) = 0;
    virtual HttpResponse head(const std::string& url) = 0;
    virtual HttpResponse post(const std::string& url, const std::string& body) = 0;
};

struct CurlTransportConfig {
    std::chrono::milliseconds request_timeout{60000};
    std::chrono::milliseconds connect_timeout{10000};
    std::string user_agent{"replay_fetch/1.0"};
    bool verify_tls{true};
};

// One easy handle per request; libcurl global state is initialized once per process.
class CurlTransport : public IHttpTransport {
public:
    explicit CurlTransport(CurlTransportConfig cfg = {});

    HttpResponse get(const std::string& url) override;
    HttpResponse head(const std::string& url) override;
    HttpResponse post(const std::string& url, const std::string& body) override;

private:
    enum class Method { Get, Head, Post };

    HttpResponse perform(Method method, const std::string& url, const std::string* body);

    CurlTransportConfig cfg_;
};

} // namespace remote
