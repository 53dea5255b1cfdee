#include "remote/http_transport.hpp"

#include <cctype>
#include <mutex>

#include <curl/curl.h>

#include "util/log.hpp"

namespace remote {
namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

bool ensure_curl_global() {
    static std::once_flag once;
    static CURLcode init_rc = CURLE_OK;
    std::call_once(once, [] { init_rc = curl_global_init(CURL_GLOBAL_DEFAULT); });
    return init_rc == CURLE_OK;
}

size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t on_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<std::vector<std::pair<std::string, std::string>>*>(userdata);
    const std::string_view line(buffer, size * nitems);
    // A new status line (redirects, 100-continue) starts a fresh header block.
    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return size * nitems;
    }
    const auto colon = line.find(':');
    if (colon != std::string_view::npos) {
        headers->emplace_back(to_lower(trim(line.substr(0, colon))), std::string(trim(line.substr(colon + 1))));
    }
    return size * nitems;
}

struct EasyHandle {
    CURL* h{curl_easy_init()};
    curl_slist* extra{nullptr};
    ~EasyHandle() {
        if (extra) {
            curl_slist_free_all(extra);
        }
        if (h) {
            curl_easy_cleanup(h);
        }
    }
};

} // namespace

const std::string* HttpResponse::header(std::string_view name) const noexcept {
    for (const auto& [k, v] : headers) {
        if (k.size() != name.size()) {
            continue;
        }
        bool same = true;
        for (std::size_t i = 0; i < k.size(); ++i) {
            if (static_cast<unsigned char>(k[i]) != std::tolower(static_cast<unsigned char>(name[i]))) {
                same = false;
                break;
            }
        }
        if (same) {
            return &v;
        }
    }
    return nullptr;
}

CurlTransport::CurlTransport(CurlTransportConfig cfg) : cfg_(std::move(cfg)) {
    if (!ensure_curl_global()) {
        RF_LOG_ERROR("curl_global_init failed; all requests will fail");
    }
}

HttpResponse CurlTransport::get(const std::string& url) { return perform(Method::Get, url, nullptr); }

HttpResponse CurlTransport::head(const std::string& url) { return perform(Method::Head, url, nullptr); }

HttpResponse CurlTransport::post(const std::string& url, const std::string& body) {
    return perform(Method::Post, url, &body);
}

HttpResponse CurlTransport::perform(Method method, const std::string& url, const std::string* body) {
    HttpResponse resp;
    if (!ensure_curl_global()) {
        resp.transport_error = "libcurl not initialized";
        return resp;
    }
    EasyHandle easy;
    if (!easy.h) {
        resp.transport_error = "curl_easy_init failed";
        return resp;
    }

    char errbuf[CURL_ERROR_SIZE] = {0};
    CURL* h = easy.h;
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(cfg_.request_timeout.count()));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(cfg_.connect_timeout.count()));
    curl_easy_setopt(h, CURLOPT_USERAGENT, cfg_.user_agent.c_str());
    if (!cfg_.verify_tls) {
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 0L);
    }
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, on_header);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &resp.headers);

    switch (method) {
    case Method::Get:
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        break;
    case Method::Head:
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
        break;
    case Method::Post:
        easy.extra = curl_slist_append(easy.extra, "Content-Type: application/json");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, easy.extra);
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
        break;
    }

    const CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        resp.transport_error = errbuf[0] != '\0' ? std::string(errbuf) : std::string(curl_easy_strerror(rc));
        resp.headers.clear();
        resp.body.clear();
        return resp;
    }
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}

} // namespace remote
