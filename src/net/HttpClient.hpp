#pragma once
// HttpClient.hpp - Blocking HTTP GET with a hard timeout
// Providers call this from the resolve worker thread; tests swap in a fake.

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "util/Types.hpp"

class QNetworkAccessManager;

namespace cal::net {

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    u32 timeoutMs{10000};
};

enum class HttpError { None, Network, Timeout };

struct HttpResponse {
    int status{0};
    std::string body;
    HttpError error{HttpError::None};
    std::string errorMessage;

    bool transportFailed() const {
        return error != HttpError::None;
    }
    bool ok() const {
        return !transportFailed() && status >= 200 && status < 300;
    }
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const HttpRequest& request) = 0;
};

// QNetworkAccessManager driven by a local event loop. Must be used from a
// thread with a Qt event dispatcher; the manager is created on first use and
// lives in that thread.
class QtHttpClient : public HttpClient {
public:
    QtHttpClient();
    ~QtHttpClient() override;

    HttpResponse get(const HttpRequest& request) override;

private:
    std::unique_ptr<QNetworkAccessManager> manager_;
};

// Browser-like UA; some lyrics sites reject unknown agents
inline constexpr const char* kUserAgent =
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 "
        "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";

} // namespace cal::net
