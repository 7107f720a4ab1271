#pragma once

#include <mutex>
#include <string>
#include <core/types.hpp>

struct HttpRequest {
    std::string method;     // GET, POST, DELETE
    std::string url;
    std::string body;       // POST only
};

struct HttpResponse {
    int status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// One HTTP exchange. Implementations throw TransportError on network
// failure; any HTTP status, including errors, is returned as a response.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

// libcurl transport. Owns a single easy handle so keep-alive connections are
// reused across calls; perform() is serialized.
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(const ApiConfig& config);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse perform(const HttpRequest& request) override;

private:
    void* handle_;          // CURL*
    std::mutex mutex_;
    ApiConfig config_;
};
