#include "http_transport.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <curl/curl.h>
#include <fmt/format.h>

static std::once_flag curl_init_flag;

static size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    size_t n = size * nmemb;
    buffer->append(ptr, n);
    return n;
}

CurlTransport::CurlTransport(const ApiConfig& config)
    : handle_(nullptr), config_(config) {
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    handle_ = curl_easy_init();
    if (!handle_) {
        throw TransportError("Failed to create HTTP handle", false);
    }
}

CurlTransport::~CurlTransport() {
    if (handle_) curl_easy_cleanup(static_cast<CURL*>(handle_));
}

HttpResponse CurlTransport::perform(const HttpRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    CURL* curl = static_cast<CURL*>(handle_);

    // reset options but keep the connection cache
    curl_easy_reset(curl);

    HttpResponse response;
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(config_.timeout));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    std::string userpwd;
    if (!config_.user.empty() && config_.password.has_value()) {
        userpwd = config_.user + ":" + config_.password.value();
        curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(curl, CURLOPT_USERPWD, userpwd.c_str());
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, fmt::format("Accept: {}", JSON_CONTENT_TYPE).c_str());

    if (request.method == "POST") {
        headers = curl_slist_append(headers,
                                    fmt::format("Content-Type: {}", JSON_CONTENT_TYPE).c_str());
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode rc = curl_easy_perform(curl);
    curl_slist_free_all(headers);

    if (rc != CURLE_OK) {
        throw TransportError(
            fmt::format("{} {} failed: {}", request.method, request.url, curl_easy_strerror(rc)),
            rc == CURLE_OPERATION_TIMEDOUT);
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<int>(status);
    return response;
}
