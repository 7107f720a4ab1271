#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include <core/types.hpp>
#include <core/wait.hpp>
#include "http_transport.hpp"

// Low-level access to the platform REST API. One explicitly constructed
// instance per connection; it owns its transport.
//
// Errors: 401 -> AuthenticationError, 404 -> NotFoundError,
// 400 -> BadRequestError, other >= 400 -> RequestError (status + body),
// network failures -> TransportError. Only GET retries, and only on timeouts.
class RestClient {
public:
    RestClient(const ApiConfig& config, std::unique_ptr<HttpTransport> transport,
               PollClock& clock);

    // Paths are relative to the API root; a leading '/' is ignored.
    nlohmann::json get_json(const std::string& path);
    nlohmann::json post_json(const std::string& path, const nlohmann::json& body);
    void delete_json(const std::string& path);

    // Prefix a path with the API version: "sites" -> "sid/sites".
    std::string api_path(const std::string& path) const;

    // GET the API root. Rejected credentials raise AuthenticationError.
    void check_connection();

    const ApiConfig& config() const { return config_; }

private:
    std::string url_for(const std::string& path) const;
    HttpResponse send(const std::string& method, const std::string& path,
                      const std::string& body = "");
    static nlohmann::json parse_body(const std::string& url, const std::string& body);

    ApiConfig config_;
    std::unique_ptr<HttpTransport> transport_;
    PollClock& clock_;
};
