#include "rest_client.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

RestClient::RestClient(const ApiConfig& config, std::unique_ptr<HttpTransport> transport,
                       PollClock& clock)
    : config_(config), transport_(std::move(transport)), clock_(clock) {
}

std::string RestClient::api_path(const std::string& path) const {
    return join_path(config_.version, path);
}

std::string RestClient::url_for(const std::string& path) const {
    std::string base = config_.uri;
    while (!base.empty() && base.back() == '/') base.pop_back();
    std::string rel = path;
    while (!rel.empty() && rel.front() == '/') rel.erase(0, 1);
    return base + "/" + rel;
}

HttpResponse RestClient::send(const std::string& method, const std::string& path,
                              const std::string& body) {
    HttpRequest req{method, url_for(path), body};
    HttpResponse resp = transport_->perform(req);
    g5k_log_http(method, req.url, resp.status, resp.body);

    if (resp.ok()) return resp;

    std::string msg = fmt::format("{} {} returned HTTP {}", method, req.url, resp.status);
    if (!resp.body.empty()) {
        msg += ": " + resp.body.substr(0, LOG_BODY_MAX);
    }

    switch (resp.status) {
        case 400: throw BadRequestError(msg, resp.body);
        case 401: throw AuthenticationError(msg, resp.body);
        case 404: throw NotFoundError(msg, resp.body);
        default:  throw RequestError(msg, resp.status, resp.body);
    }
}

nlohmann::json RestClient::parse_body(const std::string& url, const std::string& body) {
    if (body.empty()) return nlohmann::json::object();
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw G5kError(fmt::format("Malformed JSON from {}: {}", url, e.what()));
    }
}

nlohmann::json RestClient::get_json(const std::string& path) {
    int fails = 0;
    while (true) {
        try {
            HttpResponse resp = send("GET", path);
            return parse_body(url_for(path), resp.body);
        } catch (const TransportError& e) {
            if (!e.timed_out()) throw;
            fails++;
            if (fails > config_.retries) throw;
            g5k_log(fmt::format("GET {} timed out, retry {}/{}", path, fails, config_.retries));
            clock_.sleep_for(std::chrono::seconds(HTTP_RETRY_DELAY_SECS), nullptr);
        }
    }
}

nlohmann::json RestClient::post_json(const std::string& path, const nlohmann::json& body) {
    HttpResponse resp = send("POST", path, body.dump());
    return parse_body(url_for(path), resp.body);
}

void RestClient::delete_json(const std::string& path) {
    send("DELETE", path);
}

void RestClient::check_connection() {
    try {
        get_json(api_path(""));
    } catch (const AuthenticationError& e) {
        throw AuthenticationError(
            fmt::format("Credentials for user '{}' are not recognized", config_.user), e.body());
    }
}
