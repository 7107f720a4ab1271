#pragma once

#include <map>
#include <stdexcept>
#include <string>

// Base of every error the library throws.
class G5kError : public std::runtime_error {
public:
    explicit G5kError(const std::string& msg) : std::runtime_error(msg) {}
};

// Invalid or conflicting reservation fields. Raised before any network call.
class ConfigurationError : public G5kError {
public:
    explicit ConfigurationError(const std::string& msg) : G5kError(msg) {}
};

// Network-level failure (connect, DNS, timeout).
class TransportError : public G5kError {
public:
    TransportError(const std::string& msg, bool timed_out)
        : G5kError(msg), timed_out_(timed_out) {}

    bool timed_out() const { return timed_out_; }

private:
    bool timed_out_;
};

// Any HTTP status >= 400 that has no dedicated class.
class RequestError : public G5kError {
public:
    RequestError(const std::string& msg, int status, std::string body)
        : G5kError(msg), status_(status), body_(std::move(body)) {}

    int status() const { return status_; }
    const std::string& body() const { return body_; }

private:
    int status_;
    std::string body_;
};

class BadRequestError : public RequestError {
public:
    BadRequestError(const std::string& msg, std::string body)
        : RequestError(msg, 400, std::move(body)) {}
};

class AuthenticationError : public RequestError {
public:
    AuthenticationError(const std::string& msg, std::string body)
        : RequestError(msg, 401, std::move(body)) {}
};

class NotFoundError : public RequestError {
public:
    NotFoundError(const std::string& msg, std::string body)
        : RequestError(msg, 404, std::move(body)) {}
};

// Job reached a terminal state without ever running.
class JobFailedError : public G5kError {
public:
    JobFailedError(const std::string& msg, int job_uid, std::string state)
        : G5kError(msg), job_uid_(job_uid), state_(std::move(state)) {}

    int job_uid() const { return job_uid_; }
    const std::string& state() const { return state_; }

private:
    int job_uid_;
    std::string state_;
};

// Deployment ended in error or with nodes not reporting OK.
// failures maps node -> reported state.
class DeploymentFailedError : public G5kError {
public:
    DeploymentFailedError(const std::string& msg, std::string deployment_uid,
                          std::map<std::string, std::string> failures)
        : G5kError(msg), deployment_uid_(std::move(deployment_uid)),
          failures_(std::move(failures)) {}

    const std::string& deployment_uid() const { return deployment_uid_; }
    const std::map<std::string, std::string>& failures() const { return failures_; }

private:
    std::string deployment_uid_;
    std::map<std::string, std::string> failures_;
};

// A bounded wait exceeded its deadline. The remote job is left untouched.
class TimedOutError : public G5kError {
public:
    TimedOutError(const std::string& msg, std::string subject, std::string state)
        : G5kError(msg), subject_(std::move(subject)), state_(std::move(state)) {}

    const std::string& subject() const { return subject_; }
    const std::string& last_state() const { return state_; }

private:
    std::string subject_;
    std::string state_;
};

// The wait was cancelled through its CancelToken before the deadline.
class WaitCancelled : public TimedOutError {
public:
    WaitCancelled(const std::string& msg, std::string subject, std::string state)
        : TimedOutError(msg, std::move(subject), std::move(state)) {}
};
