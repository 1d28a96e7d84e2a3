#pragma once
#include <stdexcept>
#include <string>

namespace Gleaner {
namespace Core {

enum class ErrorKind {
    InvalidJob,
    NoProxyAvailable,
    FetchExhausted,
    DefenseDetected,
    ExtractionField,
    JobAborted,
    Config,
    Template
};

// Stable identifier used in logs and result files ("blocked" vs "fetch_exhausted").
const char* to_string(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {
    }

    ErrorKind kind() const noexcept {
        return kind_;
    }

private:
    ErrorKind kind_;
};

class InvalidJobError : public Error {
public:
    explicit InvalidJobError(const std::string& message) : Error(ErrorKind::InvalidJob, message) {
    }
};

class NoProxyAvailableError : public Error {
public:
    explicit NoProxyAvailableError(const std::string& message)
        : Error(ErrorKind::NoProxyAvailable, message) {
    }
};

class FetchExhaustedError : public Error {
public:
    FetchExhaustedError(const std::string& url, int attempts, const std::string& last_error)
        : Error(ErrorKind::FetchExhausted,
                "Fetch exhausted after " + std::to_string(attempts) + " attempt(s): " + url
                    + " (" + last_error + ")"),
          url_(url),
          attempts_(attempts),
          last_error_(last_error) {
    }

    const std::string& url() const noexcept {
        return url_;
    }
    int attempts() const noexcept {
        return attempts_;
    }
    const std::string& last_error() const noexcept {
        return last_error_;
    }

private:
    std::string url_;
    int         attempts_;
    std::string last_error_;
};

class DefenseDetectedError : public Error {
public:
    DefenseDetectedError(const std::string& url, int proxies_tried)
        : Error(ErrorKind::DefenseDetected,
                "Blocked by automated-traffic defense after " + std::to_string(proxies_tried)
                    + " proxy rotation(s): " + url),
          url_(url),
          proxies_tried_(proxies_tried) {
    }

    const std::string& url() const noexcept {
        return url_;
    }
    int proxies_tried() const noexcept {
        return proxies_tried_;
    }

private:
    std::string url_;
    int         proxies_tried_;
};

class ExtractionFieldError : public Error {
public:
    ExtractionFieldError(const std::string& field, const std::string& message)
        : Error(ErrorKind::ExtractionField, "Field '" + field + "': " + message), field_(field) {
    }

    const std::string& field() const noexcept {
        return field_;
    }

private:
    std::string field_;
};

class JobAbortedError : public Error {
public:
    explicit JobAbortedError(const std::string& message) : Error(ErrorKind::JobAborted, message) {
    }
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) : Error(ErrorKind::Config, message) {
    }
};

class TemplateError : public Error {
public:
    explicit TemplateError(const std::string& message) : Error(ErrorKind::Template, message) {
    }
};

}  // namespace Core
}  // namespace Gleaner
