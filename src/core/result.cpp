#include <restcall/core/result.hpp>

#include <nlohmann/json.hpp>

#include <ostream>
#include <sstream>

namespace restcall {

Error Error::Make(std::string operation,
                  std::string endpoint,
                  std::string message,
                  ErrorCategory category,
                  std::optional<int> http_status) {
    Error error;
    error.operation = std::move(operation);
    error.endpoint = std::move(endpoint);
    error.http_status = http_status;
    error.message = std::move(message);
    error.category = category;
    return error;
}

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Transport:         return 1;
        case ErrorCategory::Timeout:           return 2;
        case ErrorCategory::Status:            return 3;
        case ErrorCategory::ErrorConstruction: return 4;
        case ErrorCategory::Serialization:     return 5;
        case ErrorCategory::PollRound:         return 6;
        case ErrorCategory::InvalidArgument:   return 7;
        case ErrorCategory::Configuration:     return 8;
        case ErrorCategory::Internal:          return 99;
    }
    return 99;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Transport:         return "transport";
        case ErrorCategory::Timeout:           return "timeout";
        case ErrorCategory::Status:            return "status";
        case ErrorCategory::ErrorConstruction: return "error_construction";
        case ErrorCategory::Serialization:     return "serialization";
        case ErrorCategory::PollRound:         return "poll_round";
        case ErrorCategory::InvalidArgument:   return "invalid_argument";
        case ErrorCategory::Configuration:     return "configuration";
        case ErrorCategory::Internal:          return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!endpoint.empty()) {
        oss << " [" << endpoint << "]";
    }
    if (http_status.has_value()) {
        oss << " (HTTP " << *http_status << ")";
    }
    oss << ": " << message;
    if (!cause.empty()) {
        oss << " (cause: " << cause << ")";
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body;
    body["category"] = CategoryName();
    body["operation"] = operation;
    if (!endpoint.empty()) {
        body["endpoint"] = endpoint;
    }
    if (http_status.has_value()) {
        body["http_status"] = *http_status;
    }
    body["message"] = message;
    if (response_body.has_value() && !response_body->empty()) {
        body["response_body"] = *response_body;
    }
    if (!cause.empty()) {
        body["cause"] = cause;
    }
    body["exit_code"] = ExitCode();
    // Response bodies are not guaranteed to be valid UTF-8.
    return nlohmann::json{{"error", body}}.dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::ostream& operator<<(std::ostream& os, const Error& e) {
    return os << e.ToString();
}

} // namespace restcall
