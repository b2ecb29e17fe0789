#pragma once

#include <restcall/core/result.hpp>
#include <restcall/http/http_types.hpp>

#include <nlohmann/json.hpp>

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace restcall {

// ---------------------------------------------------------------------------
// ServiceError — the typed error built when a response carries a status the
// operation does not expect. Operation-specific error kinds derive from it
// and read whatever they need from the decoded body.
// ---------------------------------------------------------------------------
class ServiceError {
public:
    ServiceError(std::string message,
                 HttpResponse response,
                 std::optional<nlohmann::json> body);
    virtual ~ServiceError() = default;

    [[nodiscard]] const std::string& Message() const noexcept { return message_; }
    [[nodiscard]] const HttpResponse& Response() const noexcept { return response_; }
    [[nodiscard]] int StatusCode() const noexcept { return response_.status_code; }
    [[nodiscard]] const std::optional<nlohmann::json>& Body() const noexcept { return body_; }

    [[nodiscard]] virtual std::string KindName() const { return "ServiceError"; }

private:
    std::string message_;
    HttpResponse response_;
    std::optional<nlohmann::json> body_;
};

using ServiceErrorPtr = std::shared_ptr<const ServiceError>;

// ---------------------------------------------------------------------------
// ErrorFactory — builds an operation's declared error kind from the composed
// message, the raw response and the decoded error body. Returns a
// description of the failure when the kind cannot be built.
// ---------------------------------------------------------------------------
using ErrorFactory = std::function<Result<ServiceErrorPtr, std::string>(
    const std::string& message,
    const HttpResponse& response,
    const std::optional<nlohmann::json>& body)>;

// Factory for any kind constructible from (message, response, body). A
// constructor that throws is reported as a construction failure.
template <typename E>
ErrorFactory MakeErrorFactory() {
    return [](const std::string& message,
              const HttpResponse& response,
              const std::optional<nlohmann::json>& body)
               -> Result<ServiceErrorPtr, std::string> {
        try {
            ServiceErrorPtr error = std::make_shared<const E>(message, response, body);
            return Result<ServiceErrorPtr, std::string>::Ok(std::move(error));
        } catch (const std::exception& e) {
            return Result<ServiceErrorPtr, std::string>::Err(std::string(e.what()));
        }
    };
}

} // namespace restcall
