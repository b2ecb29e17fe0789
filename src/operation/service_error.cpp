#include <restcall/operation/service_error.hpp>

namespace restcall {

ServiceError::ServiceError(std::string message,
                           HttpResponse response,
                           std::optional<nlohmann::json> body)
    : message_(std::move(message)),
      response_(std::move(response)),
      body_(std::move(body)) {}

} // namespace restcall
