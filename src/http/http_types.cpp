#include <restcall/http/http_types.hpp>

#include <cctype>
#include <sstream>

namespace restcall {

namespace {

Error MakeBodyReadError(const HttpResponse& response) {
    return Error::Make("ReadBody", "",
                       "failed to read response body: " +
                           response.body_error.value_or("unknown error"),
                       ErrorCategory::Transport, response.status_code);
}

} // anonymous namespace

bool IEquals(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
        const auto lc = static_cast<unsigned char>(lhs[i]);
        const auto rc = static_cast<unsigned char>(rhs[i]);
        if (std::tolower(lc) != std::tolower(rc)) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> FindHeaderValueCi(const HttpHeaders& headers,
                                             std::string_view name) {
    for (const auto& [k, v] : headers) {
        if (IEquals(k, name)) {
            return v;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// HttpRequest
// ---------------------------------------------------------------------------
HttpRequest& HttpRequest::WithHeader(std::string name, std::string value) {
    headers[std::move(name)] = std::move(value);
    return *this;
}

HttpRequest& HttpRequest::WithBody(std::string content, std::string mime_type) {
    body = std::move(content);
    content_type = std::move(mime_type);
    return *this;
}

// ---------------------------------------------------------------------------
// HttpResponse
// ---------------------------------------------------------------------------
Result<std::string, Error> HttpResponse::BodyAsString() const {
    if (body_error.has_value()) {
        return Result<std::string, Error>::Err(MakeBodyReadError(*this));
    }
    return Result<std::string, Error>::Ok(body);
}

Result<ByteBuffer, Error> HttpResponse::BodyAsBytes() const {
    if (body_error.has_value()) {
        return Result<ByteBuffer, Error>::Err(MakeBodyReadError(*this));
    }
    return Result<ByteBuffer, Error>::Ok(ByteBuffer(body.begin(), body.end()));
}

Result<ResponseStream, Error> HttpResponse::BodyAsStream() const {
    if (body_error.has_value()) {
        return Result<ResponseStream, Error>::Err(MakeBodyReadError(*this));
    }
    ResponseStream stream = std::make_shared<std::istringstream>(body);
    return Result<ResponseStream, Error>::Ok(std::move(stream));
}

std::optional<std::string> HttpResponse::HeaderValue(std::string_view name) const {
    auto it = headers.find(std::string(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace restcall
