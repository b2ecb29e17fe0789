#pragma once

#include <restcall/core/result.hpp>

#include <cstdint>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace restcall {

// ---------------------------------------------------------------------------
// HttpHeaders — header name to value. Names are case-sensitive in this
// representation; use HeaderValueCi for case-insensitive lookups.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

using ByteBuffer = std::vector<std::uint8_t>;
using ResponseStream = std::shared_ptr<std::istream>;

inline constexpr std::string_view kJsonMimeType = "application/json";

bool IEquals(std::string_view lhs, std::string_view rhs);

std::optional<std::string> FindHeaderValueCi(const HttpHeaders& headers,
                                             std::string_view name);

// ---------------------------------------------------------------------------
// HttpRequest — a fully resolved request plan for one invocation.
// ---------------------------------------------------------------------------
struct HttpRequest {
    std::string operation_name;
    std::string method;
    std::string url;
    HttpHeaders headers;
    std::optional<std::string> body;
    std::string content_type;

    HttpRequest& WithHeader(std::string name, std::string value);
    HttpRequest& WithBody(std::string content, std::string mime_type);
};

// ---------------------------------------------------------------------------
// HttpResponse — the result of an HTTP request.
//
// `body_error` is set by a transport that could not read the body
// completely; the body accessors then fail instead of returning a partial
// payload.
// ---------------------------------------------------------------------------
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
    std::optional<std::string> body_error;

    [[nodiscard]] Result<std::string, Error> BodyAsString() const;
    [[nodiscard]] Result<ByteBuffer, Error> BodyAsBytes() const;
    [[nodiscard]] Result<ResponseStream, Error> BodyAsStream() const;

    /// Exact, case-sensitive header lookup.
    [[nodiscard]] std::optional<std::string> HeaderValue(std::string_view name) const;

    [[nodiscard]] std::optional<std::string> HeaderValueCi(std::string_view name) const {
        return FindHeaderValueCi(headers, name);
    }
};

} // namespace restcall
