#include <restcall/http/http_transport.hpp>
#include <restcall/core/log.hpp>
#include <restcall/core/url.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace restcall {

namespace {

Error MakeTransportError(const HttpRequest& request,
                         const std::string& message,
                         ErrorCategory category = ErrorCategory::Transport) {
    return Error::Make(request.operation_name.empty() ? "Send"
                                                      : request.operation_name,
                       request.url, message, category);
}

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::ConnectionTimeout:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Transport;
    }
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

bool IsSensitiveHeader(std::string_view key) {
    std::string lower_key(key);
    std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower_key == "authorization" ||
           lower_key == "cookie" ||
           lower_key == "set-cookie" ||
           lower_key == "proxy-authorization" ||
           lower_key.find("key") != std::string::npos ||
           lower_key.find("token") != std::string::npos;
}

void LogRequestHeaders(const httplib::Headers& hdrs) {
    if (!GlobalLogger().IsEnabled(LogLevel::Debug)) return;
    for (const auto& [k, v] : hdrs) {
        if (IsSensitiveHeader(k)) {
            LogDebug("http", "  > " + k + ": <redacted>");
        } else {
            LogDebug("http", "  > " + k + ": " + v);
        }
    }
}

void LogResponse(int status, const httplib::Headers& hdrs,
                 const std::string& body) {
    LogInfo("http", "  < " + std::to_string(status));
    if (!GlobalLogger().IsEnabled(LogLevel::Debug)) return;
    for (const auto& [k, v] : hdrs) {
        if (IsSensitiveHeader(k)) {
            LogDebug("http", "  < " + k + ": <redacted>");
        } else {
            LogDebug("http", "  < " + k + ": " + v);
        }
    }
    if (status >= 400 && !body.empty()) {
        constexpr size_t kMaxBodyLog = 2000;
        if (body.size() <= kMaxBodyLog) {
            LogDebug("http", "  < body: " + body);
        } else {
            LogDebug("http", "  < body: " + body.substr(0, kMaxBodyLog) + "... (truncated)");
        }
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct HttpTransport::Impl {
    HttpTransportOptions options;

    explicit Impl(const HttpTransportOptions& opts) : options(opts) {}

    void Configure(httplib::Client& client, const std::string& scheme) const {
        client.set_connection_timeout(options.connect_timeout);
        client.set_read_timeout(options.read_timeout);
        client.set_follow_location(options.follow_redirects);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        if (scheme == "https" && options.disable_tls_verify) {
            client.enable_server_certificate_verification(false);
        }
#else
        (void)scheme;
#endif
    }
};

HttpTransport::HttpTransport(const HttpTransportOptions& options)
    : impl_(std::make_unique<Impl>(options)) {}

HttpTransport::~HttpTransport() = default;

Result<HttpResponse, Error> HttpTransport::Send(const HttpRequest& request) {
    auto parsed = ParseAbsoluteUrl(request.url);
    if (parsed.IsErr()) {
        return Result<HttpResponse, Error>::Err(
            MakeTransportError(request, "invalid request URL: " +
                                            parsed.Error().message,
                               ErrorCategory::InvalidArgument));
    }
    const auto& url = parsed.Value();
    if (url.scheme != "http" && url.scheme != "https") {
        return Result<HttpResponse, Error>::Err(
            MakeTransportError(request, "unsupported URL scheme '" + url.scheme + "'",
                               ErrorCategory::InvalidArgument));
    }

    httplib::Client client(url.scheme + "://" + *url.authority);
    impl_->Configure(client, url.scheme);

    httplib::Request req;
    req.method = request.method;
    req.path = url.path.empty() ? "/" : url.path;
    if (url.query.has_value()) {
        req.path += "?" + *url.query;
    }
    for (const auto& [name, value] : request.headers) {
        req.headers.emplace(name, value);
    }
    if (request.body.has_value()) {
        req.body = *request.body;
        if (!request.content_type.empty()) {
            req.headers.emplace("Content-Type", request.content_type);
        }
    }

    LogInfo("http", request.method + " " + request.url);
    LogRequestHeaders(req.headers);

    auto res = client.send(req);
    if (!res) {
        const auto http_error = res.error();
        return Result<HttpResponse, Error>::Err(
            MakeTransportError(request,
                               "HTTP request failed: " + httplib::to_string(http_error),
                               CategoryFromHttpTransportError(http_error)));
    }

    LogResponse(res->status, res->headers, res->body);
    HttpResponse response;
    response.status_code = res->status;
    response.headers = ToHttpHeaders(res->headers);
    response.body = res->body;
    return Result<HttpResponse, Error>::Ok(std::move(response));
}

} // namespace restcall
