#pragma once

#include <restcall/http/i_transport.hpp>

#include <chrono>
#include <memory>

namespace restcall {

// ---------------------------------------------------------------------------
// HttpTransportOptions — configuration for the HTTP transport.
// ---------------------------------------------------------------------------
struct HttpTransportOptions {
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds read_timeout{120};
    bool disable_tls_verify = false;
    bool follow_redirects = false;
};

// ---------------------------------------------------------------------------
// HttpTransport — concrete ITransport implementation using cpp-httplib.
//
// Uses pimpl to avoid leaking httplib into the public header. Each Send
// opens a client for the request's origin, so concurrent sends do not share
// connection state.
// ---------------------------------------------------------------------------
class HttpTransport : public ITransport {
public:
    explicit HttpTransport(const HttpTransportOptions& options = {});
    ~HttpTransport() override;

    [[nodiscard]] Result<HttpResponse, Error> Send(
        const HttpRequest& request) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace restcall
