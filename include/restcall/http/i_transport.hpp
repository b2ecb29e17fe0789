#pragma once

#include <restcall/core/result.hpp>
#include <restcall/http/http_types.hpp>

#include <future>

namespace restcall {

// ---------------------------------------------------------------------------
// ITransport — abstract HTTP transport.
//
// The dispatcher and the poll driver depend on this interface rather than a
// concrete HTTP client. This enables offline testing via MockTransport.
//
// Send returns Result<HttpResponse, Error> — never throws on expected
// failures. A non-2xx status is a successful send; only network and read
// failures are errors.
// ---------------------------------------------------------------------------
class ITransport {
public:
    virtual ~ITransport() = default;

    // Non-copyable, non-movable (polymorphic base).
    ITransport(const ITransport&) = delete;
    ITransport& operator=(const ITransport&) = delete;
    ITransport(ITransport&&) = delete;
    ITransport& operator=(ITransport&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Send(
        const HttpRequest& request) = 0;

    // Delivers the same response through a single notification. The default
    // runs Send on a separate thread; the transport must outlive the future.
    [[nodiscard]] virtual std::future<Result<HttpResponse, Error>> SendAsync(
        const HttpRequest& request) {
        return std::async(std::launch::async,
                          [this, request] { return Send(request); });
    }

protected:
    ITransport() = default;
};

} // namespace restcall
