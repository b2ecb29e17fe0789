#pragma once

#include <restcall/codec/i_codec.hpp>
#include <restcall/core/result.hpp>
#include <restcall/http/http_types.hpp>
#include <restcall/http/i_transport.hpp>
#include <restcall/operation/operation_descriptor.hpp>
#include <restcall/operation/operation_registry.hpp>

#include <nlohmann/json.hpp>

#include <future>
#include <memory>
#include <string>
#include <variant>

namespace restcall {

// A decoded success body. std::monostate is the null result.
using ResponseValue = std::variant<std::monostate, ResponseStream, ByteBuffer, nlohmann::json>;

[[nodiscard]] inline bool IsNull(const ResponseValue& value) {
    return std::holds_alternative<std::monostate>(value);
}

// What Execute() hands back, fixed by the descriptor's ReturnShape:
//   BlockingValue, FireAndForget -> Result<ResponseValue, Error>
//   DeferredValue                -> std::future<Result<ResponseValue, Error>>
//   DeferredCompletion           -> std::future<Result<void, Error>>
using CallOutcome = std::variant<Result<ResponseValue, Error>,
                                 std::future<Result<ResponseValue, Error>>,
                                 std::future<Result<void, Error>>>;

// Block on any outcome. A completion signal yields a null value.
Result<ResponseValue, Error> Await(CallOutcome outcome);

// ---------------------------------------------------------------------------
// Dispatcher — turns an operation descriptor plus call arguments into one
// network call and interprets the response by the declared return shape.
//
// Holds no per-call state; a single Dispatcher may serve concurrent calls.
// The deferred forms send through ITransport::SendAsync and keep the
// transport and codec alive until they finish.
// ---------------------------------------------------------------------------
class Dispatcher {
public:
    Dispatcher(std::shared_ptr<ITransport> transport, std::shared_ptr<ICodec> codec);

    [[nodiscard]] CallOutcome Execute(OperationDescriptorPtr descriptor,
                                      const CallArgs& args) const;

    // Looks the operation up by name first. Unknown names fail with
    // ErrorCategory::InvalidArgument as a blocking result.
    [[nodiscard]] CallOutcome Execute(const OperationRegistry& registry,
                                      const std::string& name,
                                      const CallArgs& args) const;

    // -- Steps, exposed for the LRO executor and for tests -------------------

    [[nodiscard]] Result<HttpRequest, Error> BuildRequest(
        const OperationDescriptor& descriptor, const CallArgs& args) const;

    // Ok when the status is expected; otherwise the error built from the
    // response (Status, ErrorConstruction or Serialization).
    [[nodiscard]] Result<void, Error> ValidateStatus(
        const OperationDescriptor& descriptor, const HttpResponse& response) const;

    [[nodiscard]] Result<ResponseValue, Error> DecodeBody(
        const OperationDescriptor& descriptor, const HttpResponse& response) const;

    [[nodiscard]] Result<ResponseValue, Error> InterpretResponse(
        const OperationDescriptor& descriptor, const HttpResponse& response) const;

    [[nodiscard]] const std::shared_ptr<ITransport>& Transport() const noexcept { return transport_; }
    [[nodiscard]] const std::shared_ptr<ICodec>& Codec() const noexcept { return codec_; }

private:
    Result<ResponseValue, Error> Invoke(const OperationDescriptor& descriptor,
                                        const CallArgs& args) const;

    // Deferred shapes: the request is built on the caller's thread and sent
    // through ITransport::SendAsync; interpretation runs once it resolves.
    std::future<Result<ResponseValue, Error>> InvokeDeferred(
        const OperationDescriptorPtr& descriptor, const CallArgs& args) const;

    Result<ResponseValue, Error> Finish(const OperationDescriptor& descriptor,
                                        const std::string& url,
                                        Result<HttpResponse, Error> response) const;

    std::shared_ptr<ITransport> transport_;
    std::shared_ptr<ICodec> codec_;
};

} // namespace restcall
