#include <restcall/dispatch/dispatcher.hpp>
#include <restcall/core/log.hpp>
#include <restcall/core/url.hpp>

namespace restcall {

namespace {

// Attach the call context to an error raised below the dispatcher.
Error WithContext(Error error, const OperationDescriptor& descriptor,
                  const std::string& endpoint) {
    if (error.operation.empty() || error.operation == "Serialize" ||
        error.operation == "Deserialize") {
        error.operation = descriptor.Name();
    }
    if (error.endpoint.empty()) {
        error.endpoint = endpoint;
    }
    return error;
}

std::string JoinHostAndPath(std::string host, const std::string& path) {
    if (!host.empty() && host.back() == '/' && !path.empty() && path.front() == '/') {
        host.pop_back();
    }
    return host;
}

template <typename T>
std::future<T> ReadyFuture(T value) {
    std::promise<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

} // anonymous namespace

Result<ResponseValue, Error> Await(CallOutcome outcome) {
    if (auto* blocking = std::get_if<Result<ResponseValue, Error>>(&outcome)) {
        return std::move(*blocking);
    }
    if (auto* deferred = std::get_if<std::future<Result<ResponseValue, Error>>>(&outcome)) {
        return deferred->get();
    }
    auto completion = std::get<std::future<Result<void, Error>>>(std::move(outcome)).get();
    if (completion.IsErr()) {
        return Result<ResponseValue, Error>::Err(std::move(completion).Error());
    }
    return Result<ResponseValue, Error>::Ok(ResponseValue{});
}

Dispatcher::Dispatcher(std::shared_ptr<ITransport> transport, std::shared_ptr<ICodec> codec)
    : transport_(std::move(transport)), codec_(std::move(codec)) {}

// ---------------------------------------------------------------------------
// BuildRequest
// ---------------------------------------------------------------------------
Result<HttpRequest, Error> Dispatcher::BuildRequest(const OperationDescriptor& descriptor,
                                                    const CallArgs& args) const {
    auto scheme = descriptor.ResolveScheme(args);
    if (scheme.IsErr()) {
        return Result<HttpRequest, Error>::Err(std::move(scheme).Error());
    }
    auto host = descriptor.ResolveHost(args);
    if (host.IsErr()) {
        return Result<HttpRequest, Error>::Err(std::move(host).Error());
    }
    auto path = descriptor.ResolvePath(args);
    if (path.IsErr()) {
        return Result<HttpRequest, Error>::Err(std::move(path).Error());
    }

    UrlBuilder url;
    // A host that already names its scheme (e.g. an "{endpoint}" argument)
    // wins over the scheme template.
    if (host.Value().find("://") == std::string::npos) {
        url.WithScheme(std::move(scheme).Value());
    }
    url.WithHost(JoinHostAndPath(host.Value(), path.Value()));
    url.WithPath(path.Value());
    for (auto& [name, value] : descriptor.EncodedQueryParameters(args)) {
        url.WithQueryParameter(std::move(name), std::move(value));
    }

    HttpRequest request;
    request.operation_name = descriptor.Name();
    request.method = descriptor.Method();
    request.url = url.ToString();
    request.headers = descriptor.Headers(args);

    if (auto body = descriptor.Body(args)) {
        auto serialized = codec_->Serialize(*body);
        if (serialized.IsErr()) {
            return Result<HttpRequest, Error>::Err(
                WithContext(std::move(serialized).Error(), descriptor, request.url));
        }
        request.WithBody(std::move(serialized).Value(), std::string(kJsonMimeType));
    }
    return Result<HttpRequest, Error>::Ok(std::move(request));
}

// ---------------------------------------------------------------------------
// ValidateStatus
// ---------------------------------------------------------------------------
Result<void, Error> Dispatcher::ValidateStatus(const OperationDescriptor& descriptor,
                                               const HttpResponse& response) const {
    const int status = response.status_code;
    if (descriptor.IsExpectedStatus(status)) {
        return Result<void, Error>::Ok();
    }

    // Best effort: a failed read leaves the body empty and never hides the
    // status error.
    std::string body;
    auto text = response.BodyAsString();
    if (text.IsOk()) {
        body = std::move(text).Value();
    } else {
        LogDebug("dispatch", descriptor.Name() + ": ignoring unreadable error body: " +
                                 text.Error().message);
    }

    std::optional<nlohmann::json> decoded;
    if (!body.empty()) {
        auto parsed = codec_->Deserialize(body, descriptor.ErrorBody());
        if (parsed.IsErr()) {
            auto error = WithContext(std::move(parsed).Error(), descriptor, "");
            error.http_status = status;
            error.response_body = body;
            return Result<void, Error>::Err(std::move(error));
        }
        decoded = std::move(parsed).Value();
    }

    const auto status_text = std::to_string(status);
    auto built = descriptor.MakeError()("Status code " + status_text + ", " + body,
                                        response, decoded);
    if (built.IsErr()) {
        std::string message = "Status code " + status_text + ", but an instance of " +
                              descriptor.ErrorKindName() + " cannot be created.";
        if (!body.empty()) {
            message += " Response content: \"" + body + "\"";
        }
        auto error = Error::Make(descriptor.Name(), "", message,
                                 ErrorCategory::ErrorConstruction, status);
        error.cause = std::move(built).Error();
        if (!body.empty()) {
            error.response_body = body;
        }
        LogWarn("dispatch", error.ToString());
        return Result<void, Error>::Err(std::move(error));
    }

    auto service_error = std::move(built).Value();
    auto error = Error::Make(descriptor.Name(), "", service_error->Message(),
                             ErrorCategory::Status, status);
    if (!body.empty()) {
        error.response_body = body;
    }
    error.service_error = std::move(service_error);
    return Result<void, Error>::Err(std::move(error));
}

// ---------------------------------------------------------------------------
// DecodeBody
// ---------------------------------------------------------------------------
Result<ResponseValue, Error> Dispatcher::DecodeBody(const OperationDescriptor& descriptor,
                                                    const HttpResponse& response) const {
    const auto& shape = descriptor.SuccessBody();
    if (descriptor.IsHead()) {
        return Result<ResponseValue, Error>::Ok(ResponseValue{});
    }
    switch (shape.kind) {
        case BodyKind::None:
            return Result<ResponseValue, Error>::Ok(ResponseValue{});
        case BodyKind::RawStream:
            return response.BodyAsStream().Map(
                [](ResponseStream stream) { return ResponseValue{std::move(stream)}; });
        case BodyKind::RawBytes:
            return response.BodyAsBytes().Map(
                [](ByteBuffer bytes) { return ResponseValue{std::move(bytes)}; });
        case BodyKind::Typed:
            break;
    }

    auto text = response.BodyAsString();
    if (text.IsErr()) {
        return Result<ResponseValue, Error>::Err(std::move(text).Error());
    }
    auto value = codec_->Deserialize(text.Value(), shape.value);
    if (value.IsErr()) {
        auto error = WithContext(std::move(value).Error(), descriptor, "");
        error.http_status = response.status_code;
        return Result<ResponseValue, Error>::Err(std::move(error));
    }
    return Result<ResponseValue, Error>::Ok(ResponseValue{std::move(value).Value()});
}

Result<ResponseValue, Error> Dispatcher::InterpretResponse(const OperationDescriptor& descriptor,
                                                           const HttpResponse& response) const {
    auto valid = ValidateStatus(descriptor, response);
    if (valid.IsErr()) {
        return Result<ResponseValue, Error>::Err(std::move(valid).Error());
    }
    if (descriptor.Returns() == ReturnShape::FireAndForget) {
        return Result<ResponseValue, Error>::Ok(ResponseValue{});
    }
    return DecodeBody(descriptor, response);
}

// ---------------------------------------------------------------------------
// Execute
// ---------------------------------------------------------------------------
Result<ResponseValue, Error> Dispatcher::Finish(const OperationDescriptor& descriptor,
                                                const std::string& url,
                                                Result<HttpResponse, Error> response) const {
    if (response.IsErr()) {
        return Result<ResponseValue, Error>::Err(std::move(response).Error());
    }

    auto result = InterpretResponse(descriptor, response.Value());
    if (result.IsErr() && result.Error().endpoint.empty()) {
        auto error = std::move(result).Error();
        error.endpoint = url;
        return Result<ResponseValue, Error>::Err(std::move(error));
    }
    return result;
}

Result<ResponseValue, Error> Dispatcher::Invoke(const OperationDescriptor& descriptor,
                                                const CallArgs& args) const {
    auto request = BuildRequest(descriptor, args);
    if (request.IsErr()) {
        LogDebug("dispatch", descriptor.Name() + ": " + request.Error().message);
        return Result<ResponseValue, Error>::Err(std::move(request).Error());
    }

    LogDebug("dispatch", descriptor.Name() + " (" + ReturnShapeName(descriptor.Returns()) +
                             ") -> " + request.Value().method + " " + request.Value().url);
    return Finish(descriptor, request.Value().url, transport_->Send(request.Value()));
}

std::future<Result<ResponseValue, Error>> Dispatcher::InvokeDeferred(
    const OperationDescriptorPtr& descriptor, const CallArgs& args) const {
    auto request = BuildRequest(*descriptor, args);
    if (request.IsErr()) {
        LogDebug("dispatch", descriptor->Name() + ": " + request.Error().message);
        return ReadyFuture(Result<ResponseValue, Error>::Err(std::move(request).Error()));
    }

    LogDebug("dispatch", descriptor->Name() + " (" + ReturnShapeName(descriptor->Returns()) +
                             ") -> " + request.Value().method + " " + request.Value().url);
    auto pending = transport_->SendAsync(request.Value());
    return std::async(std::launch::async,
                      [self = *this, descriptor, url = request.Value().url,
                       pending = std::move(pending)]() mutable {
                          return self.Finish(*descriptor, url, pending.get());
                      });
}

CallOutcome Dispatcher::Execute(OperationDescriptorPtr descriptor, const CallArgs& args) const {
    if (!descriptor) {
        return Result<ResponseValue, Error>::Err(Error::Make(
            "Dispatcher", "", "null operation descriptor", ErrorCategory::Internal));
    }

    switch (descriptor->Returns()) {
        case ReturnShape::DeferredValue:
            return InvokeDeferred(descriptor, args);
        case ReturnShape::DeferredCompletion:
            return std::async(std::launch::async,
                              [value = InvokeDeferred(descriptor, args)]() mutable {
                                  auto result = value.get();
                                  if (result.IsErr()) {
                                      return Result<void, Error>::Err(std::move(result).Error());
                                  }
                                  return Result<void, Error>::Ok();
                              });
        case ReturnShape::FireAndForget:
        case ReturnShape::BlockingValue:
            break;
    }
    return Invoke(*descriptor, args);
}

CallOutcome Dispatcher::Execute(const OperationRegistry& registry,
                                const std::string& name,
                                const CallArgs& args) const {
    auto descriptor = registry.Find(name);
    if (descriptor.IsErr()) {
        return Result<ResponseValue, Error>::Err(std::move(descriptor).Error());
    }
    return Execute(std::move(descriptor).Value(), args);
}

} // namespace restcall
