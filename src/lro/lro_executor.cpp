#include <restcall/lro/lro_executor.hpp>
#include <restcall/core/log.hpp>

namespace restcall {

LroExecutor::LroExecutor(Dispatcher dispatcher, LroOptions options)
    : dispatcher_(std::move(dispatcher)), options_(std::move(options)) {}

Result<LroResult, Error> LroExecutor::Run(const OperationDescriptorPtr& descriptor,
                                          const CallArgs& args) const {
    if (!descriptor) {
        return Result<LroResult, Error>::Err(Error::Make(
            "LroExecutor", "", "null operation descriptor", ErrorCategory::Internal));
    }

    auto request = dispatcher_.BuildRequest(*descriptor, args);
    if (request.IsErr()) {
        return Result<LroResult, Error>::Err(std::move(request).Error());
    }
    auto response = dispatcher_.Transport()->Send(request.Value());
    if (response.IsErr()) {
        return Result<LroResult, Error>::Err(std::move(response).Error());
    }

    LroResult result;
    result.final_response = std::move(response).Value();

    // 202 is how a server acknowledges a long-running operation, whether or
    // not the operation lists it.
    if (!descriptor->IsExpectedStatus(result.final_response.status_code, {202})) {
        auto valid = dispatcher_.ValidateStatus(*descriptor, result.final_response);
        if (valid.IsErr()) {
            auto error = std::move(valid).Error();
            error.endpoint = request.Value().url;
            return Result<LroResult, Error>::Err(std::move(error));
        }
    }

    auto context = PollContext::For(*descriptor);
    auto strategy = SelectPollStrategy(options_.factories, context, request.Value(),
                                       result.final_response, options_.initial_poll_delay);
    if (strategy) {
        LogInfo("lro", descriptor->Name() + " accepted as a long-running operation");
        result.long_running = true;

        PollDriver driver(dispatcher_.Transport(), options_.driver);
        auto outcome = driver.Run(*strategy, std::move(result.final_response));
        if (outcome.IsErr()) {
            return Result<LroResult, Error>::Err(std::move(outcome).Error());
        }
        auto polled = std::move(outcome).Value();
        result.final_response = std::move(polled.final_response);
        result.poll_count = polled.poll_count;
    }

    auto value = dispatcher_.InterpretResponse(*descriptor, result.final_response);
    if (value.IsErr()) {
        return Result<LroResult, Error>::Err(std::move(value).Error());
    }
    result.value = std::move(value).Value();
    return Result<LroResult, Error>::Ok(std::move(result));
}

std::future<Result<LroResult, Error>> LroExecutor::RunAsync(OperationDescriptorPtr descriptor,
                                                            CallArgs args) const {
    return std::async(std::launch::async,
                      [self = *this, descriptor = std::move(descriptor),
                       args = std::move(args)] { return self.Run(descriptor, args); });
}

} // namespace restcall
