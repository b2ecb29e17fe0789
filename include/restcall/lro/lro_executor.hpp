#pragma once

#include <restcall/core/result.hpp>
#include <restcall/dispatch/dispatcher.hpp>
#include <restcall/lro/poll_driver.hpp>
#include <restcall/lro/poll_strategy_factory.hpp>

#include <chrono>
#include <future>
#include <vector>

namespace restcall {

struct LroOptions {
    std::chrono::milliseconds initial_poll_delay{2000};
    PollDriverOptions driver;
    std::vector<PollStrategyFactory> factories = DefaultPollStrategyFactories();
};

struct LroResult {
    HttpResponse final_response;
    // Final response interpreted by the operation's return and body shape.
    ResponseValue value;
    bool long_running = false;
    int poll_count = 0;
};

// ---------------------------------------------------------------------------
// LroExecutor — sends an operation and, when the initial response starts a
// long-running operation, polls it to completion.
// ---------------------------------------------------------------------------
class LroExecutor {
public:
    explicit LroExecutor(Dispatcher dispatcher, LroOptions options = {});

    [[nodiscard]] Result<LroResult, Error> Run(const OperationDescriptorPtr& descriptor,
                                               const CallArgs& args) const;

    // Same as Run on a separate thread. The executor is copied into the task.
    [[nodiscard]] std::future<Result<LroResult, Error>> RunAsync(
        OperationDescriptorPtr descriptor, CallArgs args) const;

private:
    Dispatcher dispatcher_;
    LroOptions options_;
};

} // namespace restcall
