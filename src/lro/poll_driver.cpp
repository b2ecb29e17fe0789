#include <restcall/lro/poll_driver.hpp>
#include <restcall/core/log.hpp>

#include <thread>

namespace restcall {

PollDriver::PollDriver(std::shared_ptr<ITransport> transport, PollDriverOptions options)
    : transport_(std::move(transport)), options_(std::move(options)) {
    if (!options_.sleep) {
        options_.sleep = [](std::chrono::milliseconds delay) {
            std::this_thread::sleep_for(delay);
        };
    }
    if (!options_.clock) {
        options_.clock = [] { return std::chrono::steady_clock::now(); };
    }
}

Result<PollOutcome, Error> PollDriver::Run(PollStrategy& strategy,
                                           HttpResponse initial_response) const {
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    const auto start = options_.clock();
    auto elapsed = [&] { return duration_cast<milliseconds>(options_.clock() - start); };

    PollOutcome outcome;
    outcome.final_response = std::move(initial_response);

    while (!strategy.IsDone()) {
        if (options_.timeout.has_value() && elapsed() >= *options_.timeout) {
            auto error = Error::Make(strategy.Context().operation_name, strategy.PollUrl(),
                                     "operation did not complete within " +
                                         std::to_string(options_.timeout->count()) + "ms (" +
                                         std::to_string(outcome.poll_count) + " polls)",
                                     ErrorCategory::Timeout);
            LogWarn("lro", error.message);
            return Result<PollOutcome, Error>::Err(std::move(error));
        }

        options_.sleep(strategy.PollDelay());

        auto request = strategy.CreatePollRequest();
        LogDebug("lro", strategy.Context().operation_name + ": poll #" +
                            std::to_string(outcome.poll_count + 1) + " " + request.url);
        auto response = transport_->Send(request);
        if (response.IsErr()) {
            return Result<PollOutcome, Error>::Err(std::move(response).Error());
        }
        ++outcome.poll_count;

        auto updated = strategy.UpdateFrom(std::move(response).Value());
        if (updated.IsErr()) {
            return Result<PollOutcome, Error>::Err(std::move(updated).Error());
        }
        outcome.final_response = std::move(updated).Value();
    }

    outcome.elapsed = elapsed();
    LogInfo("lro", strategy.Context().operation_name + " completed with status " +
                       std::to_string(outcome.final_response.status_code) + " after " +
                       std::to_string(outcome.poll_count) + " polls");
    return Result<PollOutcome, Error>::Ok(std::move(outcome));
}

} // namespace restcall
