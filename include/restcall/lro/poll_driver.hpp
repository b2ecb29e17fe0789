#pragma once

#include <restcall/core/result.hpp>
#include <restcall/http/i_transport.hpp>
#include <restcall/lro/poll_strategy.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

namespace restcall {

struct PollDriverOptions {
    // Overall deadline for the polling loop. Unset waits indefinitely.
    std::optional<std::chrono::milliseconds> timeout;
    // Replaceable for tests. Defaults to std::this_thread::sleep_for.
    std::function<void(std::chrono::milliseconds)> sleep;
    // Defaults to std::chrono::steady_clock::now.
    std::function<std::chrono::steady_clock::time_point()> clock;
};

struct PollOutcome {
    HttpResponse final_response;
    int poll_count = 0;
    std::chrono::milliseconds elapsed{0};
};

// ---------------------------------------------------------------------------
// PollDriver — waits, polls and updates a strategy until it is done.
//
// Ticks are strictly sequential. Transport and poll-round errors stop the
// loop and are returned; the remote operation keeps running.
// ---------------------------------------------------------------------------
class PollDriver {
public:
    explicit PollDriver(std::shared_ptr<ITransport> transport,
                        PollDriverOptions options = {});

    [[nodiscard]] Result<PollOutcome, Error> Run(PollStrategy& strategy,
                                                 HttpResponse initial_response) const;

private:
    std::shared_ptr<ITransport> transport_;
    PollDriverOptions options_;
};

} // namespace restcall
