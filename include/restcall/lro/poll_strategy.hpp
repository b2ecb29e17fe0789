#pragma once

#include <restcall/core/result.hpp>
#include <restcall/http/http_types.hpp>
#include <restcall/operation/operation_descriptor.hpp>

#include <chrono>
#include <initializer_list>
#include <memory>
#include <set>
#include <string>

namespace restcall {

// Mutable state of one in-flight long-running operation. `done` goes from
// false to true exactly once.
struct PollState {
    std::string poll_url;
    std::chrono::milliseconds delay{0};
    bool done = false;
};

// What a strategy needs to know about the operation it polls for.
struct PollContext {
    std::string operation_name;
    // Statuses that end polling. Empty means any status below 400.
    std::set<int> terminal_statuses;

    static PollContext For(const OperationDescriptor& descriptor);

    [[nodiscard]] bool IsTerminal(int status) const;
};

// ---------------------------------------------------------------------------
// PollStrategy — abstract state machine for one LRO signalling convention.
//
// UpdateFrom is the only mutator. A strategy is owned by a single driver
// loop and must not be updated concurrently.
// ---------------------------------------------------------------------------
class PollStrategy {
public:
    virtual ~PollStrategy() = default;

    PollStrategy(const PollStrategy&) = delete;
    PollStrategy& operator=(const PollStrategy&) = delete;

    // GET against the current poll URL.
    [[nodiscard]] virtual HttpRequest CreatePollRequest() const;

    // Inspect a poll response and advance the state. The response is handed
    // back unchanged for the caller to interpret.
    [[nodiscard]] virtual Result<HttpResponse, Error> UpdateFrom(HttpResponse response) = 0;

    [[nodiscard]] bool IsDone() const noexcept { return state_.done; }
    [[nodiscard]] std::chrono::milliseconds PollDelay() const noexcept { return state_.delay; }
    [[nodiscard]] const std::string& PollUrl() const noexcept { return state_.poll_url; }
    [[nodiscard]] const PollContext& Context() const noexcept { return context_; }

protected:
    PollStrategy(PollContext context, std::string poll_url, std::chrono::milliseconds delay);

    // Accept `in_progress` statuses plus the context's terminal statuses;
    // anything else is an ErrorCategory::PollRound error.
    [[nodiscard]] Result<void, Error> EnsureExpectedStatus(
        const HttpResponse& response, std::initializer_list<int> in_progress) const;

    // Adopt a Retry-After delta-seconds hint if present, else keep the
    // previous delay.
    void UpdateDelayFrom(const HttpResponse& response);

    void SetPollUrl(std::string url) { state_.poll_url = std::move(url); }
    void MarkDone() noexcept { state_.done = true; }

    [[nodiscard]] Error MakePollError(const std::string& message, ErrorCategory category,
                                      std::optional<int> http_status = std::nullopt) const;

private:
    PollContext context_;
    PollState state_;
};

using PollStrategyPtr = std::unique_ptr<PollStrategy>;

// Parse a Retry-After value given in delta-seconds. HTTP-dates and
// malformed values yield nullopt.
std::optional<std::chrono::milliseconds> ParseRetryAfter(std::string_view value);

} // namespace restcall
