#pragma once

#include <restcall/lro/poll_strategy.hpp>

#include <chrono>
#include <functional>
#include <vector>

namespace restcall {

// A pure function that either claims an LRO from the original request and
// its initial response, or declines by returning nullptr.
using PollStrategyFactory = std::function<PollStrategyPtr(
    const PollContext& context,
    const HttpRequest& original_request,
    const HttpResponse& initial_response,
    std::chrono::milliseconds delay)>;

// Try `factories` in order; the first non-null strategy wins. nullptr means
// no long-running operation was detected.
PollStrategyPtr SelectPollStrategy(const std::vector<PollStrategyFactory>& factories,
                                   const PollContext& context,
                                   const HttpRequest& original_request,
                                   const HttpResponse& initial_response,
                                   std::chrono::milliseconds delay);

// The built-in variants in priority order.
std::vector<PollStrategyFactory> DefaultPollStrategyFactories();

} // namespace restcall
